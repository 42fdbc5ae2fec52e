#include <gtest/gtest.h>

#include "../Config.hpp"

#include <cstdlib>

using namespace Monofs;

namespace
{
  struct ScopedEnv
  {
    const char *Name;
    ScopedEnv(const char *name, const char *value) : Name(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(Name); }
  };
}

TEST(Config, Defaults)
{
  Config config;
  EXPECT_EQ(config.ChunkSize, 256u * 1024u);
  EXPECT_EQ(config.CompressionLevel, 3);
  EXPECT_EQ(config.LogLevel, Log::Level::Error);
}

TEST(Config, Set_ParsesKnownKeys)
{
  Config config;
  config.Set("chunk-size", "4096");
  config.Set("compression-level", "19");
  config.Set("log-level", "debug");

  EXPECT_EQ(config.ChunkSize, 4096u);
  EXPECT_EQ(config.CompressionLevel, 19);
  EXPECT_EQ(config.LogLevel, Log::Level::Debug);
}

TEST(Config, Set_RejectsBadValues)
{
  Config config;
  EXPECT_THROW(config.Set("chunk-size", "0"), std::invalid_argument);
  EXPECT_THROW(config.Set("chunk-size", "12kb"), std::invalid_argument);
  EXPECT_THROW(config.Set("chunk-size", ""), std::invalid_argument);
  EXPECT_THROW(config.Set("compression-level", "23"), std::invalid_argument);
  EXPECT_THROW(config.Set("log-level", "verbose"), std::invalid_argument);
  EXPECT_THROW(config.Set("colour", "blue"), std::invalid_argument);

  EXPECT_EQ(config.ChunkSize, Config::DefaultChunkSize);
}

TEST(Config, Validate_ChecksDirectAssignments)
{
  Config config;
  EXPECT_NO_THROW(config.Validate());

  config.ChunkSize = 0;
  EXPECT_THROW(config.Validate(), std::invalid_argument);

  config.ChunkSize = 1;
  config.CompressionLevel = 23;
  EXPECT_THROW(config.Validate(), std::invalid_argument);
}

TEST(Config, FromEnvironment)
{
  ScopedEnv chunk("MONOFS_CHUNK_SIZE", "1024");
  ScopedEnv level("MONOFS_LOG_LEVEL", "info");

  const auto config = Config::FromEnvironment();
  EXPECT_EQ(config.ChunkSize, 1024u);
  EXPECT_EQ(config.LogLevel, Log::Level::Info);
  EXPECT_EQ(config.CompressionLevel, Config::DefaultCompressionLevel);
}

TEST(Config, FromEnvironment_MalformedValue)
{
  ScopedEnv level("MONOFS_COMPRESSION_LEVEL", "fast");
  EXPECT_THROW((void)Config::FromEnvironment(), std::invalid_argument);
}
