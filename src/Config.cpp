#include "Config.hpp"
#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <utility>

using namespace Monofs;

namespace
{
  template <typename T>
  T ParseNumber(const std::string &key, const std::string &value)
  {
    T result{};
    const char *first = value.data();
    const char *last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (value.empty() || ec != std::errc() || ptr != last)
      throw std::invalid_argument("Config: malformed value for " + key + ": '" + value + "'");

    return result;
  }
}

void Config::Set(const std::string &key, const std::string &value)
{
  if (key == "chunk-size")
  {
    auto size = ::ParseNumber<std::size_t>(key, value);
    if (size == 0)
      throw std::invalid_argument("Config: chunk-size must be positive");
    ChunkSize = size;
  }
  else if (key == "compression-level")
  {
    auto level = ::ParseNumber<int>(key, value);
    if (level < 1 || level > 22)
      throw std::invalid_argument("Config: compression-level must be within 1..22");
    CompressionLevel = level;
  }
  else if (key == "log-level")
  {
    LogLevel = Log::ParseLevel(value);
  }
  else
  {
    throw std::invalid_argument("Config: unknown option " + key);
  }
}

void Config::Validate() const
{
  if (ChunkSize == 0)
    throw std::invalid_argument("Config: chunk-size must be positive");
  if (CompressionLevel < 1 || CompressionLevel > 22)
    throw std::invalid_argument("Config: compression-level must be within 1..22");
}

Config Config::FromEnvironment()
{
  Config config;

  const std::pair<const char *, const char *> vars[] = {
      {"MONOFS_CHUNK_SIZE", "chunk-size"},
      {"MONOFS_COMPRESSION_LEVEL", "compression-level"},
      {"MONOFS_LOG_LEVEL", "log-level"},
  };

  for (const auto &[env, key] : vars)
  {
    if (const char *value = std::getenv(env))
      config.Set(key, value);
  }

  return config;
}
