#include <gtest/gtest.h>
#include "TestUtils.hpp"

#include "../CAS/CAS.hpp"
#include "../Errors.hpp"

#include <cctype>

using namespace Monofs;

// ------------- Tests -----------------

TEST(CAS, Identify_SameContentSameHash)
{
  auto data = RandomBytes(1024 * 32);

  auto h1 = CAS::Identify(data);
  auto h2 = CAS::Identify(std::string(data));
  EXPECT_EQ(h1, h2);
  EXPECT_EQ(CAS::ToHexString(h1).size(), 64u); // sha256 hex
}

TEST(CAS, Identify_DifferentContentDifferentHash)
{
  EXPECT_NE(CAS::Identify("hello"), CAS::Identify("hello world"));
}

TEST(CAS, Identify_KnownDigests)
{
  EXPECT_EQ(CAS::ToHexString(CAS::Identify("")),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(CAS::ToHexString(CAS::Identify("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CAS, Hasher_MatchesOneShotIdentify)
{
  auto data = RandomBytes(100000);

  CAS::Hasher hasher;
  for (size_t pos = 0; pos < data.size(); pos += 4096)
    hasher.Update(std::string_view(data).substr(pos, 4096));

  EXPECT_EQ(hasher.Finish(), CAS::Identify(data));
  EXPECT_THROW(hasher.Update("more"), std::logic_error);
}

TEST(CAS, HexString_ParsesBack)
{
  auto id = CAS::Identify("round trip");
  auto hex = CAS::ToHexString(id);
  EXPECT_EQ(CAS::FromHexString(hex), id);

  std::string upper = hex;
  for (auto &c : upper)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  EXPECT_EQ(CAS::FromHexString(upper), id);
}

TEST(CAS, HexString_RejectsMalformed)
{
  EXPECT_THROW((void)CAS::FromHexString("abc"), DecodeError);
  EXPECT_THROW((void)CAS::FromHexString(std::string(64, 'g')), DecodeError);
}

TEST(CAS, Compress_Decompress_RecoversBytes)
{
  auto random = RandomBytes(1024 * 300);
  EXPECT_EQ(CAS::Decompress(CAS::Compress(random, 3)), random);

  std::string repetitive(1 << 20, 'x');
  auto frame = CAS::Compress(repetitive, 3);
  EXPECT_LT(frame.size(), repetitive.size() / 10);
  EXPECT_EQ(CAS::Decompress(frame), repetitive);

  EXPECT_EQ(CAS::Decompress(CAS::Compress("", 3)), "");
}

TEST(CAS, Decompress_TruncatedFrame_IsDecodeError)
{
  auto frame = CAS::Compress(RandomBytes(100000), 3);
  EXPECT_THROW((void)CAS::Decompress(frame.substr(0, frame.size() / 2)), DecodeError);
  EXPECT_THROW((void)CAS::Decompress(""), DecodeError);
}

TEST(CAS, Decompress_Garbage_IsDecodeError)
{
  EXPECT_THROW((void)CAS::Decompress("definitely not a zstd frame"), DecodeError);

  auto frame = CAS::Compress("payload", 3);
  EXPECT_THROW((void)CAS::Decompress(frame + "trailing"), DecodeError);
}
