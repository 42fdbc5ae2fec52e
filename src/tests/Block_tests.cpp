#include <gtest/gtest.h>

#include "../CAS/CAS.hpp"
#include "../Entity/Block.hpp"
#include "../Errors.hpp"

#include <algorithm>

using namespace Monofs;

namespace
{
  Metadata FixedMetadata(EntityKind kind)
  {
    Metadata meta;
    meta.Kind = kind;
    meta.CreatedAt = 1000;
    meta.ModifiedAt = 2000;
    return meta;
  }

  FileNode SampleFile()
  {
    FileNode node;
    node.Meta = FixedMetadata(EntityKind::File);
    node.Meta.PreviousVersion = CAS::Identify("previous");
    node.Meta.Attributes = {{"mime", "text/plain"}, {"owner", "alice"}};
    node.Size = 10;
    node.Chunks = {CAS::Identify("chunk-0"), CAS::Identify("chunk-1")};
    return node;
  }

  DirNode SampleDir()
  {
    DirNode node;
    node.Meta = FixedMetadata(EntityKind::Directory);
    node.Entries = {
        {"zeta", EntityKind::File, CAS::Identify("z")},
        {"alpha", EntityKind::Directory, CAS::Identify("a")},
        {"mid", EntityKind::File, CAS::Identify("m")},
    };
    return node;
  }
}

TEST(Block, FileNode_EncodesAndDecodes)
{
  const auto node = SampleFile();
  const auto decoded = Block::FromBlock(Block::ToBlock(node));

  ASSERT_TRUE(std::holds_alternative<FileNode>(decoded));
  EXPECT_EQ(std::get<FileNode>(decoded), node);
}

TEST(Block, DirNode_KeepsEntryOrder)
{
  const auto node = SampleDir();
  const auto decoded = Block::FromBlock(Block::ToBlock(node));

  ASSERT_TRUE(std::holds_alternative<DirNode>(decoded));
  const auto &dir = std::get<DirNode>(decoded);
  ASSERT_EQ(dir.Entries.size(), 3u);
  EXPECT_EQ(dir.Entries[0].Name, "zeta");
  EXPECT_EQ(dir.Entries[1].Name, "alpha");
  EXPECT_EQ(dir.Entries[1].Kind, EntityKind::Directory);
  EXPECT_EQ(dir.Entries[2].Name, "mid");
  EXPECT_EQ(dir, node);
}

TEST(Block, SymLinkNode_EncodesAndDecodes)
{
  SymLinkNode node;
  node.Meta = FixedMetadata(EntityKind::SymLink);
  node.Target = "docs/readme";

  const auto block = Block::ToBlock(node);
  EXPECT_EQ(Block::PeekType(block), Block::BlockType::SymLink);

  const auto decoded = Block::FromBlock(block);
  ASSERT_TRUE(std::holds_alternative<SymLinkNode>(decoded));
  EXPECT_EQ(std::get<SymLinkNode>(decoded), node);
}

TEST(Block, SymLinkWithoutTarget_IsRejected)
{
  SymLinkNode node;
  node.Meta = FixedMetadata(EntityKind::SymLink);
  EXPECT_THROW((void)Block::ToBlock(node), std::invalid_argument);

  node.Target = "x";
  auto block = Block::ToBlock(node);
  // Shrink the target to zero length: drop its byte and zero the length prefix.
  block.pop_back();
  block[block.size() - 1] = '\0';
  EXPECT_THROW((void)Block::FromBlock(block), DecodeError);
}

TEST(Block, Encoding_IsDeterministic)
{
  EXPECT_EQ(Block::ToBlock(SampleFile()), Block::ToBlock(SampleFile()));
  EXPECT_EQ(CAS::Identify(Block::ToBlock(SampleDir())), CAS::Identify(Block::ToBlock(SampleDir())));

  // Attribute insertion order does not leak into the encoding.
  auto a = SampleFile();
  a.Meta.Attributes.clear();
  a.Meta.Attributes.emplace("b", "2");
  a.Meta.Attributes.emplace("a", "1");
  auto b = SampleFile();
  b.Meta.Attributes.clear();
  b.Meta.Attributes.emplace("a", "1");
  b.Meta.Attributes.emplace("b", "2");
  EXPECT_EQ(Block::ToBlock(a), Block::ToBlock(b));
}

TEST(Block, EmptyFile_Layout)
{
  FileNode node;
  node.Meta = FixedMetadata(EntityKind::File);
  const auto block = Block::ToBlock(node);

  // header(4) + kind(1) + created(8) + modified(8) + has_prev(1) + attrs(4) + size(8) + count(4)
  ASSERT_EQ(block.size(), 38u);
  EXPECT_EQ(block.substr(0, 4), std::string("MF\x01\x01", 4));
  EXPECT_EQ(block[4], '\0');
  // created_at = 1000 big-endian
  EXPECT_EQ(static_cast<unsigned char>(block[11]), 0x03);
  EXPECT_EQ(static_cast<unsigned char>(block[12]), 0xE8);
  EXPECT_EQ(Block::PeekType(block), Block::BlockType::File);
}

TEST(Block, MetadataChanges_ChangeTheCid)
{
  auto base = SampleFile();
  auto touched = base;
  touched.Meta.ModifiedAt++;
  auto relinked = base;
  relinked.Meta.PreviousVersion.reset();

  const auto cid = CAS::Identify(Block::ToBlock(base));
  EXPECT_NE(cid, CAS::Identify(Block::ToBlock(touched)));
  EXPECT_NE(cid, CAS::Identify(Block::ToBlock(relinked)));
}

TEST(Block, ChunkBlock_WrapsRawContent)
{
  const auto block = Block::ToChunkBlock("payload");
  EXPECT_EQ(block.size(), 4u + 7u);
  EXPECT_EQ(Block::PeekType(block), Block::BlockType::Chunk);
  EXPECT_EQ(Block::FromChunkBlock(block), "payload");

  EXPECT_THROW((void)Block::FromBlock(block), DecodeError);
  EXPECT_THROW((void)Block::FromChunkBlock(Block::ToBlock(SampleFile())), DecodeError);
}

TEST(Block, Truncated_IsDecodeError)
{
  const auto block = Block::ToBlock(SampleDir());
  for (size_t len : {size_t(0), size_t(2), size_t(4), size_t(20), block.size() - 1})
    EXPECT_THROW((void)Block::FromBlock(std::string_view(block).substr(0, len)), DecodeError) << "length " << len;
}

TEST(Block, BadHeader_IsDecodeError)
{
  const auto block = Block::ToBlock(SampleFile());

  auto badMagic = block;
  badMagic[0] = 'X';
  EXPECT_THROW((void)Block::FromBlock(badMagic), DecodeError);

  auto badVersion = block;
  badVersion[2] = 2;
  EXPECT_THROW((void)Block::FromBlock(badVersion), DecodeError);

  auto badType = block;
  badType[3] = 7;
  EXPECT_THROW((void)Block::FromBlock(badType), DecodeError);
}

TEST(Block, TrailingBytes_AreDecodeError)
{
  EXPECT_THROW((void)Block::FromBlock(Block::ToBlock(SampleFile()) + "x"), DecodeError);
}

TEST(Block, KindMismatch_IsDecodeError)
{
  auto block = Block::ToBlock(SampleFile());
  block[4] = static_cast<char>(EntityKind::Directory);
  EXPECT_THROW((void)Block::FromBlock(block), DecodeError);
}

TEST(Block, DuplicateEntryNames_AreDecodeError)
{
  auto node = SampleDir();
  node.Entries.push_back({"zeta", EntityKind::File, CAS::Identify("other")});
  EXPECT_THROW((void)Block::FromBlock(Block::ToBlock(node)), DecodeError);
}

TEST(Block, UnorderedAttributes_AreDecodeError)
{
  FileNode node;
  node.Meta = FixedMetadata(EntityKind::File);
  node.Meta.Attributes = {{"a", "x"}, {"b", "y"}};
  auto block = Block::ToBlock(node);

  // Swap the single-letter keys in place so the pair order is no longer canonical.
  const auto posA = block.find('a', 4);
  const auto posB = block.find('b', 4);
  ASSERT_NE(posA, std::string::npos);
  ASSERT_NE(posB, std::string::npos);
  std::swap(block[posA], block[posB]);

  EXPECT_THROW((void)Block::FromBlock(block), DecodeError);
}

TEST(Block, SizeWithoutChunks_IsDecodeError)
{
  FileNode node;
  node.Meta = FixedMetadata(EntityKind::File);
  node.Size = 5;
  EXPECT_THROW((void)Block::FromBlock(Block::ToBlock(node)), DecodeError);
}

TEST(Block, HugeElementCount_IsDecodeError)
{
  FileNode node;
  node.Meta = FixedMetadata(EntityKind::File);
  auto block = Block::ToBlock(node);

  // Last four bytes are the chunk count.
  for (size_t i = block.size() - 4; i < block.size(); ++i)
    block[i] = '\xFF';
  EXPECT_THROW((void)Block::FromBlock(block), DecodeError);
}

TEST(Block, MismatchedNodeMetadata_IsRejectedOnEncode)
{
  FileNode node;
  node.Meta.Kind = EntityKind::Directory;
  EXPECT_THROW((void)Block::ToBlock(node), std::invalid_argument);
}
