#include "Block.hpp"
#include "../Errors.hpp"
#include <cstring>
#include <limits>
#include <unordered_set>

using namespace Monofs;

namespace
{
  constexpr char Magic0 = 'M';
  constexpr char Magic1 = 'F';
  constexpr size_t HeaderSize = 4;

  class Writer
  {
  public:
    explicit Writer(Bytes &out) : m_Out(out) {}

    void U8(std::uint8_t v) { m_Out.push_back(static_cast<char>(v)); }

    void U32(std::uint32_t v)
    {
      for (int shift = 24; shift >= 0; shift -= 8)
        U8(static_cast<std::uint8_t>(v >> shift));
    }

    void U64(std::uint64_t v)
    {
      for (int shift = 56; shift >= 0; shift -= 8)
        U8(static_cast<std::uint8_t>(v >> shift));
    }

    void I64(std::int64_t v) { U64(static_cast<std::uint64_t>(v)); }

    void Raw(const Cid &cid) { m_Out.append(reinterpret_cast<const char *>(cid.data()), cid.size()); }

    void String(std::string_view s)
    {
      if (s.size() > std::numeric_limits<std::uint32_t>::max())
        throw std::length_error("string too long for block encoding");
      U32(static_cast<std::uint32_t>(s.size()));
      m_Out.append(s.data(), s.size());
    }

    void Header(Block::BlockType type)
    {
      m_Out.push_back(Magic0);
      m_Out.push_back(Magic1);
      U8(Block::FormatVersion);
      U8(static_cast<std::uint8_t>(type));
    }

    void Count(size_t n)
    {
      if (n > std::numeric_limits<std::uint32_t>::max())
        throw std::length_error("too many items for block encoding");
      U32(static_cast<std::uint32_t>(n));
    }

  private:
    Bytes &m_Out;
  };

  class Reader
  {
  public:
    explicit Reader(std::string_view in) : m_In(in) {}

    [[nodiscard]] bool AtEnd() const noexcept { return m_Pos == m_In.size(); }

    std::uint8_t U8()
    {
      Need(1);
      return static_cast<std::uint8_t>(m_In[m_Pos++]);
    }

    std::uint32_t U32()
    {
      std::uint32_t v = 0;
      for (int i = 0; i < 4; i++)
        v = (v << 8) | U8();
      return v;
    }

    std::uint64_t U64()
    {
      std::uint64_t v = 0;
      for (int i = 0; i < 8; i++)
        v = (v << 8) | U8();
      return v;
    }

    std::int64_t I64() { return static_cast<std::int64_t>(U64()); }

    Cid Raw()
    {
      Cid cid{};
      Need(cid.size());
      std::memcpy(cid.data(), m_In.data() + m_Pos, cid.size());
      m_Pos += cid.size();
      return cid;
    }

    std::string String()
    {
      const std::uint32_t n = U32();
      Need(n);
      std::string s(m_In.substr(m_Pos, n));
      m_Pos += n;
      return s;
    }

    /// @brief Element count, bounded by the bytes left so a corrupt count cannot force a huge allocation.
    std::uint32_t Count(size_t minElementSize)
    {
      const std::uint32_t n = U32();
      if (static_cast<std::uint64_t>(n) * minElementSize > m_In.size() - m_Pos)
        throw DecodeError("truncated block: element count exceeds block size");
      return n;
    }

  private:
    void Need(size_t n) const
    {
      if (m_In.size() - m_Pos < n)
        throw DecodeError("truncated block");
    }

  private:
    std::string_view m_In;
    size_t m_Pos = 0;
  };

  EntityKind ReadKind(Reader &r)
  {
    const auto raw = r.U8();
    if (raw > static_cast<std::uint8_t>(EntityKind::SymLink))
      throw DecodeError("unknown entity kind " + std::to_string(raw));
    return static_cast<EntityKind>(raw);
  }

  void WriteMetadata(Writer &w, const Metadata &meta)
  {
    w.U8(static_cast<std::uint8_t>(meta.Kind));
    w.I64(meta.CreatedAt);
    w.I64(meta.ModifiedAt);
    w.U8(meta.PreviousVersion ? 1 : 0);
    if (meta.PreviousVersion)
      w.Raw(*meta.PreviousVersion);

    w.Count(meta.Attributes.size());
    for (const auto &[key, value] : meta.Attributes)
    {
      w.String(key);
      w.String(value);
    }
  }

  Metadata ReadMetadata(Reader &r, EntityKind expected)
  {
    Metadata meta;
    meta.Kind = ReadKind(r);
    if (meta.Kind != expected)
      throw DecodeError("metadata kind does not match block type");

    meta.CreatedAt = r.I64();
    meta.ModifiedAt = r.I64();

    const auto hasPrevious = r.U8();
    if (hasPrevious > 1)
      throw DecodeError("invalid previous-version flag");
    if (hasPrevious)
      meta.PreviousVersion = r.Raw();

    const auto count = r.Count(8);
    for (std::uint32_t i = 0; i < count; i++)
    {
      auto key = r.String();
      auto value = r.String();
      if (!meta.Attributes.empty() && !(meta.Attributes.rbegin()->first < key))
        throw DecodeError("attribute keys are not strictly ordered");

      meta.Attributes.emplace_hint(meta.Attributes.end(), std::move(key), std::move(value));
    }

    return meta;
  }

  Block::BlockType ReadHeader(Reader &r)
  {
    if (r.U8() != static_cast<std::uint8_t>(Magic0) || r.U8() != static_cast<std::uint8_t>(Magic1))
      throw DecodeError("bad block magic");

    const auto version = r.U8();
    if (version != Block::FormatVersion)
      throw DecodeError("unsupported block format version " + std::to_string(version));

    const auto type = r.U8();
    if (type > static_cast<std::uint8_t>(Block::BlockType::SymLink))
      throw DecodeError("unknown block type " + std::to_string(type));

    return static_cast<Block::BlockType>(type);
  }
}

Bytes Monofs::Block::ToBlock(const FileNode &node)
{
  if (node.Meta.Kind != EntityKind::File)
    throw std::invalid_argument("ToBlock: file node with non-file metadata");

  Bytes out;
  out.reserve(64 + node.Chunks.size() * std::tuple_size_v<Cid>);
  Writer w(out);
  w.Header(BlockType::File);
  ::WriteMetadata(w, node.Meta);
  w.U64(node.Size);
  w.Count(node.Chunks.size());
  for (const auto &cid : node.Chunks)
    w.Raw(cid);

  return out;
}

Bytes Monofs::Block::ToBlock(const DirNode &node)
{
  if (node.Meta.Kind != EntityKind::Directory)
    throw std::invalid_argument("ToBlock: directory node with non-directory metadata");

  Bytes out;
  Writer w(out);
  w.Header(BlockType::Directory);
  ::WriteMetadata(w, node.Meta);
  w.Count(node.Entries.size());
  for (const auto &entry : node.Entries)
  {
    w.String(entry.Name);
    w.U8(static_cast<std::uint8_t>(entry.Kind));
    w.Raw(entry.Target);
  }

  return out;
}

Bytes Monofs::Block::ToBlock(const SymLinkNode &node)
{
  if (node.Meta.Kind != EntityKind::SymLink)
    throw std::invalid_argument("ToBlock: symlink node with non-symlink metadata");
  if (node.Target.empty())
    throw std::invalid_argument("ToBlock: symlink without a target");

  Bytes out;
  Writer w(out);
  w.Header(BlockType::SymLink);
  ::WriteMetadata(w, node.Meta);
  w.String(node.Target);

  return out;
}

Bytes Monofs::Block::ToBlock(const Node &node)
{
  return std::visit([](const auto &n)
                    { return ToBlock(n); },
                    node);
}

Node Monofs::Block::FromBlock(std::string_view block)
{
  Reader r(block);
  const auto type = ::ReadHeader(r);

  Node result;
  switch (type)
  {
  case BlockType::Chunk:
    throw DecodeError("chunk block is not an entity");

  case BlockType::File:
  {
    FileNode node;
    node.Meta = ::ReadMetadata(r, EntityKind::File);
    node.Size = r.U64();
    const auto count = r.Count(std::tuple_size_v<Cid>);
    node.Chunks.reserve(count);
    for (std::uint32_t i = 0; i < count; i++)
      node.Chunks.push_back(r.Raw());

    if ((node.Size == 0) != node.Chunks.empty())
      throw DecodeError("file size does not match chunk list");

    result = std::move(node);
    break;
  }

  case BlockType::Directory:
  {
    DirNode node;
    node.Meta = ::ReadMetadata(r, EntityKind::Directory);
    const auto count = r.Count(4 + 1 + std::tuple_size_v<Cid>);
    node.Entries.reserve(count);
    std::unordered_set<std::string> names;
    for (std::uint32_t i = 0; i < count; i++)
    {
      DirEntry entry;
      entry.Name = r.String();
      entry.Kind = ::ReadKind(r);
      entry.Target = r.Raw();
      if (!names.insert(entry.Name).second)
        throw DecodeError("duplicate directory entry '" + entry.Name + "'");

      node.Entries.push_back(std::move(entry));
    }

    result = std::move(node);
    break;
  }

  case BlockType::SymLink:
  {
    SymLinkNode node;
    node.Meta = ::ReadMetadata(r, EntityKind::SymLink);
    node.Target = r.String();
    if (node.Target.empty())
      throw DecodeError("symlink without a target");

    result = std::move(node);
    break;
  }
  }

  if (!r.AtEnd())
    throw DecodeError("trailing bytes after block payload");

  return result;
}

Bytes Monofs::Block::ToChunkBlock(std::string_view content)
{
  Bytes out;
  out.reserve(HeaderSize + content.size());
  Writer w(out);
  w.Header(BlockType::Chunk);
  out.append(content.data(), content.size());
  return out;
}

std::string_view Monofs::Block::FromChunkBlock(std::string_view block)
{
  if (PeekType(block) != BlockType::Chunk)
    throw DecodeError("expected a chunk block");

  return block.substr(HeaderSize);
}

Block::BlockType Monofs::Block::PeekType(std::string_view block)
{
  Reader r(block);
  return ::ReadHeader(r);
}
