#pragma once
#include "Metadata.hpp"
#include <string_view>
#include <variant>
#include <vector>

namespace Monofs
{
  /// @brief Persisted form of a file version: metadata plus ordered content-chunk CIDs.
  struct FileNode
  {
    Metadata Meta{EntityKind::File};
    std::uint64_t Size{0};
    std::vector<Cid> Chunks;

    bool operator==(const FileNode &) const = default;
  };

  /// @brief One (name, child CID, child kind) triple of a directory version.
  struct DirEntry
  {
    std::string Name;
    EntityKind Kind{EntityKind::File};
    Cid Target{};

    bool operator==(const DirEntry &) const = default;
  };

  /// @brief Persisted form of a directory version. Entries keep insertion order.
  struct DirNode
  {
    Metadata Meta{EntityKind::Directory};
    std::vector<DirEntry> Entries;

    bool operator==(const DirNode &) const = default;
  };

  /// @brief A symbolic link: a path resolved against the tree root when followed.
  struct SymLinkNode
  {
    Metadata Meta{EntityKind::SymLink};
    std::string Target;

    bool operator==(const SymLinkNode &) const = default;
  };

  using Node = std::variant<FileNode, DirNode, SymLinkNode>;
}

/// @brief Canonical block encoding shared by hashing and storage.
///
/// Layout: 'M' 'F' <version> <type>, then the payload. Integers are fixed-width big-endian,
/// strings and byte runs are u32 length-prefixed, CIDs are 32 raw bytes.
///
///   Metadata  := kind:u8 created:i64 modified:i64 has_prev:u8 [prev:cid] n:u32 (key value)*n
///   File      := header Metadata size:u64 n:u32 cid*n
///   Directory := header Metadata n:u32 (name kind:u8 cid)*n
///   Chunk     := header raw-bytes
namespace Monofs::Block
{
  constexpr std::uint8_t FormatVersion = 1;

  enum class BlockType : std::uint8_t
  {
    Chunk = 0,
    File = 1,
    Directory = 2,
    SymLink = 3
  };

  [[nodiscard]] inline const Metadata &GetMetadata(const Node &node) noexcept
  {
    return std::visit([](const auto &n) -> const Metadata &
                      { return n.Meta; },
                      node);
  }

  [[nodiscard]] Bytes ToBlock(const FileNode &node);
  [[nodiscard]] Bytes ToBlock(const DirNode &node);
  [[nodiscard]] Bytes ToBlock(const SymLinkNode &node);
  [[nodiscard]] Bytes ToBlock(const Node &node);

  /// @brief Decode a File or Directory block.
  /// @throws DecodeError on malformed, truncated or version-incompatible blocks, and on chunk blocks.
  [[nodiscard]] Node FromBlock(std::string_view block);

  /// @brief Wrap raw file content into a chunk block.
  [[nodiscard]] Bytes ToChunkBlock(std::string_view content);

  /// @brief Content of a chunk block.
  /// @throws DecodeError when @p block is not a chunk block.
  [[nodiscard]] std::string_view FromChunkBlock(std::string_view block);

  /// @brief Validate the header and report the block type.
  /// @throws DecodeError on a bad header.
  [[nodiscard]] BlockType PeekType(std::string_view block);
}
