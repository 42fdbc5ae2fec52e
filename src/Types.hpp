#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace Monofs
{
  /// @brief Content identifier: SHA256 digest of a block's canonical bytes.
  using Cid = std::array<uint8_t, 32>;

  /// @brief Raw byte buffer. Blocks, chunks and stream data all travel as Bytes.
  using Bytes = std::string;

  /// @brief Milliseconds since the Unix epoch.
  using Timestamp = std::int64_t;

  /// @brief Type of database IDs.
  using ID = std::int64_t;

  /// @brief The entity variants.
  enum class EntityKind : std::uint8_t
  {
    File = 0,
    Directory = 1,
    SymLink = 2
  };

  [[nodiscard]] inline const char *ToString(EntityKind kind) noexcept
  {
    switch (kind)
    {
    case EntityKind::File:
      return "file";
    case EntityKind::Directory:
      return "directory";
    case EntityKind::SymLink:
      return "symlink";
    }
    return "unknown";
  }
};
