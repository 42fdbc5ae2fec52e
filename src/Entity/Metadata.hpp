#pragma once
#include "../Types.hpp"
#include <map>
#include <optional>
#include <string>

namespace Monofs
{
  /// @brief Current wall-clock time in milliseconds since the Unix epoch.
  [[nodiscard]] Timestamp Now();

  /// @brief Metadata carried by every entity version.
  ///
  /// A persisted Metadata is never changed in place: checkpoint builds the next version's
  /// record from the in-memory copy.
  struct Metadata
  {
    EntityKind Kind{EntityKind::File};
    Timestamp CreatedAt{0};
    /// @brief Non-decreasing across versions of the same logical entity.
    Timestamp ModifiedAt{0};
    /// @brief CID of the version this one was checkpointed from.
    std::optional<Cid> PreviousVersion;
    /// @brief Extended attributes. Ordered so that encoding is canonical.
    std::map<std::string, std::string> Attributes;

    [[nodiscard]] static Metadata Create(EntityKind kind);

    bool operator==(const Metadata &) const = default;
  };
}
