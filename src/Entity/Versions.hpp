#pragma once
#include "Entity.hpp"
#include <memory>
#include <vector>

/// @brief Walking the backward-linked version chain formed by Metadata::PreviousVersion.
namespace Monofs::Versions
{
  /// @brief CIDs from @p cid back to the first version, newest first. Each version is loaded on the way.
  /// @throws NotFoundError when a linked version is missing from the store.
  [[nodiscard]] std::vector<Cid> History(const Cid &cid, const std::shared_ptr<Store> &store);

  /// @brief The entity @p steps versions before @p cid (0 returns @p cid itself).
  /// @throws NotFoundError when the chain is shorter than @p steps.
  [[nodiscard]] std::unique_ptr<Entity> LoadVersion(const Cid &cid, const std::shared_ptr<Store> &store, std::size_t steps);
}
