#pragma once
#include "Entity.hpp"
#include <string>

namespace Monofs
{
  /// @brief Symbolic link to another entity, stored as a path.
  ///
  /// The target is kept verbatim and only interpreted when a path walk follows the link:
  /// it is then resolved from the root directory of that walk. A link whose target does
  /// not exist is stored as is and reported as NotFound when followed.
  class SymLink final : public Entity
  {
  public:
    /// @throws InvalidPathError when @p target is empty.
    [[nodiscard]] static std::unique_ptr<SymLink> New(const std::shared_ptr<Store> &store, const std::string &target);

    /// @throws NotASymLinkError when @p cid is not a symlink.
    [[nodiscard]] static std::unique_ptr<SymLink> Load(const Cid &cid, const std::shared_ptr<Store> &store);

  public:
    [[nodiscard]] inline const std::string &GetTarget() const noexcept
    {
      return m_Target;
    }

    /// @throws InvalidPathError when @p target is empty.
    void SetTarget(const std::string &target);

    [[nodiscard]] bool IsDirty() const override;
    Cid Checkpoint() override;
    [[nodiscard]] Node ToNode() const override;

  private:
    friend class Entity;

    SymLink(const std::shared_ptr<Store> &store, Metadata metadata, std::optional<Cid> cid, std::string target);

    [[nodiscard]] static std::unique_ptr<SymLink> Restore(SymLinkNode node, const Cid &cid, const std::shared_ptr<Store> &store);

  private:
    std::string m_Target;
  };
}
