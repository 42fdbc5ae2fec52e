#pragma once
#include "../Store/Store.hpp"
#include "Block.hpp"
#include <memory>
#include <optional>

namespace Monofs
{
  class File;
  class Dir;
  class SymLink;

  /// @brief Capability set shared by File, Dir and SymLink: metadata access, dirtiness and checkpoint.
  ///
  /// State machine: Clean (matches GetCid(), nothing pending) -> Dirty (buffered mutation)
  /// -> Checkpoint -> Clean with a new CID. Checkpoint is the only operation that writes
  /// to the store; everything else stays in memory until then.
  class Entity
  {
  public:
    virtual ~Entity() = default;

    Entity(const Entity &) = delete;
    Entity &operator=(const Entity &) = delete;
    Entity(Entity &&) = delete;
    Entity &operator=(Entity &&) = delete;

    /// @brief Load whichever entity is stored under @p cid.
    /// @throws NotFoundError, DecodeError, StoreUnavailableError
    [[nodiscard]] static std::unique_ptr<Entity> Load(const Cid &cid, const std::shared_ptr<Store> &store);

  public:
    [[nodiscard]] inline EntityKind Kind() const noexcept
    {
      return m_Metadata.Kind;
    }

    [[nodiscard]] inline const Metadata &GetMetadata() const noexcept
    {
      return m_Metadata;
    }

    /// @brief CID of the last checkpointed version, none if never persisted.
    [[nodiscard]] inline const std::optional<Cid> &GetCid() const noexcept
    {
      return m_Cid;
    }

    [[nodiscard]] inline const std::shared_ptr<Store> &GetStore() const noexcept
    {
      return m_Store;
    }

    [[nodiscard]] virtual bool IsDirty() const = 0;

    /// @brief Persist pending mutations and return the new CID.
    ///
    /// With nothing pending, returns the existing CID without touching the store. On failure
    /// the entity keeps its pending state and may be checkpointed again.
    virtual Cid Checkpoint() = 0;

    /// @brief Node of the last checkpointed version.
    /// @throws std::logic_error when the entity has unpersisted changes.
    [[nodiscard]] virtual Node ToNode() const = 0;

    /// @brief Canonical block of the last checkpointed version.
    [[nodiscard]] Bytes ToBlock() const
    {
      return Block::ToBlock(ToNode());
    }

    void SetAttribute(const std::string &key, const std::string &value);
    [[nodiscard]] std::optional<std::string> GetAttribute(const std::string &key) const;
    bool RemoveAttribute(const std::string &key);

    [[nodiscard]] File &AsFile();
    [[nodiscard]] const File &AsFile() const;
    [[nodiscard]] Dir &AsDir();
    [[nodiscard]] const Dir &AsDir() const;
    [[nodiscard]] SymLink &AsSymLink();
    [[nodiscard]] const SymLink &AsSymLink() const;

  protected:
    Entity(std::shared_ptr<Store> store, Metadata metadata, std::optional<Cid> cid);

    /// @brief Metadata for the version about to be checkpointed.
    [[nodiscard]] Metadata NextMetadata() const;

    /// @brief Record a successful checkpoint.
    void Committed(const Cid &cid, Metadata metadata);

    void MarkDirty() noexcept
    {
      m_Dirty = true;
    }

    [[nodiscard]] bool OwnDirty() const noexcept
    {
      return m_Dirty;
    }

  private:
    std::shared_ptr<Store> m_Store;
    Metadata m_Metadata;
    std::optional<Cid> m_Cid;
    bool m_Dirty;
  };
}
