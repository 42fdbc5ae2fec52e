#pragma once
#include "Entity.hpp"
#include <string>
#include <vector>

namespace Monofs
{
  /// @brief One listed directory entry.
  struct EntryRef
  {
    std::string Name;
    EntityKind Kind{EntityKind::File};
    /// @brief CID of the child's last persisted version; none for a child that was never checkpointed.
    std::optional<Cid> Target;
    /// @brief True when the child holds changes its Target does not reflect.
    bool Dirty{false};
  };

  /// @brief Ordered mapping from unique names to child entities.
  ///
  /// Children are referenced by CID and loaded on first access. Entries keep insertion order;
  /// listing is never sorted. Modifying a loaded child makes this directory dirty too, because
  /// its block embeds the child's CID.
  class Dir final : public Entity
  {
  public:
    [[nodiscard]] static std::unique_ptr<Dir> New(const std::shared_ptr<Store> &store);

    /// @throws NotADirectoryError when @p cid is a file.
    [[nodiscard]] static std::unique_ptr<Dir> Load(const Cid &cid, const std::shared_ptr<Store> &store);

  public:
    /// @throws AlreadyExistsError, InvalidPathError
    File &CreateFile(const std::string &name);

    /// @throws AlreadyExistsError, InvalidPathError
    Dir &CreateDir(const std::string &name);

    /// @brief Create a symlink to @p target. The target is not checked for existence.
    /// @throws AlreadyExistsError, InvalidPathError
    SymLink &CreateSymLink(const std::string &name, const std::string &target);

    /// @brief Insert an existing entity under @p name.
    /// @throws AlreadyExistsError, InvalidPathError
    Entity &Put(const std::string &name, std::unique_ptr<Entity> entity);

    /// @throws NotFoundError
    /// @throws StreamBusyError when @p name is a file with an open output stream.
    void Remove(const std::string &name);

    /// @brief Rename in place; the entry keeps its listing position.
    /// @throws NotFoundError, AlreadyExistsError, InvalidPathError
    void Rename(const std::string &from, const std::string &to);

    /// @brief Child entity, loaded from the store on first access.
    /// @throws NotFoundError, DecodeError, StoreUnavailableError
    [[nodiscard]] Entity &Get(const std::string &name);
    [[nodiscard]] File &GetFile(const std::string &name);
    [[nodiscard]] Dir &GetDir(const std::string &name);
    [[nodiscard]] SymLink &GetSymLink(const std::string &name);

    [[nodiscard]] bool Contains(const std::string &name) const noexcept;
    [[nodiscard]] std::vector<EntryRef> GetEntries() const;

    [[nodiscard]] inline std::size_t Size() const noexcept
    {
      return m_Entries.size();
    }

    [[nodiscard]] bool IsDirty() const override;

    /// @brief Checkpoint dirty children first, then this directory.
    Cid Checkpoint() override;

    [[nodiscard]] Node ToNode() const override;

  private:
    friend class Entity;

    struct Child
    {
      std::string Name;
      EntityKind Kind;
      std::optional<Cid> Target;
      std::unique_ptr<Entity> Loaded;

      [[nodiscard]] bool Dirty() const
      {
        return Loaded && (Loaded->IsDirty() || Loaded->GetCid() != Target);
      }
    };

    Dir(const std::shared_ptr<Store> &store, Metadata metadata, std::optional<Cid> cid);

    [[nodiscard]] static std::unique_ptr<Dir> Restore(DirNode node, const Cid &cid, const std::shared_ptr<Store> &store);

    [[nodiscard]] Child *Find(const std::string &name) noexcept;
    [[nodiscard]] const Child *Find(const std::string &name) const noexcept;

    Entity &Insert(const std::string &name, std::unique_ptr<Entity> entity);

  private:
    std::vector<Child> m_Entries;
  };
}
