#pragma once
#include "DB/Database.hpp"
#include "Entity/Dir.hpp"
#include "Store/FileStore.hpp"
#include <filesystem>
#include <optional>

namespace Monofs
{
  /// @brief Archive of versioned snapshots of one local folder.
  ///
  /// Blocks live in a FileStore under the archive root; the history of root CIDs is kept in
  /// <archive>/content.db.
  class Vault
  {
  public:
    Vault(const std::filesystem::path &archive, const Config &config = {});

    /// @brief Import @p localFolder as the next version of the root.
    /// @return CID of the root after the import. Unchanged trees return the current CID.
    Cid Push(const std::filesystem::path &localFolder);

    /// @brief Write a root version (the latest by default) into @p localFolder.
    /// @throws NotFoundError when nothing was pushed yet.
    void Pop(const std::filesystem::path &localFolder, const std::optional<Cid> &version = std::nullopt);

    /// @brief Recorded root versions, newest first.
    [[nodiscard]] std::vector<std::shared_ptr<DB::Root>> History();

    [[nodiscard]] inline const std::shared_ptr<FileStore> &GetStore() const noexcept
    {
      return m_Store;
    }

  private:
    void Import(Dir &dir, const std::filesystem::path &localFolder);
    void ImportFile(Dir &dir, const std::string &name, const std::filesystem::path &localFile);
    void Materialize(Dir &dir, const std::filesystem::path &localFolder);

  private:
    static constexpr const char *RootName = "ROOT";

    const std::filesystem::path m_ArchiveRoot;
    std::shared_ptr<FileStore> m_Store;
    std::unique_ptr<DB::Database> m_Database;
  };
}
