#pragma once
#include "../Types.hpp"
#include "DB_Schema.h"
#include <filesystem>
#include <memory>
#include <vector>

namespace Monofs::DB
{
  /// @brief SQLite bookkeeping of named roots: which root CID is current, and every earlier one.
  class Database
  {

  public:
    [[nodiscard]] static std::unique_ptr<Database> Open(const std::filesystem::path &databaseFile)
    {
      return std::unique_ptr<Database>(new Database(databaseFile));
    }

  public:
    ~Database();

    [[nodiscard]] inline const std::filesystem::path &DatabaseFile() const noexcept
    {
      return m_DatabaseFile;
    }

    std::shared_ptr<Root> RecordRoot(const std::string &name, const Cid &cid);

    /// @return nullptr when nothing was recorded under @p name yet.
    [[nodiscard]] std::shared_ptr<Root> LatestRoot(const std::string &name);

    /// @brief Every recorded root under @p name, newest first.
    [[nodiscard]] std::vector<std::shared_ptr<Root>> RootHistory(const std::string &name);

  private:
    Database(const std::filesystem::path &databaseFile);

    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;
    Database(Database &&) = delete;
    Database &operator=(Database &&) = delete;

    void ExecSQL(const char *sql);

    void OpenTransaction();
    void Commit();
    void Rollback();

    std::vector<std::shared_ptr<Root>> SelectRoots(const std::string &name, int limit);

  private:
    const std::filesystem::path m_DatabaseFile;
    struct Impl;
    std::unique_ptr<Impl> m_Database;
  };
}
