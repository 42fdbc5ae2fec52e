#include "Database.hpp"
#include "../CAS/CAS.hpp"
#include "../Entity/Metadata.hpp"
#include "../Log.hpp"
#include <cstring>
#include <sqlite3.h>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace Monofs;
using namespace Monofs::DB;

struct Database::Impl
{
  sqlite3 *m_db = nullptr;

  explicit Impl(sqlite3 *db)
      : m_db(std::move(db))
  {
  }

  ~Impl()
  {
    if (m_db)
      sqlite3_close(m_db);
    m_db = nullptr;
  }
};

namespace
{
  /// @brief Prepared statement finalized on scope exit.
  class Statement
  {
  public:
    Statement(sqlite3 *db, const char *sql, const char *what)
    {
      if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("prepare ") + what + " failed: " + sqlite3_errmsg(db));
    }

    ~Statement()
    {
      sqlite3_finalize(m_stmt);
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    operator sqlite3_stmt *() const noexcept
    {
      return m_stmt;
    }

  private:
    sqlite3_stmt *m_stmt = nullptr;
  };

  Cid ReadBlobColumnAsIdentity(sqlite3_stmt *stmt, int col)
  {
    Cid result{};

    const void *blob = sqlite3_column_blob(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);

    if (!blob)
      throw std::runtime_error("NULL BLOB column");

    if (size != static_cast<int>(std::tuple_size_v<Cid>))
      throw std::runtime_error("Unexpected blob size: " + std::to_string(size));

    std::memcpy(result.data(), blob, std::tuple_size_v<Cid>);
    return result;
  }
}

Database::Database(const fs::path &databaseFile)
    : m_DatabaseFile(databaseFile)
{

  if (!m_DatabaseFile.parent_path().empty())
    fs::create_directories(m_DatabaseFile.parent_path());

  sqlite3 *poDatabase = nullptr;
  if (sqlite3_open(m_DatabaseFile.string().c_str(), &poDatabase) == SQLITE_OK && poDatabase)
  {
    m_Database = std::make_unique<Impl>(poDatabase);
  }
  else
  {
    std::string msg = "SQLite open failed";
    if (poDatabase)
    {
      msg += std::string(": ") + sqlite3_errmsg(poDatabase);
      sqlite3_close(poDatabase);
      poDatabase = nullptr;
    }

    throw std::runtime_error(msg);
  }

  ExecSQL("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL; PRAGMA foreign_keys = ON;");
  ExecSQL(DB_SCHEMA);

  Log::Info("Database", m_DatabaseFile.string());
}

Database::~Database() = default;

void Database::ExecSQL(const char *sql)
{
  char *err = nullptr;
  if (sqlite3_exec(m_Database->m_db, sql, nullptr, nullptr, &err) != SQLITE_OK)
  {
    std::string msg = err ? err : "unknown sql error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

void Database::OpenTransaction()
{
  char *err = nullptr;
  if (sqlite3_exec(m_Database->m_db, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK)
  {
    std::string msg = err ? err : "unknown";
    sqlite3_free(err);
    throw std::runtime_error("BEGIN failed: " + msg);
  }
}

void Database::Commit()
{
  char *err = nullptr;
  if (sqlite3_exec(m_Database->m_db, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK)
  {
    std::string msg = err ? err : "unknown";
    sqlite3_free(err);
    throw std::runtime_error("COMMIT failed: " + msg);
  }
}

void Database::Rollback()
{
  sqlite3_exec(m_Database->m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
}

std::shared_ptr<Root> Database::RecordRoot(const std::string &name, const Cid &cid)
{
  OpenTransaction();
  try
  {
    const char *kInsRoot =
        "INSERT INTO roots(name, cid, created_at) VALUES(?1, ?2, ?3);";

    Statement insRoot(m_Database->m_db, kInsRoot, "kInsRoot");

    const Timestamp createdAt = Now();

    sqlite3_bind_text(insRoot, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(insRoot, 2, cid.data(), static_cast<int>(std::tuple_size_v<Cid>), SQLITE_TRANSIENT);
    sqlite3_bind_int64(insRoot, 3, createdAt);

    if (sqlite3_step(insRoot) != SQLITE_DONE)
      throw std::runtime_error(std::string("roots insert failed: ") + sqlite3_errmsg(m_Database->m_db));

    auto res = std::make_shared<Root>(
        static_cast<ID>(sqlite3_last_insert_rowid(m_Database->m_db)),
        name,
        cid,
        createdAt);

    Commit();

    Log::Info("Database", "root '" + name + "' -> " + CAS::ToHexString(cid));
    return res;
  }
  catch (...)
  {
    Rollback();
    throw;
  }
}

std::shared_ptr<Root> Database::LatestRoot(const std::string &name)
{
  auto roots = SelectRoots(name, 1);
  return roots.empty() ? nullptr : roots.front();
}

std::vector<std::shared_ptr<Root>> Database::RootHistory(const std::string &name)
{
  return SelectRoots(name, -1);
}

std::vector<std::shared_ptr<Root>> Database::SelectRoots(const std::string &name, int limit)
{
  const char *kSelRoots =
      "SELECT id, name, cid, created_at FROM roots "
      "WHERE name = ?1 ORDER BY id DESC LIMIT ?2;";

  Statement selRoots(m_Database->m_db, kSelRoots, "kSelRoots");

  sqlite3_bind_text(selRoots, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(selRoots, 2, limit);

  std::vector<std::shared_ptr<Root>> res;
  int rc;
  while ((rc = sqlite3_step(selRoots)) == SQLITE_ROW)
  {
    res.push_back(std::make_shared<Root>(
        static_cast<ID>(sqlite3_column_int64(selRoots, 0)),
        std::string{reinterpret_cast<const char *>(sqlite3_column_text(selRoots, 1))},
        ReadBlobColumnAsIdentity(selRoots, 2),
        static_cast<Timestamp>(sqlite3_column_int64(selRoots, 3))));
  }

  if (rc != SQLITE_DONE)
    throw std::runtime_error(std::string("roots select failed: ") + sqlite3_errmsg(m_Database->m_db));

  return res;
}
