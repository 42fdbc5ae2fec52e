#pragma once
#include "../Types.hpp"
#include <string>

namespace Monofs::DB
{
  /// @brief One recorded version of a named filesystem root.
  struct Root
  {
    Root(ID id, const std::string &name, const Cid &target, Timestamp createdAt)
        : Id(id),
          Name(name),
          Target(target),
          CreatedAt(createdAt)
    {
    }

    const ID Id{};
    const std::string Name;
    const Cid Target{};
    const Timestamp CreatedAt{};
  };

  /// @brief The Database Schema that is always executed on DB load.
  static const char *DB_SCHEMA = R"SQL(

    CREATE TABLE IF NOT EXISTS roots (
      id         INTEGER PRIMARY KEY,
      name       TEXT NOT NULL,
      cid        BLOB NOT NULL CHECK (length(cid) = 32),
      created_at INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_roots_name ON roots(name, id);

  )SQL";
}
