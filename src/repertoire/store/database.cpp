#include "repertoire/store/database.hpp"

#include <atomic>
#include <filesystem>
#include <iostream>

#include <sqlite3.h>

#include "repertoire/errors.hpp"

namespace repertoire::store
{
  namespace fs = std::filesystem;

  namespace
  {
    std::string escapeLike(const std::string &s)
    {
      std::string out;
      out.reserve(s.size());
      for (char c : s)
      {
        if (c == '%' || c == '_' || c == '\\')
          out.push_back('\\');
        out.push_back(c);
      }
      return out;
    }

    std::atomic<unsigned> g_savepointSeq{0};
  } // namespace

  Database::Database(const std::string &path) : m_path(path)
  {
    if (path != ":memory:" && !path.empty())
    {
      const fs::path parent = fs::path(path).parent_path();
      std::error_code ec;
      if (!parent.empty())
        fs::create_directories(parent, ec);
      if (ec)
        throw StoreError("cannot create directory " + parent.string() + ": " + ec.message());
    }

    if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK)
    {
      std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
      sqlite3_close(m_db);
      m_db = nullptr;
      throw StoreError("failed to open database " + path + ": " + msg);
    }

    sqlite3_busy_timeout(m_db, 5000);
    exec("PRAGMA foreign_keys = ON;");
  }

  Database::~Database()
  {
    if (m_db)
      sqlite3_close(m_db);
  }

  void Database::exec(const std::string &sql)
  {
    char *err = nullptr;
    const int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
      std::string msg = err ? err : sqlite3_errmsg(m_db);
      sqlite3_free(err);
      throw StoreError("SQL error: " + msg);
    }
  }

  std::int64_t Database::lastInsertId() const
  {
    return sqlite3_last_insert_rowid(m_db);
  }

  int Database::changes() const
  {
    return sqlite3_changes(m_db);
  }

  bool Database::inTransaction() const
  {
    return sqlite3_get_autocommit(m_db) == 0;
  }

  // ---- Statement ----

  Statement::Statement(Database &db, const std::string &sql) : m_db(db), m_sql(sql)
  {
    check(sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &m_stmt, nullptr), "prepare");
  }

  Statement::~Statement()
  {
    sqlite3_finalize(m_stmt);
  }

  void Statement::check(int rc, const char *what)
  {
    if (rc == SQLITE_OK)
      return;
    throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(m_db.handle()) + " [" + m_sql + "]");
  }

  Statement &Statement::bind(int idx, std::int64_t v)
  {
    check(sqlite3_bind_int64(m_stmt, idx, v), "bind");
    return *this;
  }

  Statement &Statement::bind(int idx, int v)
  {
    check(sqlite3_bind_int(m_stmt, idx, v), "bind");
    return *this;
  }

  Statement &Statement::bind(int idx, double v)
  {
    check(sqlite3_bind_double(m_stmt, idx, v), "bind");
    return *this;
  }

  Statement &Statement::bind(int idx, const std::string &v)
  {
    check(sqlite3_bind_text(m_stmt, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT), "bind");
    return *this;
  }

  Statement &Statement::bindNull(int idx)
  {
    check(sqlite3_bind_null(m_stmt, idx), "bind");
    return *this;
  }

  bool Statement::step()
  {
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW)
      return true;
    if (rc == SQLITE_DONE)
      return false;
    throw StoreError(std::string("step failed: ") + sqlite3_errmsg(m_db.handle()) + " [" + m_sql + "]");
  }

  void Statement::reset()
  {
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
  }

  bool Statement::isNull(int col) const
  {
    return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
  }

  std::int64_t Statement::columnInt64(int col) const
  {
    return sqlite3_column_int64(m_stmt, col);
  }

  int Statement::columnInt(int col) const
  {
    return sqlite3_column_int(m_stmt, col);
  }

  double Statement::columnDouble(int col) const
  {
    return sqlite3_column_double(m_stmt, col);
  }

  std::string Statement::columnText(int col) const
  {
    const auto *p = sqlite3_column_text(m_stmt, col);
    if (!p)
      return {};
    return std::string(reinterpret_cast<const char *>(p), static_cast<std::size_t>(sqlite3_column_bytes(m_stmt, col)));
  }

  std::optional<int> Statement::columnOptInt(int col) const
  {
    if (isNull(col))
      return std::nullopt;
    return columnInt(col);
  }

  std::optional<std::string> Statement::columnOptText(int col) const
  {
    if (isNull(col))
      return std::nullopt;
    return columnText(col);
  }

  // ---- Transaction ----

  Transaction::Transaction(Database &db) : m_db(db), m_nested(db.inTransaction())
  {
    if (m_nested)
    {
      m_savepoint = "sp_" + std::to_string(++g_savepointSeq);
      m_db.exec("SAVEPOINT " + m_savepoint + ";");
    }
    else
    {
      // take the write lock before the first read
      m_db.exec("BEGIN IMMEDIATE;");
    }
  }

  Transaction::~Transaction()
  {
    if (m_done)
      return;
    try
    {
      if (m_nested)
        m_db.exec("ROLLBACK TO " + m_savepoint + "; RELEASE " + m_savepoint + ";");
      else
        m_db.exec("ROLLBACK;");
    }
    catch (const StoreError &e)
    {
      std::cerr << "[Store] rollback failed: " << e.what() << "\n";
    }
  }

  void Transaction::commit()
  {
    if (m_nested)
      m_db.exec("RELEASE " + m_savepoint + ";");
    else
      m_db.exec("COMMIT;");
    m_done = true;
  }

  std::string likePrefix(const std::string &prefix)
  {
    return escapeLike(prefix) + "%";
  }

} // namespace repertoire::store
