#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace repertoire::store
{
  // Owning SQLite connection. Foreign keys are enabled on open.
  class Database
  {
  public:
    // Opens (creating if needed) the database file; ":memory:" is accepted.
    // Parent directories are created. Throws StoreError.
    explicit Database(const std::string &path);
    ~Database();

    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    void exec(const std::string &sql);
    std::int64_t lastInsertId() const;
    int changes() const;
    bool inTransaction() const;

    sqlite3 *handle() const { return m_db; }
    const std::string &path() const { return m_path; }

  private:
    sqlite3 *m_db{nullptr};
    std::string m_path;
  };

  class Statement
  {
  public:
    Statement(Database &db, const std::string &sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    // 1-based parameter indexes, as in sqlite3_bind_*.
    Statement &bind(int idx, std::int64_t v);
    Statement &bind(int idx, int v);
    Statement &bind(int idx, double v);
    Statement &bind(int idx, const std::string &v);
    Statement &bindNull(int idx);

    template <typename T>
    Statement &bind(int idx, const std::optional<T> &v)
    {
      return v ? bind(idx, *v) : bindNull(idx);
    }

    // true while a row is available
    bool step();
    void reset();

    // 0-based column indexes, as in sqlite3_column_*.
    bool isNull(int col) const;
    std::int64_t columnInt64(int col) const;
    int columnInt(int col) const;
    double columnDouble(int col) const;
    std::string columnText(int col) const;
    std::optional<int> columnOptInt(int col) const;
    std::optional<std::string> columnOptText(int col) const;

  private:
    void check(int rc, const char *what);

    Database &m_db;
    sqlite3_stmt *m_stmt{nullptr};
    std::string m_sql;
  };

  // BEGIN IMMEDIATE at the outermost level, SAVEPOINT when nested. Rolls
  // back on destruction unless commit() was called.
  class Transaction
  {
  public:
    explicit Transaction(Database &db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

  private:
    Database &m_db;
    bool m_nested{false};
    bool m_done{false};
    std::string m_savepoint;
  };

  // "Scotch%" style LIKE pattern with %, _ and \ escaped in the literal part.
  std::string likePrefix(const std::string &prefix);

} // namespace repertoire::store
