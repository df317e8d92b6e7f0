#include "repertoire/store/opening_repository.hpp"

#include "repertoire/errors.hpp"

namespace repertoire::store
{
  namespace
  {
    study::OpeningLine readLine(const Statement &st)
    {
      study::OpeningLine line;
      line.id = st.columnInt64(0);
      line.name = st.columnText(1);
      line.tokens = study::tokenize(st.columnText(2));
      return line;
    }
  } // namespace

  study::OpeningLine OpeningRepository::add(const std::string &name, const study::TokenSequence &tokens)
  {
    if (name.empty())
      throw Error("opening name must not be empty");
    if (tokens.empty())
      throw Error("no moves provided for '" + name + "'");

    if (findByName(name))
      throw StoreError("opening '" + name + "' already exists");

    Statement st(m_db, "INSERT INTO openings (name, moves) VALUES (?, ?)");
    st.bind(1, name).bind(2, study::joinTokens(tokens));
    st.step();

    return study::OpeningLine{m_db.lastInsertId(), name, tokens};
  }

  std::optional<study::OpeningLine> OpeningRepository::findById(study::OpeningId id)
  {
    Statement st(m_db, "SELECT id, name, moves FROM openings WHERE id = ?");
    st.bind(1, id);
    if (!st.step())
      return std::nullopt;
    return readLine(st);
  }

  std::optional<study::OpeningLine> OpeningRepository::findByName(const std::string &name)
  {
    Statement st(m_db, "SELECT id, name, moves FROM openings WHERE name = ?");
    st.bind(1, name);
    if (!st.step())
      return std::nullopt;
    return readLine(st);
  }

  std::vector<study::OpeningLine> OpeningRepository::listByPrefix(const std::string &prefix, std::size_t limit)
  {
    return query(likePrefix(prefix), limit);
  }

  std::vector<study::OpeningLine> OpeningRepository::query(const std::string &pattern, std::size_t limit)
  {
    // LIMIT -1 is unbounded in SQLite
    Statement st(m_db, "SELECT id, name, moves FROM openings WHERE name LIKE ? ESCAPE '\\' "
                       "ORDER BY name ASC LIMIT ?");
    st.bind(1, pattern).bind(2, limit == 0 ? std::int64_t{-1} : static_cast<std::int64_t>(limit));

    std::vector<study::OpeningLine> out;
    while (st.step())
      out.push_back(readLine(st));
    return out;
  }

  std::size_t OpeningRepository::count()
  {
    Statement st(m_db, "SELECT COUNT(*) FROM openings");
    st.step();
    return static_cast<std::size_t>(st.columnInt64(0));
  }

} // namespace repertoire::store
