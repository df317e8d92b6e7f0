#include "repertoire/store/sqlite_study_store.hpp"

#include "repertoire/errors.hpp"

namespace repertoire::store
{
  namespace
  {
    study::CalendarDate readDate(const Statement &st, int col)
    {
      const std::string text = st.columnText(col);
      auto d = study::parseDate(text);
      if (!d)
        throw StoreError("malformed due date '" + text + "'");
      return *d;
    }

    std::optional<study::Timestamp> readTimestamp(const Statement &st, int col)
    {
      if (st.isNull(col))
        return std::nullopt;
      const std::string text = st.columnText(col);
      auto ts = study::parseTimestamp(text);
      if (!ts)
        throw StoreError("malformed timestamp '" + text + "'");
      return ts;
    }

    std::optional<std::string> formatOptTimestamp(const std::optional<study::Timestamp> &ts)
    {
      if (!ts)
        return std::nullopt;
      return study::formatTimestamp(*ts);
    }
  } // namespace

  study::SchedulerState SqliteStudyStore::getOrCreate(study::OpeningId id, study::CalendarDate today)
  {
    Statement ins(m_db, "INSERT INTO study_cards (opening_id, due_date) VALUES (?, ?) "
                        "ON CONFLICT(opening_id) DO NOTHING");
    ins.bind(1, id).bind(2, study::formatDate(today));
    ins.step();

    auto state = find(id);
    if (!state)
      throw StoreError("no scheduler state for opening " + std::to_string(id));
    return *state;
  }

  std::optional<study::SchedulerState> SqliteStudyStore::find(study::OpeningId id)
  {
    Statement st(m_db, "SELECT ease, interval_days, reps, lapses, due_date, last_grade, last_reviewed_at "
                       "FROM study_cards WHERE opening_id = ?");
    st.bind(1, id);
    if (!st.step())
      return std::nullopt;

    study::SchedulerState s;
    s.ease = st.columnDouble(0);
    s.intervalDays = st.columnInt(1);
    s.reps = st.columnInt(2);
    s.lapses = st.columnInt(3);
    s.dueDate = readDate(st, 4);
    s.lastGrade = st.columnOptInt(5);
    s.lastReviewedAt = readTimestamp(st, 6);
    return s;
  }

  void SqliteStudyStore::upsert(study::OpeningId id, const study::SchedulerState &s)
  {
    Statement st(m_db, R"SQL(
      INSERT INTO study_cards (opening_id, ease, interval_days, reps, lapses, due_date, last_grade, last_reviewed_at)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?)
      ON CONFLICT(opening_id) DO UPDATE SET
        ease = excluded.ease,
        interval_days = excluded.interval_days,
        reps = excluded.reps,
        lapses = excluded.lapses,
        due_date = excluded.due_date,
        last_grade = excluded.last_grade,
        last_reviewed_at = excluded.last_reviewed_at
    )SQL");
    st.bind(1, id)
        .bind(2, s.ease)
        .bind(3, s.intervalDays)
        .bind(4, s.reps)
        .bind(5, s.lapses)
        .bind(6, study::formatDate(s.dueDate))
        .bind(7, s.lastGrade)
        .bind(8, formatOptTimestamp(s.lastReviewedAt));
    st.step();
  }

  void SqliteStudyStore::appendReview(const study::ReviewLogEntry &e)
  {
    Statement st(m_db, "INSERT INTO study_reviews (opening_id, reviewed_at, grade, prompt_mode, prompt, "
                       "typed_moves, correct_tokens, target_tokens) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, e.openingId)
        .bind(2, study::formatTimestamp(e.reviewedAt))
        .bind(3, e.grade)
        .bind(4, e.context.promptMode)
        .bind(5, e.context.prompt)
        .bind(6, e.context.typedMoves)
        .bind(7, e.context.correctTokens)
        .bind(8, e.context.targetTokens);
    st.step();
  }

  void SqliteStudyStore::atomically(const std::function<void()> &fn)
  {
    Transaction tx(m_db);
    fn();
    tx.commit();
  }

  std::size_t SqliteStudyStore::ensureStates(const std::string &prefix, study::CalendarDate today)
  {
    Statement st(m_db, "INSERT INTO study_cards (opening_id, due_date) "
                       "SELECT id, ? FROM openings WHERE name LIKE ? ESCAPE '\\' "
                       "ON CONFLICT(opening_id) DO NOTHING");
    st.bind(1, study::formatDate(today)).bind(2, likePrefix(prefix));
    st.step();
    return static_cast<std::size_t>(m_db.changes());
  }

  std::vector<study::ScheduledOpening> SqliteStudyStore::listScheduled(const std::string &prefix)
  {
    Statement st(m_db, "SELECT o.id, o.name, o.moves, c.due_date FROM openings o "
                       "JOIN study_cards c ON c.opening_id = o.id "
                       "WHERE o.name LIKE ? ESCAPE '\\' ORDER BY c.due_date ASC, o.name ASC");
    st.bind(1, likePrefix(prefix));

    std::vector<study::ScheduledOpening> out;
    while (st.step())
    {
      study::ScheduledOpening item;
      item.opening.id = st.columnInt64(0);
      item.opening.name = st.columnText(1);
      item.opening.tokens = study::tokenize(st.columnText(2));
      item.dueDate = readDate(st, 3);
      out.push_back(std::move(item));
    }
    return out;
  }

  std::vector<study::ReviewLogEntry> SqliteStudyStore::reviews(study::OpeningId id)
  {
    Statement st(m_db, "SELECT reviewed_at, grade, prompt_mode, prompt, typed_moves, correct_tokens, "
                       "target_tokens FROM study_reviews WHERE opening_id = ? ORDER BY id DESC");
    st.bind(1, id);

    std::vector<study::ReviewLogEntry> out;
    while (st.step())
    {
      study::ReviewLogEntry e;
      e.openingId = id;
      e.reviewedAt = readTimestamp(st, 0).value_or(study::Timestamp{});
      e.grade = st.columnInt(1);
      e.context.promptMode = st.columnText(2);
      e.context.prompt = st.columnOptText(3);
      e.context.typedMoves = st.columnOptText(4);
      e.context.correctTokens = st.columnOptInt(5);
      e.context.targetTokens = st.columnOptInt(6);
      out.push_back(std::move(e));
    }
    return out;
  }

} // namespace repertoire::store
