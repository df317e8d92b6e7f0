#include "repertoire/store/annotation_repository.hpp"

#include "repertoire/study/token_sequence.hpp"

namespace repertoire::store
{
  std::optional<std::string> AnnotationRepository::notes(study::OpeningId id)
  {
    Statement st(m_db, "SELECT notes FROM opening_notes WHERE opening_id = ?");
    st.bind(1, id);
    if (!st.step())
      return std::nullopt;
    return st.columnText(0);
  }

  void AnnotationRepository::setNotes(study::OpeningId id, const std::string &text)
  {
    Statement st(m_db, "INSERT INTO opening_notes (opening_id, notes) VALUES (?, ?) "
                       "ON CONFLICT(opening_id) DO UPDATE SET notes = excluded.notes, updated_at = datetime('now')");
    st.bind(1, id).bind(2, text);
    st.step();
  }

  StoredEvaluation AnnotationRepository::storeEvaluation(study::OpeningId id, const analysis::EngineScore &score)
  {
    std::optional<std::string> pv;
    if (!score.pv.empty())
      pv = study::joinTokens(score.pv);

    Statement st(m_db, "INSERT INTO evaluations (opening_id, depth, multipv, score_cp, mate_in, bestmove_uci, pv_uci) "
                       "VALUES (?, ?, 1, ?, ?, ?, ?)");
    st.bind(1, id).bind(2, score.depth).bind(3, score.cp).bind(4, score.mateIn).bind(5, score.bestMove).bind(6, pv);
    st.step();

    const std::int64_t rowId = m_db.lastInsertId();
    Statement back(m_db, "SELECT analyzed_at FROM evaluations WHERE id = ?");
    back.bind(1, rowId);
    back.step();

    return StoredEvaluation{rowId, id, score, back.columnText(0)};
  }

  std::optional<StoredEvaluation> AnnotationRepository::latestEvaluation(study::OpeningId id)
  {
    Statement st(m_db, "SELECT id, depth, score_cp, mate_in, bestmove_uci, pv_uci, analyzed_at FROM evaluations "
                       "WHERE opening_id = ? ORDER BY analyzed_at DESC, id DESC LIMIT 1");
    st.bind(1, id);
    if (!st.step())
      return std::nullopt;

    StoredEvaluation ev;
    ev.id = st.columnInt64(0);
    ev.openingId = id;
    ev.score.depth = st.columnInt(1);
    ev.score.cp = st.columnOptInt(2);
    ev.score.mateIn = st.columnOptInt(3);
    ev.score.bestMove = st.columnOptText(4);
    if (auto pv = st.columnOptText(5))
      ev.score.pv = study::tokenize(*pv);
    ev.analyzedAt = st.columnText(6);
    return ev;
  }

} // namespace repertoire::store
