#pragma once

#include <optional>
#include <string>

#include "repertoire/analysis/analysis_types.hpp"
#include "repertoire/store/database.hpp"
#include "repertoire/study/study_types.hpp"

namespace repertoire::store
{
  struct StoredEvaluation
  {
    std::int64_t id{0};
    study::OpeningId openingId{0};
    analysis::EngineScore score;
    std::string analyzedAt;
  };

  // Free-text notes and stored engine evaluations attached to openings.
  class AnnotationRepository
  {
  public:
    explicit AnnotationRepository(Database &db) : m_db(db) {}

    std::optional<std::string> notes(study::OpeningId id);
    void setNotes(study::OpeningId id, const std::string &text);

    StoredEvaluation storeEvaluation(study::OpeningId id, const analysis::EngineScore &score);
    std::optional<StoredEvaluation> latestEvaluation(study::OpeningId id);

  private:
    Database &m_db;
  };

} // namespace repertoire::store
