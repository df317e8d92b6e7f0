#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "repertoire/store/database.hpp"
#include "repertoire/study/study_store.hpp"

namespace repertoire::store
{
  // StudyStore over the study_cards / study_reviews tables.
  class SqliteStudyStore final : public study::StudyStore
  {
  public:
    explicit SqliteStudyStore(Database &db) : m_db(db) {}

    study::SchedulerState getOrCreate(study::OpeningId id, study::CalendarDate today) override;
    void upsert(study::OpeningId id, const study::SchedulerState &state) override;
    void appendReview(const study::ReviewLogEntry &entry) override;
    void atomically(const std::function<void()> &fn) override;

    std::optional<study::SchedulerState> find(study::OpeningId id);

    // Creates missing state for every opening whose name starts with prefix.
    // Returns how many were created.
    std::size_t ensureStates(const std::string &prefix, study::CalendarDate today);

    // Openings with state, joined with their due date, in (dueDate, name) order.
    std::vector<study::ScheduledOpening> listScheduled(const std::string &prefix);

    // Newest first.
    std::vector<study::ReviewLogEntry> reviews(study::OpeningId id);

  private:
    Database &m_db;
  };

} // namespace repertoire::store
