#pragma once

#include <functional>

#include "repertoire/study/study_types.hpp"

namespace repertoire::study
{
  // Storage port used by the scheduler. Implementations must make
  // atomically() a single all-or-nothing unit against concurrent writers.
  class StudyStore
  {
  public:
    virtual ~StudyStore() = default;

    // Returns the stored state, creating SchedulerState::fresh(today) first
    // when none exists. Idempotent.
    virtual SchedulerState getOrCreate(OpeningId id, CalendarDate today) = 0;
    virtual void upsert(OpeningId id, const SchedulerState &state) = 0;
    virtual void appendReview(const ReviewLogEntry &entry) = 0;

    // Runs fn as one transaction; rethrows after rolling back on failure.
    virtual void atomically(const std::function<void()> &fn) = 0;
  };

} // namespace repertoire::study
