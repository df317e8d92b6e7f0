#pragma once

#include <cstddef>
#include <vector>

#include "repertoire/study/study_store.hpp"
#include "repertoire/study/study_types.hpp"

namespace repertoire::study
{
  // Pure SM-2 step. Leaves dueDate, lastGrade and lastReviewedAt untouched.
  // Throws InvalidGrade for grades outside 0..5.
  SchedulerState sm2Update(const SchedulerState &state, int grade);

  class RecallScheduler
  {
  public:
    explicit RecallScheduler(StudyStore &store) : m_store(store) {}

    // Reads (or lazily creates) the opening's state, applies the grade, writes
    // it back and appends a review entry, all in one store transaction.
    SchedulerState applyGrade(OpeningId openingId, int grade, const ReviewContext &review,
                              CalendarDate today, Timestamp now);

  private:
    StudyStore &m_store;
  };

  // Openings due on or before asOf, by (dueDate, name), at most limit of them.
  // With nothing due, the soonest upcoming ones in the same order instead.
  // Every opening in scope must already have scheduler state.
  std::vector<ScheduledOpening> pickDue(std::vector<ScheduledOpening> candidates, CalendarDate asOf,
                                        std::size_t limit);

} // namespace repertoire::study
