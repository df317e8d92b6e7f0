#include "repertoire/study/recall_scheduler.hpp"

#include <algorithm>
#include <cmath>

#include "repertoire/constants.hpp"
#include "repertoire/errors.hpp"

namespace repertoire::study
{
  namespace
  {
    void validateGrade(int grade)
    {
      if (grade < core::GRADE_MIN || grade > core::GRADE_MAX)
        throw InvalidGrade(grade);
    }

    bool dueOrder(const ScheduledOpening &a, const ScheduledOpening &b)
    {
      if (a.dueDate != b.dueDate)
        return a.dueDate < b.dueDate;
      return a.opening.name < b.opening.name;
    }
  } // namespace

  SchedulerState sm2Update(const SchedulerState &state, int grade)
  {
    validateGrade(grade);

    const int miss = core::GRADE_MAX - grade;
    double ef = state.ease + (0.1 - miss * (0.08 + miss * 0.02));
    ef = std::clamp(ef, core::EASE_MIN, core::EASE_MAX);

    SchedulerState next = state;
    next.ease = ef;

    if (grade < core::GRADE_PASS)
    {
      // lapse: progress resets, the ease penalty stays
      next.intervalDays = 1;
      next.reps = 0;
      next.lapses = state.lapses + 1;
      return next;
    }

    next.reps = state.reps + 1;
    if (next.reps == 1)
      next.intervalDays = 1;
    else if (next.reps == 2)
      next.intervalDays = 6;
    else
      // nearbyint: ties go to the even neighbour
      next.intervalDays = std::max(1, static_cast<int>(std::nearbyint(state.intervalDays * ef)));
    return next;
  }

  SchedulerState RecallScheduler::applyGrade(OpeningId openingId, int grade, const ReviewContext &review,
                                             CalendarDate today, Timestamp now)
  {
    validateGrade(grade);

    SchedulerState result;
    m_store.atomically([&]
                       {
      const SchedulerState current = m_store.getOrCreate(openingId, today);

      SchedulerState next = sm2Update(current, grade);
      next.dueDate = addDays(today, next.intervalDays);
      next.lastGrade = grade;
      next.lastReviewedAt = now;
      m_store.upsert(openingId, next);

      ReviewLogEntry entry;
      entry.openingId = openingId;
      entry.reviewedAt = now;
      entry.grade = grade;
      entry.context = review;
      m_store.appendReview(entry);

      result = next; });
    return result;
  }

  std::vector<ScheduledOpening> pickDue(std::vector<ScheduledOpening> candidates, CalendarDate asOf,
                                        std::size_t limit)
  {
    std::sort(candidates.begin(), candidates.end(), dueOrder);

    std::vector<ScheduledOpening> due;
    for (auto &c : candidates)
    {
      if (due.size() >= limit)
        break;
      if (c.dueDate <= asOf)
        due.push_back(std::move(c));
    }
    if (!due.empty() || limit == 0)
      return due;

    // Nothing due yet: offer the soonest upcoming ones.
    if (candidates.size() > limit)
      candidates.resize(limit);
    return candidates;
  }

} // namespace repertoire::study
