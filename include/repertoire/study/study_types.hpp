#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "repertoire/constants.hpp"
#include "repertoire/study/calendar.hpp"
#include "repertoire/study/token_sequence.hpp"

namespace repertoire::study
{
  using OpeningId = std::int64_t;

  struct OpeningLine
  {
    OpeningId id{0};
    std::string name;
    TokenSequence tokens; // play order, never empty once stored
  };

  struct SchedulerState
  {
    double ease{core::EASE_INITIAL};
    int intervalDays{0};
    int reps{0};   // successful reviews since the last lapse
    int lapses{0};
    CalendarDate dueDate{};
    std::optional<int> lastGrade;
    std::optional<Timestamp> lastReviewedAt;

    static SchedulerState fresh(CalendarDate createdOn)
    {
      SchedulerState s;
      s.dueDate = createdOn;
      return s;
    }
  };

  // What the learner was shown and typed; stored next to the grade.
  struct ReviewContext
  {
    std::string promptMode{"name_to_moves"};
    std::optional<std::string> prompt;
    std::optional<std::string> typedMoves;
    std::optional<int> correctTokens;
    std::optional<int> targetTokens;
  };

  struct ReviewLogEntry
  {
    OpeningId openingId{0};
    Timestamp reviewedAt{};
    int grade{0};
    ReviewContext context;
  };

  // An opening joined with its scheduler due date.
  struct ScheduledOpening
  {
    OpeningLine opening;
    CalendarDate dueDate{};
  };

} // namespace repertoire::study
