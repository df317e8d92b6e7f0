#include <cassert>
#include <cmath>
#include <map>
#include <stdexcept>
#include <vector>

#include "repertoire/errors.hpp"
#include "repertoire/study/recall_scheduler.hpp"

using namespace repertoire;
using namespace repertoire::study;

namespace
{
  // In-memory store; atomically() restores the snapshot when fn throws.
  class MemoryStore : public StudyStore
  {
  public:
    SchedulerState getOrCreate(OpeningId id, CalendarDate today) override
    {
      ++getCalls;
      auto it = states.find(id);
      if (it == states.end())
        it = states.emplace(id, SchedulerState::fresh(today)).first;
      return it->second;
    }

    void upsert(OpeningId id, const SchedulerState &state) override
    {
      if (failUpsert)
        throw StoreError("disk full");
      states[id] = state;
    }

    void appendReview(const ReviewLogEntry &entry) override { log.push_back(entry); }

    void atomically(const std::function<void()> &fn) override
    {
      const auto savedStates = states;
      const auto savedLog = log;
      try
      {
        fn();
      }
      catch (const Error &)
      {
        states = savedStates;
        log = savedLog;
        throw;
      }
    }

    std::map<OpeningId, SchedulerState> states;
    std::vector<ReviewLogEntry> log;
    int getCalls = 0;
    bool failUpsert = false;
  };

  ScheduledOpening scheduled(OpeningId id, const char *name, CalendarDate due)
  {
    ScheduledOpening s;
    s.opening.id = id;
    s.opening.name = name;
    s.opening.tokens = {"e4"};
    s.dueDate = due;
    return s;
  }
} // namespace

int main()
{
  const CalendarDate today = makeDate(2024, 1, 10);
  const Timestamp now = Timestamp{today} + std::chrono::hours{9};

  // Three perfect reviews: 1, 6, round(6 * ef) days
  {
    MemoryStore store;
    RecallScheduler sched(store);
    ReviewContext ctx;

    auto s1 = sched.applyGrade(1, 5, ctx, today, now);
    assert(s1.intervalDays == 1 && s1.reps == 1);
    assert(s1.dueDate == addDays(today, 1));
    assert(std::abs(s1.ease - 2.6) < 1e-9);

    auto s2 = sched.applyGrade(1, 5, ctx, today, now);
    assert(s2.intervalDays == 6 && s2.reps == 2);

    auto s3 = sched.applyGrade(1, 5, ctx, today, now);
    assert(std::abs(s3.ease - 2.8) < 1e-9);
    assert(s3.intervalDays == 17);
    assert(s3.reps == 3);
    assert(s3.lastGrade == 5);
    assert(s3.lastReviewedAt == now);
    assert(store.log.size() == 3);
  }

  // Passing grades: reps strictly increase, intervals never shrink after the second success
  for (int grade = 3; grade <= 5; ++grade)
  {
    SchedulerState s = SchedulerState::fresh(today);
    int prevReps = s.reps;
    int prevInterval = 0;
    for (int i = 0; i < 8; ++i)
    {
      s = sm2Update(s, grade);
      assert(s.reps > prevReps);
      if (s.reps > 2)
        assert(s.intervalDays >= prevInterval);
      prevReps = s.reps;
      prevInterval = s.intervalDays;
    }
  }

  // Failing grades reset progress whatever came before
  for (int grade = 0; grade <= 2; ++grade)
  {
    SchedulerState s = SchedulerState::fresh(today);
    s.reps = 7;
    s.intervalDays = 120;
    s.lapses = 2;
    s.ease = 2.9;
    const auto next = sm2Update(s, grade);
    assert(next.intervalDays == 1);
    assert(next.reps == 0);
    assert(next.lapses == 3);
  }

  // Ease stays within [1.3, 3.0]
  for (double ease = 1.3; ease <= 3.0 + 1e-9; ease += 0.05)
  {
    for (int grade = 0; grade <= 5; ++grade)
    {
      SchedulerState s = SchedulerState::fresh(today);
      s.ease = ease;
      const auto next = sm2Update(s, grade);
      assert(next.ease >= 1.3 - 1e-12 && next.ease <= 3.0 + 1e-12);
    }
  }

  // Out-of-range grades change nothing
  for (int bad : {-1, 6})
  {
    MemoryStore store;
    RecallScheduler sched(store);
    sched.applyGrade(4, 4, ReviewContext{}, today, now);
    const SchedulerState before = store.states.at(4);

    bool threw = false;
    try
    {
      sched.applyGrade(4, bad, ReviewContext{}, today, now);
    }
    catch (const InvalidGrade &e)
    {
      threw = true;
      assert(e.grade() == bad);
    }
    assert(threw);
    assert(store.log.size() == 1);
    assert(store.states.at(4).dueDate == before.dueDate);
    assert(store.states.at(4).reps == before.reps);
    assert(store.getCalls == 1);
  }

  // A failed write leaves neither state nor review behind
  {
    MemoryStore store;
    store.failUpsert = true;
    RecallScheduler sched(store);
    bool threw = false;
    try
    {
      sched.applyGrade(9, 5, ReviewContext{}, today, now);
    }
    catch (const StoreError &)
    {
      threw = true;
    }
    assert(threw);
    assert(store.states.empty());
    assert(store.log.empty());
  }

  // Review context is logged as given
  {
    MemoryStore store;
    RecallScheduler sched(store);
    ReviewContext ctx;
    ctx.prompt = "Scotch Game";
    ctx.typedMoves = "e4 e5 Nf3";
    ctx.correctTokens = 3;
    ctx.targetTokens = 4;
    sched.applyGrade(2, 3, ctx, today, now);
    assert(store.log.size() == 1);
    assert(store.log[0].openingId == 2);
    assert(store.log[0].grade == 3);
    assert(store.log[0].context.promptMode == "name_to_moves");
    assert(store.log[0].context.correctTokens == 3);
    assert(store.log[0].reviewedAt == now);
  }

  // Due selection: due items by date then name, capped by limit
  {
    std::vector<ScheduledOpening> c = {
        scheduled(1, "Scotch C", addDays(today, -1)),
        scheduled(2, "Scotch A", today),
        scheduled(3, "Scotch B", addDays(today, -1)),
        scheduled(4, "Scotch D", addDays(today, 3)),
    };
    auto picked = pickDue(c, today, 10);
    assert(picked.size() == 3);
    assert(picked[0].opening.name == "Scotch B");
    assert(picked[1].opening.name == "Scotch C");
    assert(picked[2].opening.name == "Scotch A");

    picked = pickDue(c, today, 2);
    assert(picked.size() == 2);
    assert(pickDue(c, today, 0).empty());
  }

  // Nothing due: the soonest upcoming ones instead
  {
    std::vector<ScheduledOpening> c = {
        scheduled(1, "Late", addDays(today, 9)),
        scheduled(2, "Soon", addDays(today, 2)),
        scheduled(3, "Sooner", addDays(today, 1)),
    };
    const auto picked = pickDue(c, today, 2);
    assert(picked.size() == 2);
    assert(picked[0].opening.name == "Sooner");
    assert(picked[1].opening.name == "Soon");
    assert(pickDue({}, today, 5).empty());
  }

  return 0;
}
