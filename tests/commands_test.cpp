#include <cassert>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "repertoire/app/commands.hpp"
#include "repertoire/errors.hpp"

using namespace repertoire;
using namespace repertoire::app;

namespace
{
  std::vector<std::string> lastMovesSeen;

  // Score grows by 30cp per move played, except a fixed blunder at ply 4.
  class FakeOracle : public analysis::EvaluationOracle
  {
  public:
    analysis::EngineScore evaluate(const analysis::PositionState &pos, int depth) override
    {
      lastMovesSeen = pos.moves;
      analysis::EngineScore s;
      s.depth = depth;
      const int n = static_cast<int>(pos.moves.size());
      s.cp = n >= 4 ? -250 : 30 * n;
      s.bestMove = "a2a3";
      s.pv = {"a2a3", "a7a6"};
      return s;
    }
  };

  OracleFactory fakeOracle(int &created)
  {
    return [&created]() -> std::unique_ptr<analysis::EvaluationOracle>
    {
      ++created;
      return std::make_unique<FakeOracle>();
    };
  }

  OracleFactory noOracle()
  {
    return []() -> std::unique_ptr<analysis::EvaluationOracle>
    { throw analysis::OracleUnavailable("no engine here"); };
  }

  bool contains(const std::string &haystack, const std::string &needle)
  {
    return haystack.find(needle) != std::string::npos;
  }

  Clock fixedClock()
  {
    Clock c;
    c.today = study::makeDate(2024, 6, 1);
    c.now = study::Timestamp{c.today} + std::chrono::hours{7};
    return c;
  }
} // namespace

int main()
{
  const Clock clock = fixedClock();
  store::Database db(":memory:");
  int oraclesMade = 0;

  auto runWith = [&](const std::vector<std::string> &args, const std::string &input, OracleFactory f,
                     std::string *errText = nullptr) -> std::string
  {
    std::istringstream in(input);
    std::ostringstream out, err;
    CommandRunner runner(db, std::move(f), in, out, err);
    const int rc = runner.run(parse_args(args), clock);
    if (errText)
      *errText = err.str();
    else
      assert(rc == 0);
    return out.str();
  };
  auto run = [&](const std::vector<std::string> &args, const std::string &input = {})
  { return runWith(args, input, fakeOracle(oraclesMade)); };

  assert(contains(run({"init"}), "Initialized :memory:"));

  run({"add", "Scotch Game - Main", "--moves", "e4 e5 Nf3 Nc6 d4 exd4"});
  run({"add", "Scotch Game - Gambit", "--moves", "e4 e5 Nf3 Nc6 d4 exd4 Bc4"});
  assert(contains(run({"add", "Petrov", "--moves", "e4 e5 Nf3 Nf6"}), "Added Petrov (4 plies)"));

  // add rejects a line that cannot be played and stores nothing
  {
    bool threw = false;
    try
    {
      run({"add", "Broken", "--moves", "e4 e5 Ke3"});
    }
    catch (const IllegalToken &e)
    {
      threw = true;
      assert(e.token() == "Ke3");
      assert(e.ply() == 2);
    }
    assert(threw);

    bool missing = false;
    try
    {
      run({"show", "Broken"});
    }
    catch (const UsageError &)
    {
      missing = true;
    }
    assert(missing);
  }

  // list / show / note
  {
    const auto out = run({"list", "--prefix", "Scotch"});
    assert(contains(out, "Scotch Game - Gambit"));
    assert(!contains(out, "Petrov"));

    run({"note", "Petrov", "--text", "  symmetrical, watch Nxe5  "});
    const auto shown = run({"show", "Petrov"});
    assert(contains(shown, "e4 e5 Nf3 Nf6"));
    assert(contains(shown, "FEN: rnbqkb1r/pppp1ppp/5n2/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R w KQkq - 2 3"));
    assert(contains(shown, "symmetrical, watch Nxe5\n"));

    bool missing = false;
    try
    {
      run({"show", "Ruy Lopez"});
    }
    catch (const UsageError &)
    {
      missing = true;
    }
    assert(missing);
  }

  // eval stores the final position score
  {
    const auto out = run({"eval", "Petrov", "--depth", "12"});
    assert(contains(out, "Petrov @ depth 12: -2.50"));
    assert(contains(out, "bestmove: a2a3"));
    assert((lastMovesSeen == std::vector<std::string>{"e2e4", "e7e5", "g1f3", "g8f6"}));
    assert(contains(run({"show", "Petrov"}), "Latest eval @ depth 12: -2.50"));

    const auto all = run({"eval-all", "--depth", "8"});
    assert(contains(all, "Evaluations (depth 8)"));
    assert(contains(all, "Scotch Game - Gambit"));
    // evaluated in name order, the main line last
    assert((lastMovesSeen == std::vector<std::string>{"e2e4", "e7e5", "g1f3", "b8c6", "d2d4", "e5d4"}));
  }

  // due creates state for the prefix, everything due today
  {
    const auto out = run({"due", "--prefix", "Scotch"});
    assert(contains(out, "Due today (prefix: Scotch)"));
    assert(contains(out, "2024-06-01"));
    assert(!contains(out, "Petrov"));
  }

  // quiz: first answer perfect (default grade), second wrong and graded 1
  {
    const auto out = run({"quiz", "--prefix", "Scotch", "--tokens", "4"}, "e4 e5 Nf3 Nc6\n\ne4 d5\n1\n");
    assert(contains(out, "Correct (4/4)"));
    assert(contains(out, "Partial (1/4)"));
    assert(contains(out, "Answer: e4 e5 Nf3 Nc6"));
    assert(contains(out, "Next review: 2024-06-02 (in 1 days)"));

    // both reviewed, nothing due any more
    assert(contains(run({"due", "--prefix", "Scotch"}), "Nothing due today"));

    // the dry run falls back to the soonest upcoming lines
    const auto dry = run({"quiz", "--prefix", "Scotch", "--dry-run", "--tokens", "2"});
    assert(contains(dry, "Answer: e4 e5"));
  }

  // A non-numeric grade is rejected before anything is stored
  {
    bool threw = false;
    try
    {
      run({"quiz", "--prefix", "Petrov"}, "e4\nexcellent\n");
    }
    catch (const UsageError &)
    {
      threw = true;
    }
    assert(threw);
  }

  // tree
  {
    const auto out = run({"tree", "--prefix", "Scotch"});
    assert(contains(out, "Common start (6 tokens)"));
    assert(contains(out, "- <END>  (1)  Scotch Game - Main"));
    assert(contains(out, "- Bc4  (1)  Scotch Game - Gambit"));
  }

  // learn with evaluation marks the blunder ply
  {
    const int before = oraclesMade;
    const auto out = run({"learn", "--prefix", "Petrov", "--chunk", "4", "--swing-cp", "120"});
    assert(oraclesMade == before + 1);
    assert(contains(out, "01  e4 e5 Nf3 [Nf6]"));
    assert(contains(out, "Final eval (d10, White POV): -2.50"));
    assert(contains(out, "CRITICAL: ply 4 (Black) Nf6  +0.90 -> -2.50  (delta 3.40)"));
  }

  // learn without an engine still prints the sheet
  {
    std::string err;
    const auto out = runWith({"learn", "--prefix", "Scotch", "--chunk", "4"}, "", noOracle(), &err);
    assert(contains(out, "01  e4 e5 Nf3 Nc6"));
    assert(contains(out, "02  d4 exd4 Bc4"));
    assert(!contains(out, "Final eval"));
    assert(contains(err, "continuing without eval"));
  }

  // import from TSV, then study an imported PGN row with evaluation
  {
    const auto path = std::filesystem::temp_directory_path() / "repertoire_commands_test.tsv";
    {
      std::ofstream f(path);
      f << "# Scotch lines\n"
        << "\n"
        << "Scotch Game - Main\t1. e4 e5 2. Nf3 Nc6\n"
        << "Four Knights\t1. e4 e5 2. Nf3 Nc6 3. Nc3 Nf6 *\n"
        << "Scotch Opening\t1. e4 e5 2. Nf3 Nc6 3. d4 exd4 *\n"
        << "Broken\t1. e4 e4\n"
        << "1. d4 d5 2. c4\n";
    }

    std::string err;
    const auto out = runWith({"import", path.string()}, "", fakeOracle(oraclesMade), &err);
    assert(contains(out, "Imported 3 openings, skipped 1 existing, 1 with illegal moves."));
    assert(contains(err, "[Import] Broken: illegal move token 'e4' at ply 2"));
    assert(contains(run({"show", "Imported line 1"}), "d4 d5 c4"));
    assert(contains(run({"show", "Four Knights"}), "Plies: 6"));

    const auto learned = run({"learn", "--prefix", "Scotch Opening", "--chunk", "6", "--swing-cp", "120"});
    assert(contains(learned, "01  e4 e5 Nf3 [Nc6] d4 exd4"));
    assert(contains(learned, "Final eval (d10, White POV): -2.50"));
    assert(contains(learned, "CRITICAL: ply 4 (Black) Nc6  +0.90 -> -2.50  (delta 3.40)"));
    assert((lastMovesSeen == std::vector<std::string>{"e2e4", "e7e5", "g1f3", "b8c6", "d2d4", "e5d4"}));

    std::filesystem::remove(path);
  }

  // a dry run skips a name repeated within the file, like the real import
  {
    const auto path = std::filesystem::temp_directory_path() / "repertoire_commands_dup.tsv";
    {
      std::ofstream f(path);
      f << "Queen Pawn\t1. d4 d5\n"
        << "Queen Pawn\t1. d4 Nf6\n";
    }

    const auto dry = run({"import", path.string(), "--dry-run"});
    assert(contains(dry, "would add Queen Pawn: d4 d5"));
    assert(!contains(dry, "would add Queen Pawn: d4 Nf6"));
    assert(contains(dry, "Would import 1 openings, skipped 1 existing."));

    const auto real = run({"import", path.string()});
    assert(contains(real, "Imported 1 openings, skipped 1 existing."));
    assert(contains(run({"show", "Queen Pawn"}), "d4 d5"));

    std::filesystem::remove(path);
  }

  {
    std::istringstream in("name\t 1.e4 e5\n  \n#skip\n\t1. d4\nbare line\n");
    const auto rows = parseImportRows(in);
    assert(rows.size() == 3);
    assert(rows[0].name == "name" && rows[0].pgn == "1.e4 e5");
    assert(rows[1].name == "Imported line 1");
    assert(rows[2].name == "Imported line 2" && rows[2].pgn == "bare line");
  }

  return 0;
}
