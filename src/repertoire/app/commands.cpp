#include "repertoire/app/commands.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

#include "repertoire/analysis/swing_detector.hpp"
#include "repertoire/chess/san_move_applier.hpp"
#include "repertoire/constants.hpp"
#include "repertoire/errors.hpp"
#include "repertoire/store/schema.hpp"
#include "repertoire/study/opening_tree.hpp"
#include "repertoire/study/quiz_checker.hpp"
#include "repertoire/study/recall_scheduler.hpp"

namespace repertoire::app
{
  namespace
  {
    std::string trim(const std::string &s)
    {
      const auto b = s.find_first_not_of(" \t\r\n");
      if (b == std::string::npos)
        return {};
      const auto e = s.find_last_not_of(" \t\r\n");
      return s.substr(b, e - b + 1);
    }

    std::size_t nameWidth(const std::vector<std::string> &names)
    {
      std::size_t w = 4;
      for (const auto &n : names)
        w = std::max(w, n.size());
      return w + 2;
    }

    std::string twoDigits(std::size_t n)
    {
      std::ostringstream os;
      os << std::setw(2) << std::setfill('0') << n;
      return os.str();
    }

    void printNoneFound(std::ostream &out, const std::string &prefix)
    {
      out << "No openings found for prefix '" << prefix << "'.\n";
    }

    void printTreeNodes(std::ostream &out, const std::vector<study::TreeNode> &nodes, const std::string &indent)
    {
      for (const auto &n : nodes)
      {
        out << indent << n.branch.token << "  (" << n.branch.count << ")  ";
        for (std::size_t i = 0; i < n.branch.exampleNames.size(); ++i)
          out << (i ? ", " : "") << n.branch.exampleNames[i];
        out << "\n";
        printTreeNodes(out, n.children, indent + "  ");
      }
    }
  } // namespace

  Clock Clock::system()
  {
    Clock c;
    c.now = std::chrono::system_clock::now();
    c.today = study::dateOf(c.now);
    return c;
  }

  std::vector<ImportRow> parseImportRows(std::istream &in)
  {
    std::vector<ImportRow> rows;
    std::size_t autoIndex = 1;
    std::string raw;
    while (std::getline(in, raw))
    {
      const std::string line = trim(raw);
      if (line.empty() || line[0] == '#')
        continue;

      ImportRow row;
      const auto tab = line.find('\t');
      if (tab != std::string::npos)
      {
        row.name = trim(line.substr(0, tab));
        row.pgn = trim(line.substr(tab + 1));
      }
      else
      {
        row.pgn = line;
      }
      if (row.name.empty())
        row.name = "Imported line " + std::to_string(autoIndex++);
      rows.push_back(std::move(row));
    }
    return rows;
  }

  CommandRunner::CommandRunner(store::Database &db, OracleFactory makeOracle, std::istream &in, std::ostream &out,
                               std::ostream &err)
      : m_db(db), m_openings(db), m_study(db), m_annotations(db), m_makeOracle(std::move(makeOracle)), m_in(in),
        m_out(out), m_err(err)
  {
  }

  int CommandRunner::run(const Options &o, const Clock &clock)
  {
    if (o.command == Command::Help)
    {
      print_usage(m_out);
      return 0;
    }

    store::initSchema(m_db);

    switch (o.command)
    {
    case Command::Init:
      return init();
    case Command::Add:
      return add(o);
    case Command::Import:
      return importFile(o);
    case Command::List:
      return list(o);
    case Command::Show:
      return show(o);
    case Command::Note:
      return note(o);
    case Command::Eval:
      return eval(o);
    case Command::EvalAll:
      return evalAll(o);
    case Command::Due:
      return due(o, clock);
    case Command::Quiz:
      return quiz(o, clock);
    case Command::Learn:
      return learn(o);
    case Command::Tree:
      return tree(o);
    case Command::Help:
      break;
    }
    return 0;
  }

  study::OpeningLine CommandRunner::requireOpening(const std::string &name)
  {
    auto line = m_openings.findByName(name);
    if (!line)
      throw UsageError("no opening named '" + name + "'");
    return *line;
  }

  std::string CommandRunner::prompt(const std::string &question)
  {
    m_out << question << std::flush;
    std::string answer;
    if (!std::getline(m_in, answer))
      answer.clear();
    return trim(answer);
  }

  analysis::EngineScore CommandRunner::evaluateFinal(analysis::EvaluationOracle &oracle,
                                                     const study::OpeningLine &line, int depth)
  {
    chess::SanMoveApplier applier;
    const analysis::PositionState pos = chess::playLine(applier, line.tokens);
    return oracle.evaluate(pos, depth);
  }

  int CommandRunner::init()
  {
    m_out << "Initialized " << m_db.path() << "\n";
    return 0;
  }

  int CommandRunner::add(const Options &o)
  {
    const auto tokens = study::tokenize(o.moves);
    chess::SanMoveApplier applier;
    chess::playLine(applier, tokens);

    const auto line = m_openings.add(o.target, tokens);
    m_out << "Added " << line.name << " (" << line.tokens.size() << " plies)\n";
    return 0;
  }

  int CommandRunner::importFile(const Options &o)
  {
    std::ifstream in(o.target);
    if (!in)
      throw Error("cannot open " + o.target);

    const auto rows = parseImportRows(in);
    std::size_t added = 0, skipped = 0, empty = 0, illegal = 0;
    std::set<std::string> seen;
    chess::SanMoveApplier applier;

    store::Transaction tx(m_db);
    for (const auto &row : rows)
    {
      const std::string name = o.namePrefix + row.name;
      const auto tokens = study::sanitizePgnMoves(row.pgn);
      if (tokens.empty())
      {
        m_err << "[Import] no moves in row '" << name << "', skipped\n";
        ++empty;
        continue;
      }
      if (seen.count(name) || m_openings.findByName(name))
      {
        ++skipped;
        continue;
      }
      try
      {
        chess::playLine(applier, tokens);
      }
      catch (const IllegalToken &e)
      {
        m_err << "[Import] " << name << ": " << e.what() << ", skipped\n";
        ++illegal;
        continue;
      }

      seen.insert(name);
      if (o.dryRun)
        m_out << "would add " << name << ": " << study::joinTokens(tokens) << "\n";
      else
        m_openings.add(name, tokens);
      ++added;
    }
    if (!o.dryRun)
      tx.commit();

    m_out << (o.dryRun ? "Would import " : "Imported ") << added << " openings, skipped " << skipped
          << " existing";
    if (empty)
      m_out << ", " << empty << " without moves";
    if (illegal)
      m_out << ", " << illegal << " with illegal moves";
    m_out << ".\n";
    return 0;
  }

  int CommandRunner::list(const Options &o)
  {
    const auto lines = m_openings.listByPrefix(o.prefix);
    if (lines.empty())
    {
      m_out << "No openings stored yet.\n";
      return 0;
    }

    std::vector<std::string> names;
    for (const auto &l : lines)
      names.push_back(l.name);
    const std::size_t w = nameWidth(names);

    m_out << std::left << std::setw(static_cast<int>(w)) << "Name" << "Moves\n";
    for (const auto &l : lines)
      m_out << std::left << std::setw(static_cast<int>(w)) << l.name << study::joinTokens(l.tokens) << "\n";
    return 0;
  }

  int CommandRunner::show(const Options &o)
  {
    const auto line = requireOpening(o.target);
    m_out << line.name << "\n" << study::joinTokens(line.tokens) << "\n";
    m_out << "Plies: " << line.tokens.size() << "\n";

    chess::SanMoveApplier applier;
    try
    {
      m_out << "FEN: " << applier.board(chess::playLine(applier, line.tokens)).toFen() << "\n";
    }
    catch (const IllegalToken &e)
    {
      m_err << "[Show] " << e.what() << "\n";
    }

    if (auto state = m_study.find(line.id))
    {
      m_out << "Next review: " << study::formatDate(state->dueDate) << " (interval " << state->intervalDays
            << "d, ease " << std::fixed << std::setprecision(2) << state->ease << ", reps " << state->reps
            << ", lapses " << state->lapses << ")\n";
      m_out.unsetf(std::ios::floatfield);
    }

    if (auto notes = m_annotations.notes(line.id))
      m_out << "\nNotes\n" << *notes << "\n";

    if (auto ev = m_annotations.latestEvaluation(line.id))
    {
      m_out << "Latest eval @ depth " << ev->score.depth << ": " << analysis::toScoreView(ev->score).display;
      if (ev->score.bestMove)
        m_out << "  bestmove " << *ev->score.bestMove;
      m_out << "  (" << ev->analyzedAt << ")\n";
    }
    return 0;
  }

  int CommandRunner::note(const Options &o)
  {
    const auto line = requireOpening(o.target);
    m_annotations.setNotes(line.id, trim(o.text));
    m_out << "Saved notes for " << line.name << "\n";
    return 0;
  }

  int CommandRunner::eval(const Options &o)
  {
    const auto line = requireOpening(o.target);
    const int depth = o.depthOr(14);

    auto oracle = m_makeOracle();
    const auto score = evaluateFinal(*oracle, line, depth);
    const auto stored = m_annotations.storeEvaluation(line.id, score);

    m_out << line.name << " @ depth " << stored.score.depth << ": " << analysis::toScoreView(stored.score).display
          << "\n";
    if (stored.score.bestMove)
      m_out << "bestmove: " << *stored.score.bestMove << "\n";
    if (!stored.score.pv.empty())
      m_out << "pv: " << study::joinTokens(stored.score.pv) << "\n";
    return 0;
  }

  int CommandRunner::evalAll(const Options &o)
  {
    const auto lines = m_openings.listAll();
    if (lines.empty())
    {
      m_out << "No openings stored yet.\n";
      return 0;
    }

    const int depth = o.depthOr(14);
    auto oracle = m_makeOracle();

    std::vector<std::string> names;
    for (const auto &l : lines)
      names.push_back(l.name);
    const int w = static_cast<int>(nameWidth(names));

    m_out << "Evaluations (depth " << depth << ")\n";
    m_out << std::left << std::setw(w) << "Opening" << std::setw(10) << "Score" << "Bestmove\n";
    std::size_t failed = 0;
    for (const auto &l : lines)
    {
      try
      {
        const auto stored = m_annotations.storeEvaluation(l.id, evaluateFinal(*oracle, l, depth));
        m_out << std::left << std::setw(w) << l.name << std::setw(10) << analysis::toScoreView(stored.score).display
              << stored.score.bestMove.value_or("") << "\n";
      }
      catch (const IllegalToken &e)
      {
        m_err << "[EvalAll] " << l.name << ": " << e.what() << "\n";
        ++failed;
      }
    }
    return failed ? 1 : 0;
  }

  int CommandRunner::due(const Options &o, const Clock &clock)
  {
    m_study.ensureStates(o.prefix, clock.today);
    const auto picked = study::pickDue(m_study.listScheduled(o.prefix), clock.today, o.limitOr(20));

    std::vector<study::ScheduledOpening> dueNow;
    for (const auto &p : picked)
      if (p.dueDate <= clock.today)
        dueNow.push_back(p);

    if (dueNow.empty())
    {
      m_out << "Nothing due today for prefix '" << o.prefix << "'.\n";
      return 0;
    }

    std::vector<std::string> names;
    for (const auto &d : dueNow)
      names.push_back(d.opening.name);
    const int w = static_cast<int>(nameWidth(names));

    m_out << "Due today (prefix: " << o.prefix << ")\n";
    m_out << std::left << std::setw(w) << "Opening" << "Due\n";
    for (const auto &d : dueNow)
      m_out << std::left << std::setw(w) << d.opening.name << study::formatDate(d.dueDate) << "\n";
    return 0;
  }

  int CommandRunner::quiz(const Options &o, const Clock &clock)
  {
    const std::size_t created = m_study.ensureStates(o.prefix, clock.today);
    const auto picked = study::pickDue(m_study.listScheduled(o.prefix), clock.today, o.limitOr(10));

    if (created)
      m_out << "Created " << created << " study cards.\n";
    if (picked.empty())
    {
      printNoneFound(m_out, o.prefix);
      return 0;
    }

    study::RecallScheduler scheduler(m_study);
    for (const auto &item : picked)
    {
      const auto &line = item.opening;
      m_out << "\n" << line.name << "  (due " << study::formatDate(item.dueDate) << ")\n";

      if (o.dryRun)
      {
        const std::size_t n = std::min(o.tokens, line.tokens.size());
        const study::TokenSequence answer(line.tokens.begin(), line.tokens.begin() + static_cast<std::ptrdiff_t>(n));
        m_out << "Answer: " << study::joinTokens(answer) << "\n";
        continue;
      }

      const std::string typed = prompt("Type first " + std::to_string(o.tokens) + " moves: ");
      const auto result = study::check(line.tokens, typed, o.tokens);

      if (result.fullyCorrect())
      {
        m_out << "Correct (" << result.correctTokens << "/" << result.targetTokens() << ")\n";
      }
      else
      {
        m_out << "Partial (" << result.correctTokens << "/" << result.targetTokens() << ")\n";
        m_out << "Answer: " << study::joinTokens(result.target) << "\n";
      }

      const std::string gradeText = prompt("Grade your recall (0..5) [4]: ");
      int grade = 4;
      if (!gradeText.empty())
      {
        std::size_t used = 0;
        try
        {
          grade = std::stoi(gradeText, &used);
        }
        catch (const std::logic_error &)
        {
          used = 0;
        }
        if (used != gradeText.size())
          throw UsageError("grade must be an integer 0..5");
      }

      study::ReviewContext ctx;
      ctx.prompt = line.name;
      ctx.typedMoves = typed;
      ctx.correctTokens = static_cast<int>(result.correctTokens);
      ctx.targetTokens = static_cast<int>(result.targetTokens());

      const auto state = scheduler.applyGrade(line.id, grade, ctx, clock.today, clock.now);
      m_out << "Next review: " << study::formatDate(state.dueDate) << " (in " << state.intervalDays << " days)\n";

      if (auto notes = m_annotations.notes(line.id))
        m_out << "Note: " << *notes << "\n";
    }
    return 0;
  }

  int CommandRunner::learn(const Options &o)
  {
    const auto lines = m_openings.listByPrefix(o.prefix, o.limitOr(20));
    if (lines.empty())
    {
      printNoneFound(m_out, o.prefix);
      return 0;
    }

    const int depth = o.depthOr(10);
    std::unique_ptr<analysis::EvaluationOracle> oracle;
    if (o.evaluate)
    {
      try
      {
        oracle = m_makeOracle();
      }
      catch (const analysis::OracleUnavailable &e)
      {
        m_err << "[Learn] " << e.what() << "\n";
        m_err << "[Learn] continuing without eval; install Stockfish or set STOCKFISH_PATH\n";
      }
    }

    chess::SanMoveApplier applier;
    for (const auto &line : lines)
    {
      std::optional<analysis::SwingReport> report;
      if (oracle)
      {
        analysis::SwingDetector detector(applier, *oracle, analysis::SwingOptions{depth, o.swingCp});
        try
        {
          report = detector.analyzeLine(line.tokens);
        }
        catch (const IllegalToken &e)
        {
          m_err << "[Learn] " << line.name << ": " << e.what() << "\n";
        }
        catch (const analysis::OracleUnavailable &e)
        {
          m_err << "[Learn] " << e.what() << "; continuing without eval\n";
          oracle.reset();
        }
      }

      study::TokenSequence shown = line.tokens;
      if (report && report->swingPly)
        shown[*report->swingPly] = "[" + shown[*report->swingPly] + "]";

      m_out << "\n" << line.name << "\n";
      const auto chunks = study::chunkTokens(shown, o.chunk);
      for (std::size_t i = 0; i < chunks.size(); ++i)
        m_out << twoDigits(i + 1) << "  " << chunks[i] << "\n";

      if (!report)
        continue;

      m_out << "Final eval (d" << depth << ", White POV): " << report->finalScore.display << "\n";
      if (report->swingPly)
      {
        std::ostringstream pawns;
        pawns << std::fixed << std::setprecision(2) << std::abs(report->swingDelta) / 100.0;
        m_out << (report->critical ? "CRITICAL" : "Largest swing") << ": ply " << *report->swingPly + 1 << " ("
              << analysis::sideName(report->swingSide) << ") " << report->swingToken << "  " << report->swingBefore
              << " -> " << report->swingAfter << "  (delta " << pawns.str() << ")\n";
      }
    }
    return 0;
  }

  int CommandRunner::tree(const Options &o)
  {
    const auto lines = m_openings.listByPrefix(o.prefix, o.limitOr(200));
    if (lines.empty())
    {
      printNoneFound(m_out, o.prefix);
      return 0;
    }

    const auto t = study::buildTree(lines, o.levels);
    m_out << "Common start (" << t.commonPrefix.size() << " tokens)\n";
    m_out << (t.commonPrefix.empty() ? "(none)" : study::joinTokens(t.commonPrefix)) << "\n";
    m_out << "\nNext branches\n";
    printTreeNodes(m_out, t.roots, "- ");
    return 0;
  }

} // namespace repertoire::app
