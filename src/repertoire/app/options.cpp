#include "repertoire/app/options.hpp"

#include <map>
#include <stdexcept>

#include "repertoire/errors.hpp"

namespace repertoire::app
{
  namespace
  {
    const std::map<std::string, Command> &commandTable()
    {
      static const std::map<std::string, Command> table = {
          {"help", Command::Help},   {"init", Command::Init},     {"add", Command::Add},
          {"import", Command::Import}, {"list", Command::List},   {"show", Command::Show},
          {"note", Command::Note},   {"eval", Command::Eval},     {"eval-all", Command::EvalAll},
          {"due", Command::Due},     {"quiz", Command::Quiz},     {"learn", Command::Learn},
          {"tree", Command::Tree},
      };
      return table;
    }

    bool takesTarget(Command c)
    {
      switch (c)
      {
      case Command::Add:
      case Command::Import:
      case Command::Show:
      case Command::Note:
      case Command::Eval:
        return true;
      default:
        return false;
      }
    }

    long parseNumber(const std::string &value, const char *name, long lo, long hi)
    {
      long v = 0;
      std::size_t used = 0;
      try
      {
        v = std::stol(value, &used);
      }
      catch (const std::logic_error &)
      {
        throw UsageError(std::string("invalid number for ") + name + ": '" + value + "'");
      }
      if (used != value.size())
        throw UsageError(std::string("invalid number for ") + name + ": '" + value + "'");
      if (v < lo || v > hi)
        throw UsageError(std::string(name) + " must be between " + std::to_string(lo) + " and " +
                         std::to_string(hi));
      return v;
    }
  } // namespace

  void print_usage(std::ostream &os)
  {
    os << "Usage: repertoire <command> [options]\n"
          "Commands:\n"
          "  init                          Create the database schema\n"
          "  add <name> --moves \"...\"      Store an opening line\n"
          "  import <file.tsv>             Import <name>\\t<pgn> lines\n"
          "      [--name-prefix P] [--dry-run]\n"
          "  list [--prefix P]             List stored openings\n"
          "  show <name>                   Moves, notes and latest evaluation\n"
          "  note <name> --text \"...\"      Attach notes to an opening\n"
          "  eval <name> [--depth 14]      Evaluate the final position and store it\n"
          "  eval-all [--depth 14]         Evaluate every opening\n"
          "  due [--prefix P] [--limit 20] What to review today\n"
          "  quiz [--prefix P] [--limit 10] [--tokens 10] [--dry-run]\n"
          "  learn [--prefix P] [--limit 20] [--chunk 8] [--no-eval] [--depth 10] [--swing-cp 120]\n"
          "  tree [--prefix P] [--limit 200] [--levels 3]\n"
          "Global options:\n"
          "  --db <path>                   Database file (env REPERTOIRE_DB_PATH)\n"
          "  --engine <path>               UCI engine binary (env STOCKFISH_PATH)\n"
          "  --verbose                     Trace engine traffic (env REPERTOIRE_VERBOSE)\n";
  }

  Options parse_args(const std::vector<std::string> &args)
  {
    Options o;
    if (args.empty())
      return o;

    const auto it = commandTable().find(args[0]);
    if (it == commandTable().end())
      throw UsageError("unknown command '" + args[0] + "'");
    o.command = it->second;

    const std::size_t n = args.size();
    auto require_value = [&](std::size_t &i, const char *name) -> const std::string &
    {
      if (i + 1 >= n)
        throw UsageError(std::string("missing value for ") + name);
      return args[++i];
    };

    const long limitMax = o.command == Command::Tree ? 1000 : 200;
    const long depthMax = o.command == Command::Learn ? 30 : 99;
    bool haveTarget = false;

    for (std::size_t i = 1; i < n; ++i)
    {
      const std::string &arg = args[i];

      if (arg == "--db")
        o.dbPath = require_value(i, "--db");
      else if (arg == "--engine")
        o.enginePath = require_value(i, "--engine");
      else if (arg == "--verbose")
        o.verbose = true;
      else if (arg == "--moves")
        o.moves = require_value(i, "--moves");
      else if (arg == "--text")
        o.text = require_value(i, "--text");
      else if (arg == "--prefix")
        o.prefix = require_value(i, "--prefix");
      else if (arg == "--name-prefix")
        o.namePrefix = require_value(i, "--name-prefix");
      else if (arg == "--dry-run")
        o.dryRun = true;
      else if (arg == "--limit")
        o.limit = static_cast<std::size_t>(parseNumber(require_value(i, "--limit"), "--limit", 1, limitMax));
      else if (arg == "--depth")
        o.depth = static_cast<int>(parseNumber(require_value(i, "--depth"), "--depth", 1, depthMax));
      else if (arg == "--tokens")
        o.tokens = static_cast<std::size_t>(parseNumber(require_value(i, "--tokens"), "--tokens", 2, 60));
      else if (arg == "--chunk")
        o.chunk = static_cast<std::size_t>(parseNumber(require_value(i, "--chunk"), "--chunk", 4, 20));
      else if (arg == "--eval")
        o.evaluate = true;
      else if (arg == "--no-eval")
        o.evaluate = false;
      else if (arg == "--swing-cp")
        o.swingCp = static_cast<int>(parseNumber(require_value(i, "--swing-cp"), "--swing-cp", 10, 2000));
      else if (arg == "--levels")
        o.levels = static_cast<std::size_t>(parseNumber(require_value(i, "--levels"), "--levels", 1, 6));
      else if (arg == "-h" || arg == "--help")
        o.command = Command::Help;
      else if (arg.rfind("--", 0) == 0)
        throw UsageError("unknown option '" + arg + "'");
      else if (takesTarget(o.command) && !haveTarget)
      {
        o.target = arg;
        haveTarget = true;
      }
      else
        throw UsageError("unexpected argument '" + arg + "'");
    }

    if (o.command == Command::Help)
      return o;
    if (takesTarget(o.command) && !haveTarget)
      throw UsageError(o.command == Command::Import ? "missing TSV file path" : "missing opening name");
    if (o.command == Command::Add && o.moves.empty())
      throw UsageError("add requires --moves");
    if (o.command == Command::Note && o.text.empty())
      throw UsageError("note requires --text");

    return o;
  }

} // namespace repertoire::app
