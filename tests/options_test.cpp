#include <cassert>
#include <string>
#include <vector>

#include "repertoire/app/options.hpp"
#include "repertoire/app/settings.hpp"
#include "repertoire/errors.hpp"

using namespace repertoire;
using namespace repertoire::app;

static bool rejects(const std::vector<std::string> &args)
{
  try
  {
    parse_args(args);
  }
  catch (const UsageError &)
  {
    return true;
  }
  return false;
}

int main()
{
  {
    assert(parse_args({}).command == Command::Help);
    assert(parse_args({"init"}).command == Command::Init);
    assert(parse_args({"quiz", "--help"}).command == Command::Help);
  }

  {
    const auto o = parse_args({"add", "Scotch Game", "--moves", "e4 e5 Nf3 Nc6 d4"});
    assert(o.command == Command::Add);
    assert(o.target == "Scotch Game");
    assert(o.moves == "e4 e5 Nf3 Nc6 d4");
  }

  {
    const auto o = parse_args({"quiz", "--prefix", "Scotch", "--limit", "5", "--tokens", "12", "--dry-run",
                               "--db", "/tmp/r.sqlite3", "--verbose"});
    assert(o.command == Command::Quiz);
    assert(o.prefix == "Scotch");
    assert(o.limitOr(10) == 5);
    assert(o.tokens == 12);
    assert(o.dryRun);
    assert(o.dbPath == std::string("/tmp/r.sqlite3"));
    assert(o.verbose);
  }

  // Per-command defaults
  {
    const auto o = parse_args({"learn", "--no-eval", "--chunk", "6", "--swing-cp", "200"});
    assert(!o.evaluate);
    assert(o.chunk == 6);
    assert(o.swingCp == 200);
    assert(o.limitOr(20) == 20);
    assert(o.depthOr(10) == 10);

    const auto t = parse_args({"tree", "--limit", "1000", "--levels", "4"});
    assert(t.limitOr(200) == 1000);
    assert(t.levels == 4);

    const auto imp = parse_args({"import", "lines.tsv", "--name-prefix", "Scotch Game - "});
    assert(imp.target == "lines.tsv");
    assert(imp.namePrefix == "Scotch Game - ");
  }

  // Bad input
  {
    assert(rejects({"frobnicate"}));
    assert(rejects({"add", "Scotch"}));
    assert(rejects({"note", "Scotch"}));
    assert(rejects({"show"}));
    assert(rejects({"show", "a", "b"}));
    assert(rejects({"list", "--limit"}));
    assert(rejects({"due", "--limit", "0"}));
    assert(rejects({"due", "--limit", "201"}));
    assert(rejects({"learn", "--depth", "31"}));
    assert(rejects({"quiz", "--tokens", "ten"}));
    assert(rejects({"quiz", "--tokens", "10x"}));
    assert(rejects({"list", "--colour"}));
  }

  {
    assert(parseFlag("1"));
    assert(parseFlag("TRUE"));
    assert(parseFlag("yes"));
    assert(!parseFlag("0"));
    assert(!parseFlag(""));
  }

  return 0;
}
