#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace repertoire::app
{
  enum class Command
  {
    Help,
    Init,
    Add,
    Import,
    List,
    Show,
    Note,
    Eval,
    EvalAll,
    Due,
    Quiz,
    Learn,
    Tree
  };

  struct Options
  {
    Command command = Command::Help;
    std::string target; // opening name or import file

    // overrides of Settings
    std::optional<std::string> dbPath;
    std::optional<std::string> enginePath;
    bool verbose = false;

    std::string moves;
    std::string text;
    std::string prefix;
    std::string namePrefix;
    bool dryRun = false;

    std::optional<std::size_t> limit;
    std::optional<int> depth;
    std::size_t tokens = 10;
    std::size_t chunk = 8;
    bool evaluate = true;
    int swingCp = 120;
    std::size_t levels = 3;

    std::size_t limitOr(std::size_t fallback) const { return limit.value_or(fallback); }
    int depthOr(int fallback) const { return depth.value_or(fallback); }
  };

  // args excludes the program name. Throws UsageError.
  Options parse_args(const std::vector<std::string> &args);

  void print_usage(std::ostream &os);

} // namespace repertoire::app
