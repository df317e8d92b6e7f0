#pragma once

#include <optional>
#include <string>

namespace repertoire::app
{
  inline constexpr const char *DEFAULT_DB_PATH = "data/repertoire.sqlite3";

  struct Settings
  {
    std::string dbPath{DEFAULT_DB_PATH};
    std::optional<std::string> enginePath;
    bool verbose = false;

    // REPERTOIRE_DB_PATH, STOCKFISH_PATH, REPERTOIRE_VERBOSE
    static Settings fromEnvironment();
  };

  // "1", "true", "yes", "on" (any case) are true.
  bool parseFlag(const std::string &value);

} // namespace repertoire::app
