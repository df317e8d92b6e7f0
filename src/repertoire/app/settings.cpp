#include "repertoire/app/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace repertoire::app
{
  namespace
  {
    std::optional<std::string> env(const char *name)
    {
      const char *v = std::getenv(name);
      if (!v || !*v)
        return std::nullopt;
      return std::string(v);
    }
  } // namespace

  bool parseFlag(const std::string &value)
  {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
  }

  Settings Settings::fromEnvironment()
  {
    Settings s;
    if (auto p = env("REPERTOIRE_DB_PATH"))
      s.dbPath = *p;
    s.enginePath = env("STOCKFISH_PATH");
    if (auto v = env("REPERTOIRE_VERBOSE"))
      s.verbose = parseFlag(*v);
    return s;
  }

} // namespace repertoire::app
