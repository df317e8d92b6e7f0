#include "repertoire/engine/engine_locator.hpp"

#include <cstdlib>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace repertoire::engine
{
  namespace
  {
    bool isExecutableFile(const fs::path &p)
    {
      std::error_code ec;
      if (!fs::exists(p, ec) || fs::is_directory(p, ec))
        return false;
      return ::access(p.c_str(), X_OK) == 0;
    }

    fs::path executableDir(const char *argv0)
    {
      std::error_code ec;
      fs::path exePath = fs::read_symlink("/proc/self/exe", ec);
      if (ec && argv0 && *argv0)
        exePath = fs::absolute(fs::path(argv0), ec);
      if (ec || exePath.empty())
        return {};
      return exePath.parent_path();
    }
  } // namespace

  std::optional<fs::path> find_stockfish_in_dir(const fs::path &dir)
  {
    if (dir.empty())
      return std::nullopt;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
      return std::nullopt;

    const fs::path exact = dir / "stockfish";
    if (isExecutableFile(exact))
      return exact;
    for (fs::directory_iterator it{dir, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec))
    {
      const auto stem = it->path().stem().string();
      if (stem.rfind("stockfish", 0) == 0 && isExecutableFile(it->path()))
        return it->path();
    }
    return std::nullopt;
  }

  std::optional<fs::path> find_stockfish_on_path()
  {
    const char *path = std::getenv("PATH");
    if (!path || !*path)
      return std::nullopt;

    const char sep = ':';
    std::istringstream is(path);
    std::string dir;
    while (std::getline(is, dir, sep))
    {
      if (dir.empty())
        continue;
      const fs::path candidate = fs::path(dir) / "stockfish";
      if (isExecutableFile(candidate))
        return candidate;
    }
    return std::nullopt;
  }

  std::optional<fs::path> resolve_engine_path(const std::optional<std::string> &explicitPath,
                                              const char *argv0)
  {
    if (explicitPath && !explicitPath->empty())
      return fs::path(*explicitPath);
    if (auto p = find_stockfish_on_path())
      return p;
    return find_stockfish_in_dir(executableDir(argv0));
  }

} // namespace repertoire::engine
