#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace repertoire::engine
{
  namespace fs = std::filesystem;

  std::optional<fs::path> find_stockfish_in_dir(const fs::path &dir);

  // Looks through every directory of the PATH environment variable.
  std::optional<fs::path> find_stockfish_on_path();

  // explicitPath if given, else PATH, else next to the running executable.
  std::optional<fs::path> resolve_engine_path(const std::optional<std::string> &explicitPath,
                                              const char *argv0);

} // namespace repertoire::engine
