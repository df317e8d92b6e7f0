#pragma once

#include <optional>
#include <string>
#include <vector>

#include "repertoire/analysis/analysis_types.hpp"

namespace repertoire::engine::uci
{
  struct InfoLine
  {
    int depth{-1};
    int multipv{1};
    std::optional<int> cp;
    std::optional<int> mate;
    bool bound{false}; // lowerbound / upperbound: not a final score
    std::vector<std::string> pv;
  };

  // Parses "info ... score cp|mate N ... pv ..." lines; nullopt for other
  // lines and for info lines without a score.
  std::optional<InfoLine> parseInfoLine(const std::string &line);

  // "bestmove e2e4 ponder e7e5" -> "e2e4"; "(none)" and "0000" count as no move.
  std::optional<std::string> parseBestmove(const std::string &line, bool &isBestmoveLine);

  // Engine scores are relative to the side to move; flip them for Black.
  analysis::EngineScore toWhitePov(const InfoLine &info, analysis::Side sideToMove);

} // namespace repertoire::engine::uci
