#pragma once

#include <string>
#include <string_view>

#include "repertoire/chess/position.hpp"

namespace repertoire::chess::notation
{
  // SAN for a legal move, with +/# suffix; empty when `mv` is not legal here.
  std::string toSan(const Position &pos, const Move &mv);

  // Coordinate form ("e2e4", "e7e8q") as UCI engines expect it.
  std::string toUci(const Move &mv);

  // Finds the legal move named by a SAN token (annotations and check marks
  // ignored, 0-0 accepted for O-O) or by a coordinate token.
  bool fromSan(const Position &pos, std::string_view sanToken, Move &out);

} // namespace repertoire::chess::notation
