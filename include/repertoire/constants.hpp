#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace repertoire::core
{
  const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  // Branch key used when a line has no token at the inspected ply.
  inline constexpr std::string_view END_TOKEN{"<END>"};

  // Forced mates are folded into this saturating value (White POV).
  inline constexpr int MATE_SCORE = 100000;

  inline constexpr double EASE_MIN = 1.3;
  inline constexpr double EASE_MAX = 3.0;
  inline constexpr double EASE_INITIAL = 2.5;
  inline constexpr int GRADE_MIN = 0;
  inline constexpr int GRADE_MAX = 5;
  inline constexpr int GRADE_PASS = 3;

  inline constexpr std::size_t MAX_BRANCH_EXAMPLES = 5;

  // ------------------ Version ------------------
  inline constexpr std::string_view REPERTOIRE_VERSION{"Repertoire 1.0v"};
}
