#pragma once

#include <string>

#include "repertoire/analysis/analysis_types.hpp"

namespace repertoire::analysis
{
  class EvaluationOracle
  {
  public:
    virtual ~EvaluationOracle() = default;

    // White-POV score of the position. Throws OracleUnavailable.
    virtual EngineScore evaluate(const PositionState &position, int depth) = 0;
  };

  class MoveApplier
  {
  public:
    virtual ~MoveApplier() = default;

    // Position after `token`, played as ply number `ply` (0-based).
    // Throws IllegalToken.
    virtual PositionState apply(const PositionState &position, const std::string &token,
                                std::size_t ply) = 0;
  };

} // namespace repertoire::analysis
