#pragma once

#include "repertoire/analysis/analysis_types.hpp"
#include "repertoire/analysis/oracle.hpp"
#include "repertoire/study/token_sequence.hpp"

namespace repertoire::analysis
{
  struct SwingOptions
  {
    int depth = 10;
    int criticalCp = 120; // swings at or above this are flagged critical
  };

  class SwingDetector
  {
  public:
    SwingDetector(MoveApplier &applier, EvaluationOracle &oracle, SwingOptions opts = {})
        : m_applier(applier), m_oracle(oracle), m_opts(opts) {}

    // Evaluates the start position and every ply of the line and reports the
    // ply with the largest score change; the first one wins ties.
    // IllegalToken propagates as is; OracleUnavailable is rethrown carrying
    // the partial report.
    SwingReport analyzeLine(const study::TokenSequence &tokens,
                            const PositionState &start = PositionState::initial());

  private:
    ScoreView query(const PositionState &pos);

    MoveApplier &m_applier;
    EvaluationOracle &m_oracle;
    SwingOptions m_opts;
  };

} // namespace repertoire::analysis
