#include "repertoire/analysis/swing_detector.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace repertoire::analysis
{
  std::string formatCentipawns(int cp)
  {
    std::ostringstream os;
    os << std::showpos << std::fixed << std::setprecision(2) << cp / 100.0;
    return os.str();
  }

  ScoreView toScoreView(const EngineScore &score)
  {
    if (score.mateIn)
    {
      const int m = *score.mateIn;
      const bool whiteWins = m > 0 || (m == 0 && score.cp && *score.cp > 0);
      return {whiteWins ? core::MATE_SCORE : -core::MATE_SCORE, "M" + std::to_string(m)};
    }
    if (score.cp)
      return {*score.cp, formatCentipawns(*score.cp)};
    return {0, "?"};
  }

  ScoreView SwingDetector::query(const PositionState &pos)
  {
    return toScoreView(m_oracle.evaluate(pos, m_opts.depth));
  }

  SwingReport SwingDetector::analyzeLine(const study::TokenSequence &tokens, const PositionState &start)
  {
    SwingReport report;
    PositionState pos = start;

    try
    {
      ScoreView prev = query(pos);
      report.startScore = prev;
      report.finalScore = prev;

      int bestAbs = -1;
      for (std::size_t idx = 0; idx < tokens.size(); ++idx)
      {
        const Side mover = pos.sideToMove;
        pos = m_applier.apply(pos, tokens[idx], idx);
        ScoreView now = query(pos);

        PlySwing ps;
        ps.ply = idx;
        ps.token = tokens[idx];
        ps.before = prev.numeric;
        ps.after = now.numeric;
        ps.delta = now.numeric - prev.numeric;
        report.plies.push_back(ps);

        if (std::abs(ps.delta) > bestAbs)
        {
          bestAbs = std::abs(ps.delta);
          report.swingPly = idx;
          report.swingSide = mover;
          report.swingToken = tokens[idx];
          report.swingBefore = prev.display;
          report.swingAfter = now.display;
          report.swingDelta = ps.delta;
          report.critical = bestAbs >= m_opts.criticalCp;
        }

        report.finalScore = now;
        prev = std::move(now);
      }
    }
    catch (const OracleUnavailable &e)
    {
      throw OracleUnavailable(e, std::move(report));
    }

    report.complete = true;
    return report;
  }

} // namespace repertoire::analysis
