#include "repertoire/engine/uci_evaluator.hpp"

#include <algorithm>
#include <iostream>

#include "repertoire/engine/uci_parse.hpp"

namespace repertoire::engine
{
  UciEvaluator::UciEvaluator(const std::string &exePath, EvaluatorOptions opts) : m_opts(opts)
  {
    if (exePath.empty())
      throw analysis::OracleUnavailable("UCI engine path is empty");

    m_proc.setTrace(m_opts.trace);
    if (!m_proc.start(exePath))
      throw analysis::OracleUnavailable("could not start " + exePath);
    if (!m_proc.uciHandshake(m_id))
    {
      m_proc.stop();
      throw analysis::OracleUnavailable(exePath + " did not complete the UCI handshake");
    }

    m_proc.setOption("Threads", std::to_string(std::max(1, m_opts.threads)));
    m_proc.setOption("Hash", std::to_string(std::max(1, m_opts.hashMb)));
    m_proc.newGame();
    if (!m_proc.waitReady())
    {
      m_proc.stop();
      throw analysis::OracleUnavailable(exePath + " is not responding");
    }

    if (m_opts.trace)
      std::cerr << "[UciEvaluator] using " << (m_id.name.empty() ? exePath : m_id.name) << "\n";
  }

  UciEvaluator::~UciEvaluator()
  {
    m_proc.stop();
  }

  analysis::EngineScore UciEvaluator::evaluate(const analysis::PositionState &position, int depth)
  {
    if (!m_proc.running())
      throw analysis::OracleUnavailable("engine process has exited");

    m_proc.position(position);
    m_proc.goFixedDepth(std::max(1, depth));

    const auto deadline = std::chrono::steady_clock::now() + m_opts.searchTimeout;
    std::optional<uci::InfoLine> best;

    for (;;)
    {
      auto line = m_proc.waitLine(deadline);
      if (!line)
      {
        if (m_proc.running())
        {
          m_proc.stopSearch();
          throw analysis::OracleUnavailable("search timed out at depth " + std::to_string(depth));
        }
        throw analysis::OracleUnavailable("engine process exited during search");
      }

      if (auto info = uci::parseInfoLine(*line))
      {
        // keep the deepest exact score of the principal line
        if (info->multipv == 1 && !info->bound && (!best || info->depth >= best->depth))
          best = std::move(info);
        continue;
      }

      bool isBest = false;
      auto bestMove = uci::parseBestmove(*line, isBest);
      if (!isBest)
        continue;

      analysis::EngineScore score;
      if (best)
        score = uci::toWhitePov(*best, position.sideToMove);
      if (bestMove)
        score.bestMove = bestMove;
      score.depth = best ? best->depth : depth;
      return score;
    }
  }

} // namespace repertoire::engine
