#pragma once

#include <chrono>
#include <string>

#include "repertoire/analysis/oracle.hpp"
#include "repertoire/engine/uci_engine_process.hpp"

namespace repertoire::engine
{
  struct EvaluatorOptions
  {
    int threads = 1;
    int hashMb = 64;
    std::chrono::milliseconds searchTimeout{std::chrono::seconds(60)};
    bool trace = false;
  };

  // Evaluation oracle backed by a UCI engine process (Stockfish or any
  // other UCI engine). One process serves every query sequentially.
  class UciEvaluator final : public analysis::EvaluationOracle
  {
  public:
    // Spawns the engine and completes the handshake. Throws OracleUnavailable.
    UciEvaluator(const std::string &exePath, EvaluatorOptions opts = {});
    ~UciEvaluator() override;

    UciEvaluator(const UciEvaluator &) = delete;
    UciEvaluator &operator=(const UciEvaluator &) = delete;

    analysis::EngineScore evaluate(const analysis::PositionState &position, int depth) override;

  private:
    UciEngineProcess m_proc;
    UciEngineProcess::Id m_id;
    EvaluatorOptions m_opts;
  };

} // namespace repertoire::engine
