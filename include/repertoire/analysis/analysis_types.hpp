#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "repertoire/constants.hpp"
#include "repertoire/errors.hpp"

namespace repertoire::analysis
{
  enum class Side
  {
    White,
    Black
  };

  inline Side opposite(Side s)
  {
    return s == Side::White ? Side::Black : Side::White;
  }

  inline const char *sideName(Side s)
  {
    return s == Side::White ? "White" : "Black";
  }

  // Start position plus the coordinate moves played from it, the shape a
  // UCI "position" command takes.
  struct PositionState
  {
    std::string startFen{core::START_FEN};
    std::vector<std::string> moves;
    Side sideToMove{Side::White};

    static PositionState initial() { return PositionState{}; }
    bool isStartpos() const { return startFen == core::START_FEN; }
  };

  // One evaluation from White's point of view. Normally at most one of
  // cp / mateIn is set; neither means the engine reported no score. A mate
  // already on the board is mateIn == 0 with cp holding +/-MATE_SCORE.
  struct EngineScore
  {
    std::optional<int> cp;
    std::optional<int> mateIn; // > 0: White mates
    std::optional<std::string> bestMove;
    std::vector<std::string> pv;
    int depth{0};
  };

  struct ScoreView
  {
    int numeric{0}; // centipawns, or +/-MATE_SCORE
    std::string display;
  };

  // Maps a White-POV engine score onto a comparable number and a short label
  // ("+0.35", "M3", "?").
  ScoreView toScoreView(const EngineScore &score);

  // Signed pawn value, two decimals: 35 -> "+0.35".
  std::string formatCentipawns(int cp);

  struct PlySwing
  {
    std::size_t ply{0};
    std::string token;
    int before{0};
    int after{0};
    int delta{0};
  };

  struct SwingReport
  {
    std::vector<PlySwing> plies;
    ScoreView startScore;
    ScoreView finalScore;

    std::optional<std::size_t> swingPly; // 0-based; empty for a line without moves
    Side swingSide{Side::White};
    std::string swingToken;
    std::string swingBefore;
    std::string swingAfter;
    int swingDelta{0};
    bool critical{false};
    bool complete{false};
  };

  class OracleUnavailable : public Error
  {
  public:
    explicit OracleUnavailable(const std::string &what) : Error("evaluation oracle unavailable: " + what) {}
    OracleUnavailable(const OracleUnavailable &cause, SwingReport partial)
        : Error(cause.what()), m_partial(std::make_shared<const SwingReport>(std::move(partial))) {}

    // Scan state reached before the failure, when thrown out of analyzeLine.
    const SwingReport *partialReport() const noexcept { return m_partial.get(); }

  private:
    std::shared_ptr<const SwingReport> m_partial;
  };

} // namespace repertoire::analysis
