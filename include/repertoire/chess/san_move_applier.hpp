#pragma once

#include <string>
#include <vector>

#include "repertoire/analysis/oracle.hpp"
#include "repertoire/chess/position.hpp"

namespace repertoire::chess
{
  // Plays SAN (or coordinate) tokens on a real board and records them as
  // coordinate moves for the UCI "position" command.
  class SanMoveApplier final : public analysis::MoveApplier
  {
  public:
    analysis::PositionState apply(const analysis::PositionState &position, const std::string &token,
                                  std::size_t ply) override;

    // Board reached by `position`. Throws Error on a bad start FEN and
    // IllegalToken when a recorded move does not fit the board.
    Position board(const analysis::PositionState &position);

  private:
    // last board handed out, so a line replays in linear time
    std::string m_cachedFen;
    std::vector<std::string> m_cachedMoves;
    Position m_cached;
  };

  // Position reached after playing every token from `start`.
  analysis::PositionState playLine(analysis::MoveApplier &applier, const std::vector<std::string> &tokens,
                                   const analysis::PositionState &start = analysis::PositionState::initial());

} // namespace repertoire::chess
