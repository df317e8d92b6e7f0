#include "repertoire/chess/san_move_applier.hpp"

#include "repertoire/chess/san_notation.hpp"
#include "repertoire/errors.hpp"

namespace repertoire::chess
{
  namespace
  {
    inline analysis::Side toSide(Color c)
    {
      return c == Color::White ? analysis::Side::White : analysis::Side::Black;
    }
  } // namespace

  Position SanMoveApplier::board(const analysis::PositionState &position)
  {
    if (position.startFen == m_cachedFen && position.moves == m_cachedMoves)
      return m_cached;

    Position pos = Position::fromFen(position.startFen);
    for (std::size_t i = 0; i < position.moves.size(); ++i)
    {
      Move mv;
      if (!notation::fromSan(pos, position.moves[i], mv))
        throw IllegalToken(position.moves[i], i, "not legal in " + pos.toFen());
      pos.doMove(mv);
    }

    m_cachedFen = position.startFen;
    m_cachedMoves = position.moves;
    m_cached = pos;
    return pos;
  }

  analysis::PositionState SanMoveApplier::apply(const analysis::PositionState &position, const std::string &token,
                                                std::size_t ply)
  {
    Position pos = board(position);

    Move mv;
    if (!notation::fromSan(pos, token, mv))
      throw IllegalToken(token, ply, "not legal in " + pos.toFen());
    pos.doMove(mv);

    analysis::PositionState next = position;
    next.moves.push_back(notation::toUci(mv));
    next.sideToMove = toSide(pos.sideToMove());

    m_cachedFen = next.startFen;
    m_cachedMoves = next.moves;
    m_cached = pos;
    return next;
  }

  analysis::PositionState playLine(analysis::MoveApplier &applier, const std::vector<std::string> &tokens,
                                   const analysis::PositionState &start)
  {
    analysis::PositionState pos = start;
    for (std::size_t i = 0; i < tokens.size(); ++i)
      pos = applier.apply(pos, tokens[i], i);
    return pos;
  }

} // namespace repertoire::chess
