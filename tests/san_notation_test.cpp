#include <cassert>
#include <string>
#include <vector>

#include "repertoire/chess/san_move_applier.hpp"
#include "repertoire/chess/san_notation.hpp"
#include "repertoire/constants.hpp"
#include "repertoire/errors.hpp"
#include "repertoire/study/token_sequence.hpp"

using namespace repertoire;
using namespace repertoire::chess;

namespace
{
  Square sq(const char *name)
  {
    return parseSquare(name);
  }

  // Plays SAN tokens from the start position.
  Position after(const std::vector<std::string> &tokens)
  {
    Position pos;
    for (const auto &t : tokens)
    {
      Move mv;
      const bool ok = notation::fromSan(pos, t, mv);
      assert(ok);
      pos.doMove(mv);
    }
    return pos;
  }

  std::string uciOf(const Position &pos, const std::string &token)
  {
    Move mv;
    if (!notation::fromSan(pos, token, mv))
      return {};
    return notation::toUci(mv);
  }
} // namespace

int main()
{
  // Start position
  {
    const Position start;
    assert(start.toFen() == core::START_FEN);
    assert(start.generateLegalMoves().size() == 20);
    assert(uciOf(start, "e4") == "e2e4");
    assert(uciOf(start, "Nf3") == "g1f3");
    assert(uciOf(start, "g1f3") == "g1f3");
    assert(uciOf(start, "e5").empty());
    assert(uciOf(start, "Ke2").empty());
    assert(uciOf(start, "Nf6").empty());
    assert(notation::toSan(start, Move{sq("e2"), sq("e5")}).empty());
  }

  // Clocks, castling rights and en-passant square in the FEN
  {
    const auto castled = after({"e4", "e5", "Nf3", "Nc6", "Bc4", "Bc5", "0-0"});
    assert(castled.toFen() == "r1bqk1nr/pppp1ppp/2n5/2b1p3/2B1P3/5N2/PPPP1PPP/RNBQ1RK1 b kq - 5 4");

    const auto twoSquares = after({"e4", "Nf6", "e5", "d5"});
    assert(twoSquares.toFen() == "rnbqkb1r/ppp1pppp/5n2/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");

    Move ep;
    assert(notation::fromSan(twoSquares, "exd6", ep));
    assert(ep.enPassant);
    Position taken = twoSquares;
    taken.doMove(ep);
    assert(taken.pieceAt(sq("d5")).isNone());
    assert(taken.pieceAt(sq("d6")).type == PieceType::Pawn);
  }

  // Castling is refused through an attacked square
  {
    const auto open = Position::fromFen("4k3/8/8/8/8/8/8/4K2R w K - 0 1");
    assert(uciOf(open, "O-O") == "e1g1");
    const auto guarded = Position::fromFen("4kr2/8/8/8/8/8/8/4K2R w K - 0 1");
    assert(uciOf(guarded, "O-O").empty());
  }

  // Only moves that leave the king safe are legal
  {
    const auto checked = Position::fromFen("4k3/8/8/8/8/8/8/r3K3 w - - 0 1");
    assert(checked.inCheck());
    assert(checked.generateLegalMoves().size() == 3);
    assert(uciOf(checked, "Kf1").empty());
    assert(uciOf(checked, "Kf2") == "e1f2");
  }

  // Disambiguation by file, then by rank
  {
    const auto knights = Position::fromFen("4k3/8/8/8/8/5N2/8/1N2K3 w - - 0 1");
    assert(notation::toSan(knights, Move{sq("b1"), sq("d2")}) == "Nbd2");
    assert(uciOf(knights, "Nfd2") == "f3d2");
    assert(uciOf(knights, "Nd2").empty());

    const auto rooks = Position::fromFen("4k3/8/8/R7/8/8/8/R3K3 w - - 0 1");
    assert(notation::toSan(rooks, Move{sq("a1"), sq("a3")}) == "R1a3");
    assert(uciOf(rooks, "R5a3") == "a5a3");
  }

  // Promotion with and without '='
  {
    const auto pawn = Position::fromFen("8/4P3/8/8/8/8/k7/4K3 w - - 0 1");
    assert(uciOf(pawn, "e8=Q") == "e7e8q");
    assert(uciOf(pawn, "e8N") == "e7e8n");
    assert(uciOf(pawn, "e7e8r") == "e7e8r");
    assert(uciOf(pawn, "e8").empty());
  }

  // Check and mate suffixes
  {
    const auto open = after({"e4", "d6"});
    assert(notation::toSan(open, Move{sq("f1"), sq("b5")}) == "Bb5+");
    assert(uciOf(open, "Bb5+") == "f1b5");
    assert(uciOf(open, "Bb5") == "f1b5");

    const auto almost = after({"f3", "e5", "g4"});
    assert(notation::toSan(almost, Move{sq("d8"), sq("h4")}) == "Qh4#");
    const auto mated = after({"f3", "e5", "g4", "Qh4#"});
    assert(mated.inCheck());
    assert(mated.generateLegalMoves().empty());
  }

  // Malformed FEN is rejected
  {
    for (const char *bad : {"not a fen", "8/8/8/8/8/8/8/8 w - - 0 1",
                            "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1",
                            "rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1"})
    {
      bool threw = false;
      try
      {
        Position::fromFen(bad);
      }
      catch (const Error &)
      {
        threw = true;
      }
      assert(threw);
    }
  }

  // A PGN line becomes coordinate moves for the engine
  {
    SanMoveApplier applier;
    const auto pos = playLine(applier, study::sanitizePgnMoves("1. e4 e5 2. Nf3 Nc6 3. d4 exd4 *"));
    assert((pos.moves == std::vector<std::string>{"e2e4", "e7e5", "g1f3", "b8c6", "d2d4", "e5d4"}));
    assert(pos.sideToMove == analysis::Side::White);
    assert(pos.isStartpos());
    assert(applier.board(pos).toFen() == "r1bqkbnr/pppp1ppp/2n5/8/3pP3/5N2/PPP2PPP/RNBQKB1R w KQkq - 0 4");

    bool threw = false;
    try
    {
      playLine(applier, study::tokenize("e4 e5 Ke3"));
    }
    catch (const IllegalToken &e)
    {
      threw = true;
      assert(e.token() == "Ke3");
      assert(e.ply() == 2);
    }
    assert(threw);
  }

  // Lines may start from any position
  {
    SanMoveApplier applier;
    analysis::PositionState start;
    start.startFen = "4k3/8/8/8/8/8/8/4K2R b K - 0 1";
    start.sideToMove = analysis::Side::Black;

    const auto pos = playLine(applier, {"Kd7", "O-O"}, start);
    assert((pos.moves == std::vector<std::string>{"e8d7", "e1g1"}));
    assert(pos.sideToMove == analysis::Side::Black);
    assert(!pos.isStartpos());
  }

  return 0;
}
