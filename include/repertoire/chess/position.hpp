#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace repertoire::chess
{
  using Square = std::uint8_t;
  constexpr Square NO_SQUARE = 64;

  enum class PieceType : std::uint8_t
  {
    None = 0,
    Pawn,
    Knight,
    Bishop,
    Rook,
    Queen,
    King
  };

  enum class Color : std::uint8_t
  {
    White = 0,
    Black = 1
  };

  constexpr Color operator~(Color c) noexcept
  {
    return c == Color::White ? Color::Black : Color::White;
  }

  enum class CastleSide : std::uint8_t
  {
    None = 0,
    KingSide,
    QueenSide
  };

  enum Castling : std::uint8_t
  {
    WK = 1 << 0,
    WQ = 1 << 1,
    BK = 1 << 2,
    BQ = 1 << 3
  };

  struct Piece
  {
    PieceType type = PieceType::None;
    Color color = Color::White;

    constexpr bool isNone() const noexcept { return type == PieceType::None; }
  };

  struct Move
  {
    Square from{NO_SQUARE};
    Square to{NO_SQUARE};
    PieceType promotion{PieceType::None};
    bool capture{false};
    bool enPassant{false};
    CastleSide castle{CastleSide::None};

    // from/to/promotion only
    friend constexpr bool operator==(const Move &a, const Move &b) noexcept
    {
      return a.from == b.from && a.to == b.to && a.promotion == b.promotion;
    }
    friend constexpr bool operator!=(const Move &a, const Move &b) noexcept { return !(a == b); }
  };

  struct GameState
  {
    std::uint32_t fullmoveNumber = 1;
    std::uint16_t halfmoveClock = 0;
    std::uint8_t castlingRights = WK | WQ | BK | BQ;
    Color sideToMove = Color::White;
    Square enPassantSquare = NO_SQUARE;
  };

  constexpr int file_of(Square s) noexcept { return s & 7; }
  constexpr int rank_of(Square s) noexcept { return s >> 3; }

  std::string squareName(Square s);
  // NO_SQUARE unless `text` is exactly a square such as "e4".
  Square parseSquare(std::string_view text);

  // Mailbox board with the rules needed to replay and name opening moves.
  class Position
  {
  public:
    // Standard start position.
    Position();

    // Throws repertoire::Error on a malformed placement or side field.
    // Missing castling, en-passant and clock fields take their defaults.
    static Position fromFen(const std::string &fen);
    std::string toFen() const;

    Piece pieceAt(Square sq) const { return m_board[sq]; }
    const GameState &getState() const { return m_state; }
    Color sideToMove() const { return m_state.sideToMove; }

    bool inCheck() const { return isKingInCheck(m_state.sideToMove); }
    bool isKingInCheck(Color c) const;
    bool isSquareAttacked(Square sq, Color by) const;

    std::vector<Move> generateLegalMoves() const;

    // `m` must come from generateLegalMoves() of this position.
    void doMove(const Move &m);

  private:
    struct EmptyBoard
    {
    };
    explicit Position(EmptyBoard) {}

    std::array<Piece, 64> m_board{};
    GameState m_state;

    void generatePseudoMoves(std::vector<Move> &out) const;
    void addPawnMoves(Square from, std::vector<Move> &out) const;
    void addCastles(std::vector<Move> &out) const;
    Square kingSquare(Color c) const;
  };

} // namespace repertoire::chess
