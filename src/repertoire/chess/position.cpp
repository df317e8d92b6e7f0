#include "repertoire/chess/position.hpp"

#include <cctype>

#include "repertoire/constants.hpp"
#include "repertoire/errors.hpp"

namespace repertoire::chess
{
  namespace
  {
    constexpr int KNIGHT_STEPS[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
    constexpr int KING_STEPS[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
    constexpr int ROOK_DIRS[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
    constexpr int BISHOP_DIRS[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};

    constexpr Square A1 = 0, C1 = 2, D1 = 3, E1 = 4, F1 = 5, G1 = 6, H1 = 7;
    constexpr Square A8 = 56, C8 = 58, D8 = 59, E8 = 60, F8 = 61, G8 = 62, H8 = 63;

    inline char tolower_ascii(char c) noexcept
    {
      return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 32) : c;
    }

    // Square `df` files and `dr` ranks away, or NO_SQUARE off the board.
    inline Square offset(Square s, int df, int dr) noexcept
    {
      const int f = file_of(s) + df;
      const int r = rank_of(s) + dr;
      if (f < 0 || f > 7 || r < 0 || r > 7)
        return NO_SQUARE;
      return static_cast<Square>(r * 8 + f);
    }

    inline PieceType pieceFromChar(char lo)
    {
      switch (lo)
      {
      case 'k':
        return PieceType::King;
      case 'q':
        return PieceType::Queen;
      case 'r':
        return PieceType::Rook;
      case 'b':
        return PieceType::Bishop;
      case 'n':
        return PieceType::Knight;
      case 'p':
        return PieceType::Pawn;
      default:
        return PieceType::None;
      }
    }

    inline char charFromPiece(Piece p)
    {
      char ch = '?';
      switch (p.type)
      {
      case PieceType::King:
        ch = 'k';
        break;
      case PieceType::Queen:
        ch = 'q';
        break;
      case PieceType::Rook:
        ch = 'r';
        break;
      case PieceType::Bishop:
        ch = 'b';
        break;
      case PieceType::Knight:
        ch = 'n';
        break;
      case PieceType::Pawn:
        ch = 'p';
        break;
      default:
        break;
      }
      if (p.color == Color::White)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
      return ch;
    }

    int parseCounter(std::string_view sv, int fallback)
    {
      if (sv.empty())
        return fallback;
      int val = 0;
      for (char c : sv)
      {
        if (c < '0' || c > '9')
          throw Error("invalid FEN counter '" + std::string(sv) + "'");
        val = val * 10 + (c - '0');
      }
      return val;
    }

    std::uint8_t rightsLostAt(Square sq)
    {
      switch (sq)
      {
      case A1:
        return WQ;
      case H1:
        return WK;
      case E1:
        return WK | WQ;
      case A8:
        return BQ;
      case H8:
        return BK;
      case E8:
        return BK | BQ;
      default:
        return 0;
      }
    }
  } // namespace

  std::string squareName(Square s)
  {
    std::string out;
    out.push_back(static_cast<char>('a' + file_of(s)));
    out.push_back(static_cast<char>('1' + rank_of(s)));
    return out;
  }

  Square parseSquare(std::string_view text)
  {
    if (text.size() != 2)
      return NO_SQUARE;
    const char f = text[0];
    const char r = text[1];
    if (f < 'a' || f > 'h' || r < '1' || r > '8')
      return NO_SQUARE;
    return static_cast<Square>((r - '1') * 8 + (f - 'a'));
  }

  Position::Position() : Position(fromFen(core::START_FEN)) {}

  Position Position::fromFen(const std::string &fen)
  {
    std::string_view sv{fen};
    std::string_view fields[6]{};
    int count = 0;
    while (!sv.empty() && count < 6)
    {
      const std::size_t sp = sv.find(' ');
      const std::string_view field = sv.substr(0, sp);
      if (!field.empty())
        fields[count++] = field;
      if (sp == std::string_view::npos)
        break;
      sv.remove_prefix(sp + 1);
    }
    if (count < 2)
      throw Error("invalid FEN '" + fen + "': expected placement and side to move");

    Position pos{EmptyBoard{}};

    int rank = 7, file = 0;
    int kings[2] = {0, 0};
    for (char ch : fields[0])
    {
      if (ch == '/')
      {
        if (file != 8 || rank == 0)
          throw Error("invalid FEN '" + fen + "': bad rank layout");
        file = 0;
        --rank;
        continue;
      }
      if (ch >= '1' && ch <= '8')
      {
        file += ch - '0';
        if (file > 8)
          throw Error("invalid FEN '" + fen + "': rank too long");
        continue;
      }
      const char lo = tolower_ascii(ch);
      const PieceType type = pieceFromChar(lo);
      if (type == PieceType::None || file > 7)
        throw Error("invalid FEN '" + fen + "': unexpected '" + std::string(1, ch) + "'");
      const Color col = (ch == lo) ? Color::Black : Color::White;
      if (type == PieceType::King)
        ++kings[static_cast<int>(col)];
      pos.m_board[static_cast<Square>(rank * 8 + file)] = Piece{type, col};
      ++file;
    }
    if (rank != 0 || file != 8)
      throw Error("invalid FEN '" + fen + "': expected 8 ranks");
    if (kings[0] != 1 || kings[1] != 1)
      throw Error("invalid FEN '" + fen + "': each side needs exactly one king");

    if (fields[1] == "w")
      pos.m_state.sideToMove = Color::White;
    else if (fields[1] == "b")
      pos.m_state.sideToMove = Color::Black;
    else
      throw Error("invalid FEN '" + fen + "': side to move must be w or b");

    std::uint8_t rights = 0;
    for (char c : fields[2])
    {
      switch (c)
      {
      case 'K':
        rights |= WK;
        break;
      case 'Q':
        rights |= WQ;
        break;
      case 'k':
        rights |= BK;
        break;
      case 'q':
        rights |= BQ;
        break;
      default:
        break;
      }
    }
    pos.m_state.castlingRights = rights;
    pos.m_state.enPassantSquare = parseSquare(fields[3]);
    pos.m_state.halfmoveClock = static_cast<std::uint16_t>(parseCounter(fields[4], 0));
    const int fm = parseCounter(fields[5], 1);
    pos.m_state.fullmoveNumber = static_cast<std::uint32_t>(fm == 0 ? 1 : fm);
    return pos;
  }

  std::string Position::toFen() const
  {
    std::string fen;
    fen.reserve(100);

    for (int rank = 7; rank >= 0; --rank)
    {
      int empty = 0;
      for (int file = 0; file < 8; ++file)
      {
        const Piece p = m_board[static_cast<Square>(rank * 8 + file)];
        if (p.isNone())
        {
          ++empty;
          continue;
        }
        if (empty)
        {
          fen.push_back(static_cast<char>('0' + empty));
          empty = 0;
        }
        fen.push_back(charFromPiece(p));
      }
      if (empty)
        fen.push_back(static_cast<char>('0' + empty));
      if (rank)
        fen.push_back('/');
    }

    fen.push_back(' ');
    fen.push_back(m_state.sideToMove == Color::White ? 'w' : 'b');
    fen.push_back(' ');

    if (m_state.castlingRights)
    {
      if (m_state.castlingRights & WK)
        fen.push_back('K');
      if (m_state.castlingRights & WQ)
        fen.push_back('Q');
      if (m_state.castlingRights & BK)
        fen.push_back('k');
      if (m_state.castlingRights & BQ)
        fen.push_back('q');
    }
    else
    {
      fen.push_back('-');
    }
    fen.push_back(' ');

    fen += m_state.enPassantSquare == NO_SQUARE ? std::string("-") : squareName(m_state.enPassantSquare);
    fen.push_back(' ');
    fen.append(std::to_string(m_state.halfmoveClock));
    fen.push_back(' ');
    fen.append(std::to_string(m_state.fullmoveNumber));
    return fen;
  }

  Square Position::kingSquare(Color c) const
  {
    for (Square s = 0; s < 64; ++s)
      if (m_board[s].type == PieceType::King && m_board[s].color == c)
        return s;
    return NO_SQUARE;
  }

  bool Position::isKingInCheck(Color c) const
  {
    const Square k = kingSquare(c);
    return k != NO_SQUARE && isSquareAttacked(k, ~c);
  }

  bool Position::isSquareAttacked(Square sq, Color by) const
  {
    auto holds = [&](Square s, PieceType t)
    {
      return s != NO_SQUARE && m_board[s].type == t && m_board[s].color == by;
    };

    // a pawn attacks diagonally forward, so look one rank behind `sq`
    const int back = by == Color::White ? -1 : 1;
    if (holds(offset(sq, -1, back), PieceType::Pawn) || holds(offset(sq, 1, back), PieceType::Pawn))
      return true;

    for (const auto &d : KNIGHT_STEPS)
      if (holds(offset(sq, d[0], d[1]), PieceType::Knight))
        return true;
    for (const auto &d : KING_STEPS)
      if (holds(offset(sq, d[0], d[1]), PieceType::King))
        return true;

    auto slides = [&](const int (&dirs)[4][2], PieceType slider)
    {
      for (const auto &d : dirs)
      {
        Square s = offset(sq, d[0], d[1]);
        while (s != NO_SQUARE)
        {
          const Piece p = m_board[s];
          if (!p.isNone())
          {
            if (p.color == by && (p.type == slider || p.type == PieceType::Queen))
              return true;
            break;
          }
          s = offset(s, d[0], d[1]);
        }
      }
      return false;
    };
    return slides(ROOK_DIRS, PieceType::Rook) || slides(BISHOP_DIRS, PieceType::Bishop);
  }

  void Position::addPawnMoves(Square from, std::vector<Move> &out) const
  {
    const Color us = m_state.sideToMove;
    const int dir = us == Color::White ? 1 : -1;
    const int startRank = us == Color::White ? 1 : 6;
    const int lastRank = us == Color::White ? 7 : 0;

    auto push = [&](Square to, bool capture, bool ep)
    {
      if (rank_of(to) == lastRank)
      {
        for (PieceType promo : {PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight})
          out.push_back(Move{from, to, promo, capture, false, CastleSide::None});
        return;
      }
      out.push_back(Move{from, to, PieceType::None, capture, ep, CastleSide::None});
    };

    const Square one = offset(from, 0, dir);
    if (one != NO_SQUARE && m_board[one].isNone())
    {
      push(one, false, false);
      const Square two = offset(from, 0, 2 * dir);
      if (rank_of(from) == startRank && m_board[two].isNone())
        push(two, false, false);
    }

    for (int df : {-1, 1})
    {
      const Square to = offset(from, df, dir);
      if (to == NO_SQUARE)
        continue;
      const Piece target = m_board[to];
      if (!target.isNone() && target.color != us)
        push(to, true, false);
      else if (target.isNone() && to == m_state.enPassantSquare)
        push(to, true, true);
    }
  }

  void Position::addCastles(std::vector<Move> &out) const
  {
    const Color us = m_state.sideToMove;
    const Color them = ~us;
    const bool white = us == Color::White;
    const Square king = white ? E1 : E8;
    const Piece k = m_board[king];
    if (k.type != PieceType::King || k.color != us || isSquareAttacked(king, them))
      return;

    auto rookAt = [&](Square s)
    {
      return m_board[s].type == PieceType::Rook && m_board[s].color == us;
    };

    const std::uint8_t kingSide = white ? WK : BK;
    if ((m_state.castlingRights & kingSide) && rookAt(white ? H1 : H8))
    {
      const Square f = white ? F1 : F8, g = white ? G1 : G8;
      if (m_board[f].isNone() && m_board[g].isNone() && !isSquareAttacked(f, them) && !isSquareAttacked(g, them))
        out.push_back(Move{king, g, PieceType::None, false, false, CastleSide::KingSide});
    }

    const std::uint8_t queenSide = white ? WQ : BQ;
    if ((m_state.castlingRights & queenSide) && rookAt(white ? A1 : A8))
    {
      const Square d = white ? D1 : D8, c = white ? C1 : C8, b = static_cast<Square>(c - 1);
      if (m_board[d].isNone() && m_board[c].isNone() && m_board[b].isNone() && !isSquareAttacked(d, them) &&
          !isSquareAttacked(c, them))
        out.push_back(Move{king, c, PieceType::None, false, false, CastleSide::QueenSide});
    }
  }

  void Position::generatePseudoMoves(std::vector<Move> &out) const
  {
    const Color us = m_state.sideToMove;

    auto step = [&](Square from, Square to)
    {
      if (to == NO_SQUARE)
        return;
      const Piece target = m_board[to];
      if (target.isNone())
        out.push_back(Move{from, to});
      else if (target.color != us)
        out.push_back(Move{from, to, PieceType::None, true});
    };

    auto slide = [&](Square from, const int (&dirs)[4][2])
    {
      for (const auto &d : dirs)
      {
        Square to = offset(from, d[0], d[1]);
        while (to != NO_SQUARE)
        {
          step(from, to);
          if (!m_board[to].isNone())
            break;
          to = offset(to, d[0], d[1]);
        }
      }
    };

    for (Square from = 0; from < 64; ++from)
    {
      const Piece p = m_board[from];
      if (p.isNone() || p.color != us)
        continue;

      switch (p.type)
      {
      case PieceType::Pawn:
        addPawnMoves(from, out);
        break;
      case PieceType::Knight:
        for (const auto &d : KNIGHT_STEPS)
          step(from, offset(from, d[0], d[1]));
        break;
      case PieceType::Bishop:
        slide(from, BISHOP_DIRS);
        break;
      case PieceType::Rook:
        slide(from, ROOK_DIRS);
        break;
      case PieceType::Queen:
        slide(from, BISHOP_DIRS);
        slide(from, ROOK_DIRS);
        break;
      case PieceType::King:
        for (const auto &d : KING_STEPS)
          step(from, offset(from, d[0], d[1]));
        break;
      default:
        break;
      }
    }
    addCastles(out);
  }

  std::vector<Move> Position::generateLegalMoves() const
  {
    std::vector<Move> pseudo;
    pseudo.reserve(64);
    generatePseudoMoves(pseudo);

    // filter by make on a copy
    std::vector<Move> legal;
    legal.reserve(pseudo.size());
    const Color us = m_state.sideToMove;
    for (const auto &m : pseudo)
    {
      Position next = *this;
      next.doMove(m);
      if (!next.isKingInCheck(us))
        legal.push_back(m);
    }
    return legal;
  }

  void Position::doMove(const Move &m)
  {
    const Color us = m_state.sideToMove;
    const Piece moving = m_board[m.from];
    const bool pawn = moving.type == PieceType::Pawn;

    m_state.enPassantSquare = NO_SQUARE;
    m_state.halfmoveClock = (pawn || m.capture) ? 0 : static_cast<std::uint16_t>(m_state.halfmoveClock + 1);

    if (m.enPassant)
      m_board[offset(m.to, 0, us == Color::White ? -1 : 1)] = Piece{};

    m_board[m.to] = m.promotion != PieceType::None ? Piece{m.promotion, us} : moving;
    m_board[m.from] = Piece{};

    if (m.castle != CastleSide::None)
    {
      const bool king = m.castle == CastleSide::KingSide;
      const int r = rank_of(m.to) * 8;
      const Square rookFrom = static_cast<Square>(r + (king ? 7 : 0));
      const Square rookTo = static_cast<Square>(r + (king ? 5 : 3));
      m_board[rookTo] = m_board[rookFrom];
      m_board[rookFrom] = Piece{};
    }

    m_state.castlingRights &= static_cast<std::uint8_t>(~(rightsLostAt(m.from) | rightsLostAt(m.to)));

    if (pawn && (m.to == m.from + 16 || m.from == m.to + 16))
      m_state.enPassantSquare = static_cast<Square>((m.from + m.to) / 2);

    if (us == Color::Black)
      ++m_state.fullmoveNumber;
    m_state.sideToMove = ~us;
  }

} // namespace repertoire::chess
