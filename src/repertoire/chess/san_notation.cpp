#include "repertoire/chess/san_notation.hpp"

#include <cctype>
#include <vector>

namespace repertoire::chess::notation
{
  namespace
  {
    inline char pieceLetter(PieceType pt)
    {
      switch (pt)
      {
      case PieceType::Knight:
        return 'N';
      case PieceType::Bishop:
        return 'B';
      case PieceType::Rook:
        return 'R';
      case PieceType::Queen:
        return 'Q';
      case PieceType::King:
        return 'K';
      default:
        return '\0';
      }
    }

    inline PieceType parsePromo(char c)
    {
      switch (std::tolower(static_cast<unsigned char>(c)))
      {
      case 'q':
        return PieceType::Queen;
      case 'r':
        return PieceType::Rook;
      case 'b':
        return PieceType::Bishop;
      case 'n':
        return PieceType::Knight;
      default:
        return PieceType::None;
      }
    }

    std::string normalizeSan(std::string_view in)
    {
      std::string s(in);
      while (!s.empty())
      {
        const char c = s.back();
        if (c == '+' || c == '#' || c == '!' || c == '?')
          s.pop_back();
        else
          break;
      }
      if (s == "0-0")
        s = "O-O";
      else if (s == "0-0-0")
        s = "O-O-O";

      // "e8Q" is common shorthand for "e8=Q"
      const std::size_t n = s.size();
      if (n >= 3 && parsePromo(s[n - 1]) != PieceType::None && std::isupper(static_cast<unsigned char>(s[n - 1])) &&
          (s[n - 2] == '8' || s[n - 2] == '1'))
        s.insert(n - 1, 1, '=');
      return s;
    }

    inline bool isUciLike(std::string_view t)
    {
      if (t.size() != 4 && t.size() != 5)
        return false;
      if (parseSquare(t.substr(0, 2)) == NO_SQUARE || parseSquare(t.substr(2, 2)) == NO_SQUARE)
        return false;
      return t.size() == 4 || parsePromo(t[4]) != PieceType::None;
    }

    // Appends + or # when the side to move after `mv` is in check.
    void appendCheckSuffix(const Position &pos, const Move &mv, std::string &san)
    {
      Position after = pos;
      after.doMove(mv);
      if (after.inCheck())
        san.push_back(after.generateLegalMoves().empty() ? '#' : '+');
    }

    std::string sanFor(const Position &pos, const Move &mv, const std::vector<Move> &legals)
    {
      if (mv.castle != CastleSide::None)
      {
        std::string san = mv.castle == CastleSide::KingSide ? "O-O" : "O-O-O";
        appendCheckSuffix(pos, mv, san);
        return san;
      }

      const Piece mover = pos.pieceAt(mv.from);
      const bool isPawn = mover.type == PieceType::Pawn;
      std::string san;

      if (!isPawn)
      {
        san.push_back(pieceLetter(mover.type));

        const int fromFile = file_of(mv.from);
        const int fromRank = rank_of(mv.from);
        bool competitor = false, sameFile = false, sameRank = false;
        for (const auto &m : legals)
        {
          if (m.to != mv.to || m.from == mv.from || pos.pieceAt(m.from).type != mover.type)
            continue;
          competitor = true;
          sameFile |= file_of(m.from) == fromFile;
          sameRank |= rank_of(m.from) == fromRank;
        }

        if (competitor)
        {
          if (!sameFile)
            san.push_back(static_cast<char>('a' + fromFile));
          else if (!sameRank)
            san.push_back(static_cast<char>('1' + fromRank));
          else
            san += squareName(mv.from);
        }
      }

      if (mv.capture)
      {
        if (isPawn)
          san.push_back(static_cast<char>('a' + file_of(mv.from)));
        san.push_back('x');
      }

      san += squareName(mv.to);

      if (mv.promotion != PieceType::None)
      {
        san.push_back('=');
        san.push_back(pieceLetter(mv.promotion));
      }

      appendCheckSuffix(pos, mv, san);
      return san;
    }
  } // namespace

  std::string toSan(const Position &pos, const Move &mv)
  {
    const auto legals = pos.generateLegalMoves();
    for (const auto &m : legals)
      if (m == mv)
        return sanFor(pos, m, legals);
    return "";
  }

  std::string toUci(const Move &mv)
  {
    std::string out = squareName(mv.from) + squareName(mv.to);
    if (mv.promotion != PieceType::None)
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(pieceLetter(mv.promotion)))));
    return out;
  }

  bool fromSan(const Position &pos, std::string_view sanToken, Move &out)
  {
    const std::string tok = normalizeSan(sanToken);
    if (tok.empty())
      return false;

    const auto legals = pos.generateLegalMoves();

    if (isUciLike(tok))
    {
      const Square from = parseSquare(tok.substr(0, 2));
      const Square to = parseSquare(tok.substr(2, 2));
      const PieceType promo = tok.size() == 5 ? parsePromo(tok[4]) : PieceType::None;
      for (const auto &m : legals)
        if (m.from == from && m.to == to && m.promotion == promo)
        {
          out = m;
          return true;
        }
      return false;
    }

    // match by generation
    for (const auto &m : legals)
    {
      if (normalizeSan(sanFor(pos, m, legals)) == tok)
      {
        out = m;
        return true;
      }
    }
    return false;
  }

} // namespace repertoire::chess::notation
