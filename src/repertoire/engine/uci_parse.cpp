#include "repertoire/engine/uci_parse.hpp"

#include <sstream>

namespace repertoire::engine::uci
{
  namespace
  {
    inline bool starts_with(const std::string &s, const char *pfx)
    {
      return s.rfind(pfx, 0) == 0;
    }

    inline std::optional<int> to_int(const std::string &s)
    {
      try
      {
        std::size_t used = 0;
        const int v = std::stoi(s, &used);
        if (used != s.size())
          return std::nullopt;
        return v;
      }
      catch (const std::exception &)
      {
        return std::nullopt;
      }
    }

    inline std::vector<std::string> split_ws(const std::string &s)
    {
      std::vector<std::string> v;
      std::istringstream is(s);
      std::string t;
      while (is >> t)
        v.push_back(std::move(t));
      return v;
    }
  } // namespace

  std::optional<InfoLine> parseInfoLine(const std::string &line)
  {
    if (!starts_with(line, "info "))
      return std::nullopt;

    const auto tok = split_ws(line);
    InfoLine out;
    bool haveScore = false;

    for (std::size_t i = 1; i < tok.size(); ++i)
    {
      const std::string &t = tok[i];
      if (t == "depth" && i + 1 < tok.size())
      {
        if (auto v = to_int(tok[++i]))
          out.depth = *v;
      }
      else if (t == "multipv" && i + 1 < tok.size())
      {
        if (auto v = to_int(tok[++i]))
          out.multipv = *v;
      }
      else if (t == "score" && i + 2 < tok.size())
      {
        const std::string &kind = tok[i + 1];
        auto v = to_int(tok[i + 2]);
        i += 2;
        if (!v)
          continue;
        if (kind == "cp")
        {
          out.cp = *v;
          haveScore = true;
        }
        else if (kind == "mate")
        {
          out.mate = *v;
          haveScore = true;
        }
      }
      else if (t == "lowerbound" || t == "upperbound")
      {
        out.bound = true;
      }
      else if (t == "pv")
      {
        out.pv.assign(tok.begin() + static_cast<std::ptrdiff_t>(i + 1), tok.end());
        break;
      }
      else if (t == "string")
      {
        break; // free text until end of line
      }
    }

    if (!haveScore)
      return std::nullopt;
    return out;
  }

  std::optional<std::string> parseBestmove(const std::string &line, bool &isBestmoveLine)
  {
    isBestmoveLine = starts_with(line, "bestmove");
    if (!isBestmoveLine)
      return std::nullopt;

    std::istringstream is(line);
    std::string kw, best;
    is >> kw >> best;
    if (best.empty() || best == "(none)" || best == "0000")
      return std::nullopt;
    return best;
  }

  analysis::EngineScore toWhitePov(const InfoLine &info, analysis::Side sideToMove)
  {
    const int sign = sideToMove == analysis::Side::White ? 1 : -1;
    analysis::EngineScore s;
    s.depth = info.depth;
    if (info.mate)
    {
      const int m = *info.mate;
      s.mateIn = sign * m;
      // "mate 0": the side to move is already mated; the sign lives in cp.
      if (m == 0)
        s.cp = -sign * core::MATE_SCORE;
    }
    else if (info.cp)
    {
      s.cp = sign * *info.cp;
    }
    s.pv = info.pv;
    if (!info.pv.empty())
      s.bestMove = info.pv.front();
    return s;
  }

} // namespace repertoire::engine::uci
