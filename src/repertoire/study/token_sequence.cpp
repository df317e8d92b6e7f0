#include "repertoire/study/token_sequence.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace repertoire::study
{
  namespace
  {
    std::string stripCommentsAndVariations(std::string_view s)
    {
      std::string out;
      out.reserve(s.size());

      int brace = 0;
      int paren = 0;
      bool lineComment = false;

      for (char c : s)
      {
        if (lineComment)
        {
          if (c == '\n' || c == '\r')
            lineComment = false;
          else
            continue;
        }

        if (brace > 0)
        {
          if (c == '{')
            ++brace;
          else if (c == '}')
            --brace;
          continue;
        }

        if (paren > 0)
        {
          if (c == '(')
            ++paren;
          else if (c == ')')
            --paren;
          // keep neighbouring tokens apart once the variation closes
          if (paren == 0)
            out.push_back(' ');
          continue;
        }

        if (c == ';')
        {
          lineComment = true;
          continue;
        }
        if (c == '{')
        {
          brace = 1;
          out.push_back(' ');
          continue;
        }
        if (c == '(')
        {
          paren = 1;
          out.push_back(' ');
          continue;
        }

        out.push_back(c);
      }
      return out;
    }

    bool isResultToken(std::string_view t)
    {
      return t == "1-0" || t == "0-1" || t == "1/2-1/2" || t == "*";
    }

    // "12." / "12..." / "12"
    bool isMoveNumber(std::string_view t)
    {
      std::size_t i = 0;
      while (i < t.size() && std::isdigit((unsigned char)t[i]))
        ++i;
      if (i == 0)
        return false;
      while (i < t.size() && t[i] == '.')
        ++i;
      return i == t.size();
    }

    // NAG annotations like "$1"
    bool isNag(std::string_view t)
    {
      return t.size() > 1 && t[0] == '$' &&
             std::all_of(t.begin() + 1, t.end(), [](char c)
                         { return std::isdigit((unsigned char)c) != 0; });
    }
  } // namespace

  TokenSequence tokenize(std::string_view text)
  {
    TokenSequence out;
    std::size_t i = 0;
    while (i < text.size())
    {
      while (i < text.size() && std::isspace((unsigned char)text[i]))
        ++i;
      std::size_t j = i;
      while (j < text.size() && !std::isspace((unsigned char)text[j]))
        ++j;
      if (j > i)
        out.emplace_back(text.substr(i, j - i));
      i = j;
    }
    return out;
  }

  std::string joinTokens(const TokenSequence &tokens)
  {
    std::string out;
    for (const auto &t : tokens)
    {
      if (!out.empty())
        out.push_back(' ');
      out += t;
    }
    return out;
  }

  std::size_t commonPrefixLength(const TokenSequence &a, const TokenSequence &b)
  {
    const std::size_t n = std::min(a.size(), b.size());
    std::size_t i = 0;
    while (i < n && a[i] == b[i])
      ++i;
    return i;
  }

  TokenSequence longestCommonPrefix(const std::vector<TokenSequence> &sequences)
  {
    if (sequences.empty())
      return {};

    std::size_t shortest = sequences.front().size();
    for (const auto &s : sequences)
      shortest = std::min(shortest, s.size());

    const TokenSequence &first = sequences.front();
    std::size_t len = 0;
    for (; len < shortest; ++len)
    {
      const bool shared = std::all_of(sequences.begin() + 1, sequences.end(), [&](const TokenSequence &s)
                                      { return s[len] == first[len]; });
      if (!shared)
        break;
    }
    return TokenSequence(first.begin(), first.begin() + static_cast<std::ptrdiff_t>(len));
  }

  std::vector<std::string> chunkTokens(const TokenSequence &tokens, std::size_t size)
  {
    if (size == 0)
      throw std::invalid_argument("chunk size must be positive");

    std::vector<std::string> out;
    for (std::size_t i = 0; i < tokens.size(); i += size)
    {
      const auto last = std::min(tokens.size(), i + size);
      out.push_back(joinTokens(TokenSequence(tokens.begin() + static_cast<std::ptrdiff_t>(i),
                                             tokens.begin() + static_cast<std::ptrdiff_t>(last))));
    }
    return out;
  }

  TokenSequence sanitizePgnMoves(std::string_view pgn)
  {
    TokenSequence out;
    for (auto &raw : tokenize(stripCommentsAndVariations(pgn)))
    {
      // Split glued forms like "1.e4" or "10...O-O" into number + move.
      std::size_t i = 0;
      while (i < raw.size() && std::isdigit((unsigned char)raw[i]))
        ++i;
      std::size_t j = i;
      while (j < raw.size() && raw[j] == '.')
        ++j;

      std::string tok = (i > 0 && j > i && j < raw.size()) ? raw.substr(j) : std::move(raw);

      if (isMoveNumber(tok) || isResultToken(tok) || isNag(tok))
        continue;
      out.push_back(std::move(tok));
    }
    return out;
  }

} // namespace repertoire::study
