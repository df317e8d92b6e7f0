#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace repertoire::study
{
  using TokenSequence = std::vector<std::string>;

  // Splits on any whitespace; empty tokens are dropped.
  TokenSequence tokenize(std::string_view text);

  std::string joinTokens(const TokenSequence &tokens);

  // Number of leading positions where a[i] == b[i].
  std::size_t commonPrefixLength(const TokenSequence &a, const TokenSequence &b);

  // Prefix shared by every sequence; empty for an empty set.
  TokenSequence longestCommonPrefix(const std::vector<TokenSequence> &sequences);

  // Groups of `size` tokens joined by a space. Throws std::invalid_argument for size 0.
  std::vector<std::string> chunkTokens(const TokenSequence &tokens, std::size_t size);

  // PGN movetext -> bare move tokens. Comments, variations, move numbers
  // and result markers are removed.
  TokenSequence sanitizePgnMoves(std::string_view pgn);

} // namespace repertoire::study
