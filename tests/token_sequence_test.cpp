#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "repertoire/study/calendar.hpp"
#include "repertoire/study/token_sequence.hpp"

using namespace repertoire::study;

int main()
{
  // Whitespace tokenization
  {
    const auto t = tokenize("  e4\te5 \n Nf3  ");
    assert((t == TokenSequence{"e4", "e5", "Nf3"}));
    assert(tokenize("   ").empty());
    assert(joinTokens(t) == "e4 e5 Nf3");
  }

  // Shared prefix of all lines
  {
    const std::vector<TokenSequence> seqs = {{"e4", "e5", "Nf3"}, {"e4", "e5", "Nc6"}};
    assert((longestCommonPrefix(seqs) == TokenSequence{"e4", "e5"}));

    assert(longestCommonPrefix({}).empty());
    assert(longestCommonPrefix({{"e4"}, {"d4"}}).empty());
    assert((longestCommonPrefix({{"e4", "e5"}, {"e4"}}) == TokenSequence{"e4"}));
    assert((longestCommonPrefix({{"d4", "d5", "c4"}}) == TokenSequence{"d4", "d5", "c4"}));
  }

  // Chunking for study sheets
  {
    const TokenSequence t = {"e4", "e5", "Nf3", "Nc6", "d4"};
    const auto chunks = chunkTokens(t, 2);
    assert(chunks.size() == 3);
    assert(chunks[0] == "e4 e5");
    assert(chunks[2] == "d4");
    assert(chunkTokens({}, 4).empty());

    bool threw = false;
    try
    {
      chunkTokens(t, 0);
    }
    catch (const std::invalid_argument &)
    {
      threw = true;
    }
    assert(threw);
  }

  // PGN movetext cleanup
  {
    const auto t = sanitizePgnMoves("1. e4 e5 2.Nf3 {main line} Nc6 (2...d6 3. d4) 3. d4 $1 exd4 1-0");
    assert((t == TokenSequence{"e4", "e5", "Nf3", "Nc6", "d4", "exd4"}));

    const auto black = sanitizePgnMoves("10...O-O 11. Re1 ; rest of line ignored\n Bg4 *");
    assert((black == TokenSequence{"O-O", "Re1", "Bg4"}));
  }

  // Calendar text forms
  {
    const CalendarDate d = makeDate(2024, 3, 9);
    assert(formatDate(d) == "2024-03-09");
    assert(parseDate("2024-03-09") == d);
    assert(!parseDate("2024-13-01"));
    assert(!parseDate("yesterday"));
    assert(formatDate(addDays(d, 23)) == "2024-04-01");

    const auto ts = parseTimestamp("2024-03-09 14:05:30");
    assert(ts);
    assert(formatTimestamp(*ts) == "2024-03-09 14:05:30");
    assert(dateOf(*ts) == d);
  }

  return 0;
}
