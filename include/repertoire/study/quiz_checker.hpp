#pragma once

#include <cstddef>
#include <string_view>

#include "repertoire/study/token_sequence.hpp"

namespace repertoire::study
{
  struct QuizResult
  {
    TokenSequence target;
    TokenSequence typed;
    std::size_t correctTokens{0};

    std::size_t targetTokens() const { return target.size(); }
    bool fullyCorrect() const { return correctTokens == target.size(); }
  };

  // Scores typedText against the first promptLength tokens of the line by
  // strict prefix matching: the first wrong token ends the credit.
  // promptLength 0, or longer than the line, targets the whole line.
  // Throws EmptyTarget when tokens is empty.
  QuizResult check(const TokenSequence &tokens, std::string_view typedText, std::size_t promptLength);

} // namespace repertoire::study
