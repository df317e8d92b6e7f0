#include "repertoire/study/quiz_checker.hpp"

#include <algorithm>

#include "repertoire/errors.hpp"

namespace repertoire::study
{
  QuizResult check(const TokenSequence &tokens, std::string_view typedText, std::size_t promptLength)
  {
    if (tokens.empty())
      throw EmptyTarget();

    const std::size_t n = promptLength == 0 ? tokens.size() : std::min(promptLength, tokens.size());

    QuizResult r;
    r.target.assign(tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(n));
    r.typed = tokenize(typedText);
    r.correctTokens = commonPrefixLength(r.typed, r.target);
    return r;
  }

} // namespace repertoire::study
