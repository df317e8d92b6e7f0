#include <cassert>

#include "repertoire/errors.hpp"
#include "repertoire/study/quiz_checker.hpp"

using namespace repertoire;
using namespace repertoire::study;

int main()
{
  const TokenSequence line = {"e4", "e5", "Nf3"};

  {
    const auto r = check(line, "e4 e5 Nf3", 3);
    assert(r.correctTokens == 3);
    assert(r.fullyCorrect());
  }

  {
    const auto r = check(line, "e4 e6", 3);
    assert(r.correctTokens == 1);
    assert(!r.fullyCorrect());
    assert(r.targetTokens() == 3);
  }

  // An early mistake voids later matches
  {
    const auto r = check(line, "d4 e5 Nf3", 3);
    assert(r.correctTokens == 0);
  }

  // Extra typed tokens past the target are ignored
  {
    const auto r = check(line, "e4 e5 Nf3 Nc6 Bb5", 2);
    assert(r.targetTokens() == 2);
    assert(r.correctTokens == 2);
    assert(r.fullyCorrect());
  }

  // Prompt longer than the line, or zero, targets the whole line
  {
    assert(check(line, "e4", 10).targetTokens() == 3);
    assert(check(line, "e4", 0).targetTokens() == 3);
  }

  // Empty answer
  {
    const auto r = check(line, "   ", 3);
    assert(r.typed.empty());
    assert(r.correctTokens == 0);
  }

  {
    bool threw = false;
    try
    {
      check({}, "e4", 3);
    }
    catch (const EmptyTarget &)
    {
      threw = true;
    }
    assert(threw);
  }

  return 0;
}
