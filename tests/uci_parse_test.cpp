#include <cassert>
#include <string>

#include "repertoire/constants.hpp"
#include "repertoire/engine/uci_parse.hpp"

using namespace repertoire;
using namespace repertoire::engine;

int main()
{
  // Info lines with centipawn scores
  {
    const auto info = uci::parseInfoLine(
        "info depth 14 seldepth 20 multipv 1 score cp 34 nodes 120000 nps 900000 pv e2e4 e7e5 g1f3");
    assert(info);
    assert(info->depth == 14);
    assert(info->multipv == 1);
    assert(info->cp == 34);
    assert(!info->mate);
    assert(!info->bound);
    assert(info->pv.size() == 3 && info->pv[0] == "e2e4");
  }

  // Mate, bounds and lines without a score
  {
    const auto m = uci::parseInfoLine("info depth 20 score mate -3 pv h7h6");
    assert(m && m->mate == -3);

    const auto b = uci::parseInfoLine("info depth 9 score cp 15 lowerbound pv d2d4");
    assert(b && b->bound);

    assert(!uci::parseInfoLine("info depth 3 currmove e2e4 currmovenumber 1"));
    assert(!uci::parseInfoLine("info string NNUE evaluation enabled"));
    assert(!uci::parseInfoLine("readyok"));
  }

  // bestmove
  {
    bool isBest = false;
    assert(uci::parseBestmove("bestmove e2e4 ponder e7e5", isBest) == std::string("e2e4"));
    assert(isBest);
    assert(!uci::parseBestmove("bestmove (none)", isBest));
    assert(isBest);
    assert(!uci::parseBestmove("info depth 1", isBest));
    assert(!isBest);
  }

  // Side-to-move scores become White POV
  {
    uci::InfoLine info;
    info.depth = 10;
    info.cp = 50;
    info.pv = {"e7e5", "g1f3"};

    const auto w = uci::toWhitePov(info, analysis::Side::White);
    assert(w.cp == 50);
    assert(w.bestMove == std::string("e7e5"));

    const auto b = uci::toWhitePov(info, analysis::Side::Black);
    assert(b.cp == -50);
    assert(b.depth == 10);

    uci::InfoLine mated;
    mated.mate = 0;
    const auto mb = uci::toWhitePov(mated, analysis::Side::Black);
    assert(mb.mateIn == 0);
    assert(mb.cp == core::MATE_SCORE);

    uci::InfoLine mating;
    mating.mate = 2;
    assert(uci::toWhitePov(mating, analysis::Side::Black).mateIn == -2);
  }

  return 0;
}
