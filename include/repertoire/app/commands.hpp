#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "repertoire/analysis/oracle.hpp"
#include "repertoire/app/options.hpp"
#include "repertoire/store/annotation_repository.hpp"
#include "repertoire/store/database.hpp"
#include "repertoire/store/opening_repository.hpp"
#include "repertoire/store/sqlite_study_store.hpp"
#include "repertoire/study/calendar.hpp"

namespace repertoire::app
{
  // Builds an oracle on demand; throws OracleUnavailable when none can be had.
  using OracleFactory = std::function<std::unique_ptr<analysis::EvaluationOracle>()>;

  struct Clock
  {
    study::CalendarDate today{};
    study::Timestamp now{};

    static Clock system();
  };

  struct ImportRow
  {
    std::string name;
    std::string pgn;
  };

  // "<name>\t<pgn>" or bare "<pgn>" per line. Blank and '#' lines are
  // skipped; unnamed rows become "Imported line N".
  std::vector<ImportRow> parseImportRows(std::istream &in);

  class CommandRunner
  {
  public:
    CommandRunner(store::Database &db, OracleFactory makeOracle, std::istream &in, std::ostream &out,
                  std::ostream &err);

    // Returns the process exit code. Errors propagate as exceptions.
    int run(const Options &opts, const Clock &clock);

  private:
    int init();
    int add(const Options &o);
    int importFile(const Options &o);
    int list(const Options &o);
    int show(const Options &o);
    int note(const Options &o);
    int eval(const Options &o);
    int evalAll(const Options &o);
    int due(const Options &o, const Clock &clock);
    int quiz(const Options &o, const Clock &clock);
    int learn(const Options &o);
    int tree(const Options &o);

    study::OpeningLine requireOpening(const std::string &name);
    analysis::EngineScore evaluateFinal(analysis::EvaluationOracle &oracle, const study::OpeningLine &line,
                                        int depth);
    std::string prompt(const std::string &question);

    store::Database &m_db;
    store::OpeningRepository m_openings;
    store::SqliteStudyStore m_study;
    store::AnnotationRepository m_annotations;
    OracleFactory m_makeOracle;
    std::istream &m_in;
    std::ostream &m_out;
    std::ostream &m_err;
  };

} // namespace repertoire::app
