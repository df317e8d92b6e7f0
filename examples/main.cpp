#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "repertoire/analysis/analysis_types.hpp"
#include "repertoire/app/commands.hpp"
#include "repertoire/app/options.hpp"
#include "repertoire/app/settings.hpp"
#include "repertoire/engine/engine_locator.hpp"
#include "repertoire/engine/uci_evaluator.hpp"
#include "repertoire/errors.hpp"
#include "repertoire/store/database.hpp"

int main(int argc, char **argv)
{
  using namespace repertoire;

  try
  {
    const app::Options opts = app::parse_args(std::vector<std::string>(argv + 1, argv + argc));

    app::Settings settings = app::Settings::fromEnvironment();
    if (opts.dbPath)
      settings.dbPath = *opts.dbPath;
    if (opts.enginePath)
      settings.enginePath = opts.enginePath;
    settings.verbose = settings.verbose || opts.verbose;

    app::OracleFactory makeOracle = [&settings, argv]() -> std::unique_ptr<analysis::EvaluationOracle>
    {
      const auto path = engine::resolve_engine_path(settings.enginePath, argv[0]);
      if (!path)
        throw analysis::OracleUnavailable("no Stockfish binary found; set STOCKFISH_PATH or use --engine");
      engine::EvaluatorOptions eo;
      eo.trace = settings.verbose;
      return std::make_unique<engine::UciEvaluator>(path->string(), eo);
    };

    store::Database db(opts.command == app::Command::Help ? std::string(":memory:") : settings.dbPath);
    app::CommandRunner runner(db, makeOracle, std::cin, std::cout, std::cerr);
    return runner.run(opts, app::Clock::system());
  }
  catch (const repertoire::UsageError &e)
  {
    std::cerr << "Error: " << e.what() << "\n\n";
    repertoire::app::print_usage(std::cerr);
    return 2;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
