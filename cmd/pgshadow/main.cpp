#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/model/table_name.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using pgshadow::observability::ErrorField;
using pgshadow::observability::IntField;
using pgshadow::observability::StringField;

static volatile std::sig_atomic_t g_stop_requested = 0;

void HandleSignal(int) {
  g_stop_requested = 1;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  pgshadow migrate     --uri <conninfo> (--sql <ddl> | --sql-file <path>) [--execute] [--config <yaml>]\n"
            << "  pgshadow replay-only --uri <conninfo> (--sql <ddl> | --sql-file <path>) [--config <yaml>]\n"
            << "  pgshadow abort       --uri <conninfo> --table <schema.name> [--config <yaml>]\n"
            << "  pgshadow status      --uri <conninfo> [--config <yaml>]\n"
            << "\n"
            << "Without --execute, migrate rehearses: it builds and converges the new\n"
            << "table, then removes it and leaves the original in place.\n";
}

struct Options {
  std::string command;
  std::string uri;
  std::string sql;
  std::string sql_file;
  std::string config_path;
  std::string table;
  bool        execute = false;
};

static std::optional<Options> ParseArgs(int argc, char** argv) {
  if (argc < 2) {
    return std::nullopt;
  }

  Options opts;
  opts.command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--execute") {
      opts.execute = true;
      continue;
    }

    if (i + 1 >= argc) {
      std::cerr << "missing value for " << arg << "\n";
      return std::nullopt;
    }
    const std::string value = argv[++i];

    if (arg == "--uri") {
      opts.uri = value;
    } else if (arg == "--sql") {
      opts.sql = value;
    } else if (arg == "--sql-file") {
      opts.sql_file = value;
    } else if (arg == "--config") {
      opts.config_path = value;
    } else if (arg == "--table") {
      opts.table = value;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      return std::nullopt;
    }
  }

  const bool needs_ddl = opts.command == "migrate" || opts.command == "replay-only";
  if (needs_ddl && opts.sql.empty() == opts.sql_file.empty()) {
    std::cerr << opts.command << " needs exactly one of --sql or --sql-file\n";
    return std::nullopt;
  }
  if (opts.command == "abort" && opts.table.empty()) {
    std::cerr << "abort needs --table\n";
    return std::nullopt;
  }
  if (opts.execute && opts.command != "migrate") {
    std::cerr << "--execute only applies to migrate\n";
    return std::nullopt;
  }
  if (!needs_ddl && opts.command != "abort" && opts.command != "status") {
    std::cerr << "unknown command: " << opts.command << "\n";
    return std::nullopt;
  }
  return opts;
}

static std::string ReadDdl(const Options& opts) {
  if (!opts.sql.empty()) {
    return opts.sql;
  }
  std::ifstream in(opts.sql_file);
  if (!in) {
    throw pgshadow::util::ConfigError("cannot read " + opts.sql_file);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

static void PrintReport(const pgshadow::core::MigrationReport& report) {
  std::cout << "table:            " << report.source.Display() << "\n"
            << "mode:             " << pgshadow::model::ToString(report.mode) << "\n"
            << "phase:            " << pgshadow::model::ToString(report.phase) << (report.resumed ? " (resumed)" : "") << "\n"
            << "rows copied:      " << report.rows_copied << "\n"
            << "changes applied:  " << report.changes_applied << "\n"
            << "replay watermark: " << report.replay_watermark << "\n";
  if (report.archived) {
    std::cout << "archived as:      " << report.archived->Display() << "\n";
  }
  if (!report.abort_reason.empty()) {
    std::cout << "aborted:          " << report.abort_reason << "\n";
  }
}

static void PrintStatus(const std::vector<pgshadow::core::StatusEntry>& entries) {
  if (entries.empty()) {
    std::cout << "no migrations registered\n";
    return;
  }
  for (const auto& entry : entries) {
    const auto& r = entry.record;
    std::cout << r.source.Display() << "\n"
              << "  phase:     " << pgshadow::model::ToString(r.phase) << "\n"
              << "  mode:      " << pgshadow::model::ToString(r.mode) << "\n"
              << "  started:   " << pgshadow::util::IsoUtc(r.started_at) << "\n"
              << "  updated:   " << pgshadow::util::IsoUtc(r.updated_at) << "\n"
              << "  cursor:    " << r.backfill_cursor.value_or("-") << (r.backfill_complete ? " (complete)" : "") << "\n"
              << "  watermark: " << r.replay_watermark << "\n"
              << "  copied:    " << r.rows_copied << "\n"
              << "  applied:   " << r.changes_applied << "\n"
              << "  backlog:   " << (entry.backlog ? std::to_string(*entry.backlog) : std::string("unavailable")) << "\n";
  }
}

static int Execute(const Options& opts, pgshadow::core::MigrationOrchestrator& orchestrator) {
  using pgshadow::model::RunMode;

  if (opts.command == "status") {
    PrintStatus(orchestrator.Status());
    return 0;
  }

  pgshadow::core::MigrationReport report;
  if (opts.command == "abort") {
    auto table = pgshadow::model::ParseTableName(opts.table);
    if (!table) {
      throw pgshadow::util::ValidationError("malformed table name: " + opts.table);
    }
    report = orchestrator.Abort(*table);
  } else {
    RunMode mode = RunMode::kReplayOnly;
    if (opts.command == "migrate") {
      mode = opts.execute ? RunMode::kExecute : RunMode::kRehearsal;
    }
    report = orchestrator.Migrate(ReadDdl(opts), mode);
  }

  PrintReport(report);
  if (opts.command == "abort") {
    return 0;
  }
  return report.Succeeded() ? 0 : 2;
}

int main(int argc, char** argv) {
  auto opts = ParseArgs(argc, argv);
  if (!opts) {
    Usage();
    return 1;
  }

  pgshadow::runtime::config::RuntimeConfig config;
  pgshadow::config::Settings               settings;
  try {
    // ------------------------------------------------------------
    // Load configuration; flags override the file
    // ------------------------------------------------------------
    if (!opts->config_path.empty()) {
      config = pgshadow::config::ConfigLoader::LoadFromYaml(opts->config_path);
    }
    if (!opts->uri.empty()) {
      config.mutable_database()->set_connection_uri(opts->uri);
    }
    settings = pgshadow::config::ResolveSettings(config);
  } catch (const std::exception& e) {
    std::cerr << "configuration error: " << e.what() << std::endl;
    return 1;
  }

  pgshadow::observability::InitializeLogging(config);

  int exit_code = 2;
  try {
    auto app = pgshadow::factory::Build(settings);

    // Register signal handlers before starting work to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // The handler only sets a flag; this thread turns it into a cancellation.
    std::atomic<bool> finished{false};
    std::thread       watcher([&] {
      while (!finished) {
        if (g_stop_requested) {
          PGSHADOW_LOG_WARN("stop requested; finishing the current unit of work");
          app.orchestrator->Cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    try {
      exit_code = Execute(*opts, *app.orchestrator);
    } catch (...) {
      finished = true;
      watcher.join();
      throw;
    }
    finished = true;
    watcher.join();
  } catch (const pgshadow::util::ValidationError& e) {
    PGSHADOW_LOG_ERROR("invalid migration", {ErrorField(e)});
    exit_code = 1;
  } catch (const pgshadow::util::ConfigError& e) {
    PGSHADOW_LOG_ERROR("configuration error", {ErrorField(e)});
    exit_code = 1;
  } catch (const pgshadow::util::MigrationConflict& e) {
    PGSHADOW_LOG_ERROR("migration conflict", {ErrorField(e)});
    exit_code = 1;
  } catch (const pgshadow::util::CutoverError& e) {
    PGSHADOW_LOG_ERROR("cutover failed; operator attention required", {StringField("report", e.what())});
    exit_code = 2;
  } catch (const std::exception& e) {
    PGSHADOW_LOG_ERROR("Fatal error", {ErrorField(e)});
    exit_code = 2;
  }

  PGSHADOW_LOG_INFO("exiting", {IntField("exit_code", exit_code)});
  pgshadow::observability::ShutdownLogging();
  return exit_code;
}
