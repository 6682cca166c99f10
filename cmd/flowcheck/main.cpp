#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/checks/builtin_checks.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/flow/execution_engine.hpp"
#include "internal/flow/report_builder.hpp"
#include "internal/flow/report_writer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/flow_orchestrator.hpp"
#include "internal/util/errors.hpp"

using flowcheck::observability::IntField;
using flowcheck::observability::StringField;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailed  = 1;
constexpr int kExitFatal   = 2;

void Usage(std::ostream& out) {
  out << "Usage: flowcheck [options]\n"
      << "  --config <file.yaml>   load configuration\n"
      << "  --db <path>            sqlite tracker database (opened read-only)\n"
      << "  --scope <full|quick>   quick runs integrity and relationship only\n"
      << "  --performance          include performance checks\n"
      << "  --sequential           one check at a time\n"
      << "  --workers <n>          worker pool size\n"
      << "  --sprint <id>          restrict to one sprint\n"
      << "  --project <id>         restrict to one project\n"
      << "  --report-dir <dir>     where flow_<id>.json is written\n"
      << "  --timeout-ms <n>       per-check timeout, 0 for none\n"
      << "  --visualize            print the flow graph and exit\n"
      << "  --json                 print the full report as JSON\n"
      << "Exit status: 0 PASSED or PASSED_WITH_WARNINGS, 1 otherwise, 2 on error\n";
}

struct Options {
  std::string                config_path;
  std::optional<std::string> db_path;
  std::optional<std::string> scope;
  bool                       performance = false;
  bool                       sequential  = false;
  std::optional<uint32_t>    workers;
  std::optional<std::string> sprint;
  std::optional<std::string> project;
  std::optional<std::string> report_dir;
  std::optional<uint32_t>    timeout_ms;
  bool                       visualize = false;
  bool                       json      = false;
  bool                       help      = false;
};

uint32_t ParseCount(const std::string& flag, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 9) {
    throw flowcheck::util::InvalidConfig(flag + " expects a non-negative integer, got '" + value + "'");
  }
  return static_cast<uint32_t>(std::stoul(value));
}

Options ParseArgs(int argc, char** argv) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc) throw flowcheck::util::InvalidConfig(arg + " requires a value");
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      opts.help = true;
    } else if (arg == "--config") {
      opts.config_path = value();
    } else if (arg == "--db") {
      opts.db_path = value();
    } else if (arg == "--scope") {
      opts.scope = value();
    } else if (arg == "--performance") {
      opts.performance = true;
    } else if (arg == "--sequential") {
      opts.sequential = true;
    } else if (arg == "--workers") {
      opts.workers = ParseCount(arg, value());
    } else if (arg == "--sprint") {
      opts.sprint = value();
    } else if (arg == "--project") {
      opts.project = value();
    } else if (arg == "--report-dir") {
      opts.report_dir = value();
    } else if (arg == "--timeout-ms") {
      opts.timeout_ms = ParseCount(arg, value());
    } else if (arg == "--visualize") {
      opts.visualize = true;
    } else if (arg == "--json") {
      opts.json = true;
    } else {
      throw flowcheck::util::InvalidConfig("unknown option " + arg);
    }
  }
  return opts;
}

flowcheck::config::FlowConfig LoadConfig(const Options& opts) {
  using flowcheck::config::ConfigLoader;

  auto config = opts.config_path.empty() ? ConfigLoader::Defaults() : ConfigLoader::LoadFromYaml(opts.config_path);

  auto* validation = config.mutable_validation();
  if (opts.db_path) {
    config.mutable_database()->mutable_sqlite()->set_path(*opts.db_path);
  }
  if (opts.scope) validation->set_scope(*opts.scope);
  if (opts.performance) validation->set_include_performance(true);
  if (opts.sequential) validation->set_parallel(false);
  if (opts.workers) validation->set_max_workers(*opts.workers);
  if (opts.sprint) validation->mutable_filters()->set_sprint_id(*opts.sprint);
  if (opts.project) validation->mutable_filters()->set_project_id(*opts.project);
  if (opts.timeout_ms) validation->set_check_timeout_ms(*opts.timeout_ms);
  if (opts.report_dir) config.mutable_report()->set_output_dir(*opts.report_dir);

  ConfigLoader::Validate(config);
  return config;
}

// A check abandoned after its timeout may still log from its own thread.
// While one runs, the logger stays up and the process leaves through
// quick_exit so static destructors do not pull it away.
int Finish(int code) {
  flowcheck::observability::ShutdownMetrics();
  flowcheck::observability::ShutdownTracing();

  const auto abandoned = flowcheck::flow::ExecutionEngine::AbandonedChecks();
  if (abandoned == 0) {
    flowcheck::observability::ShutdownLogging();
    return code;
  }

  FLOWCHECK_LOG_WARN("exiting with timed-out checks still running", {IntField("checks", static_cast<std::int64_t>(abandoned))});
  std::cout.flush();
  std::cerr.flush();
  std::quick_exit(code);
}

} // namespace

int main(int argc, char** argv) {
  Options opts;
  try {
    opts = ParseArgs(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "flowcheck: " << e.what() << "\n";
    Usage(std::cerr);
    return kExitFatal;
  }
  if (opts.help) {
    Usage(std::cout);
    return kExitSuccess;
  }

  // stderr logger until the configured one replaces it
  flowcheck::observability::InitializeLogging(flowcheck::config::ConfigLoader::Defaults());

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = LoadConfig(opts);

    flowcheck::observability::InitializeTracing(config);
    flowcheck::observability::InitializeMetrics(config);
    flowcheck::observability::InitializeLogging(config);

    flowcheck::runtime::FlowOrchestrator orchestrator(config, flowcheck::checks::BuiltinRegistry());

    if (opts.visualize) {
      std::cout << flowcheck::flow::ReportWriter::RenderGraph(orchestrator.BuildGraph());
      return Finish(kExitSuccess);
    }

    // ------------------------------------------------------------
    // Build collaborators and run
    // ------------------------------------------------------------
    auto deps = flowcheck::factory::Build(config);
    auto run  = orchestrator.Run(deps);

    if (config.report().persist()) {
      try {
        auto path = flowcheck::flow::ReportWriter::Persist(run.report, config.report().output_dir());
        FLOWCHECK_LOG_INFO("report written", {StringField("path", path.string())});
      } catch (const std::exception& e) {
        FLOWCHECK_LOG_ERROR("report write failed", {StringField("error", e.what())});
      }
    }

    if (opts.json) {
      std::cout << flowcheck::flow::ReportWriter::ToJson(run.report) << "\n";
    } else {
      std::cout << flowcheck::flow::ReportWriter::RenderSummary(run.report);
    }

    const bool ok = flowcheck::flow::IsSuccess(run.report.overall_status());
    return Finish(ok ? kExitSuccess : kExitFailed);
  } catch (const std::exception& e) {
    FLOWCHECK_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    return Finish(kExitFatal);
  }
}
