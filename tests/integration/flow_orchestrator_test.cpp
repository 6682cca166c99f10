#include "internal/runtime/flow_orchestrator.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "internal/checks/builtin_checks.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/flow/report_writer.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using flowcheck::config::ConfigLoader;
using flowcheck::config::FlowConfig;
using flowcheck::runtime::FlowOrchestrator;
using flowcheck::runtime::FlowRun;

const fs::path& WorkDir() {
  static const fs::path dir = fs::temp_directory_path() / "flowcheck_flow_orchestrator_tests";
  return dir;
}

fs::path SeedTracker(const std::string& name, const std::vector<std::string>& rows) {
  fs::create_directories(WorkDir());
  const auto path = WorkDir() / (name + ".db");
  fs::remove(path);

  flowcheck::db::sqlite::SqliteDB db(path.string());
  flowcheck::db::sql::RunMigrations(db, flowcheck::db::sql::TrackerSchema());
  flowcheck::db::sql::RunMigrations(db, rows);
  // the tracker's own setting, which a run must leave alone
  db.Exec("PRAGMA journal_mode=DELETE;");
  return path;
}

std::string JournalMode(const fs::path& path) {
  flowcheck::db::sqlite::SqliteDB db(path.string(), true);
  auto                            st = db.Prepare("PRAGMA journal_mode;");
  assert(sqlite3_step(st.get()) == SQLITE_ROW);
  return reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 0));
}

const std::vector<std::string>& HealthyRows() {
  static const std::vector<std::string> rows = {
      "INSERT INTO projects VALUES ('P-1','Tracker','active','2025-01-01T00:00:00Z','2025-01-01T00:00:00Z',NULL);",
      "INSERT INTO sprints VALUES ('S-1','Sprint 1','active','P-1','2025-01-02T00:00:00Z','2025-01-02T00:00:00Z',NULL);",
      "INSERT INTO tasks VALUES ('T-1','Schema','done','high','P-1','S-1','ana','2025-01-03T00:00:00Z','2025-01-04T00:00:00Z',"
      "'2025-01-04T00:00:00Z',NULL,'[]','[\"T-2\"]','[\"ana\"]','import','c-1');",
      "INSERT INTO tasks VALUES ('T-2','API','in_progress','medium','P-1','S-1','bo','2025-01-03T00:00:00Z','2025-01-05T00:00:00Z',"
      "NULL,NULL,'[\"T-1\"]','[]','[\"bo\"]','import',NULL);",
  };
  return rows;
}

FlowConfig ConfigFor(const fs::path& db_path, const std::string& name) {
  auto config = ConfigLoader::Defaults();
  config.mutable_database()->mutable_sqlite()->set_path(db_path.string());

  const auto evidence = WorkDir() / (name + "_evidence");
  fs::remove_all(evidence);
  config.mutable_report()->set_evidence_dir(evidence.string());
  config.mutable_report()->set_output_dir((WorkDir() / (name + "_reports")).string());
  config.mutable_validation()->set_check_timeout_ms(60000);
  ConfigLoader::Validate(config);
  return config;
}

FlowRun RunFlow(const FlowConfig& config) {
  FlowOrchestrator orchestrator(config, flowcheck::checks::BuiltinRegistry());
  return orchestrator.Run(flowcheck::factory::Build(config));
}

std::map<std::string, std::string> NodeStatuses(const FlowRun& run) {
  std::map<std::string, std::string> out;
  for (const auto& n : run.report.nodes()) out[n.id()] = n.status();
  return out;
}

std::size_t CountFiles(const fs::path& dir) {
  std::size_t n = 0;
  for (const auto& entry : fs::directory_iterator(dir)) n += entry.path().extension() == ".json";
  return n;
}

void TestHealthyTrackerPasses() {
  auto tracker = SeedTracker("healthy", HealthyRows());
  auto config  = ConfigFor(tracker, "healthy");
  auto run     = RunFlow(config);

  const auto& report = run.report;
  assert(report.overall_status() == "PASSED");
  assert(report.flow_type() == "validation_swarm");
  assert(report.nodes_size() == 6);
  assert(report.flow_summary().completed() == 5);
  assert(report.flow_summary().skipped() == 1);
  assert(report.flow_summary().layers() == 3);
  assert(!report.flow_summary().aborted());
  assert(report.validation_summary().critical_failures() == 0);
  assert(report.validation_summary().success_rate() == 100.0);
  assert(report.recommendations_size() == 0);
  assert(report.execution_order(0) == "integrity");
  assert(report.execution_order(5) == "performance");

  auto statuses = NodeStatuses(run);
  assert(statuses["performance"] == "SKIPPED");
  assert(statuses["audit"] == "COMPLETED");

  // one evidence record per completed node
  assert(CountFiles(config.report().evidence_dir()) == 5);

  // inspected read-only
  assert(JournalMode(tracker) == "delete");
  assert(!fs::exists(tracker.string() + "-wal"));

  auto path = flowcheck::flow::ReportWriter::Persist(report, config.report().output_dir());
  assert(fs::exists(path));
  assert(path.filename().string() == "flow_" + report.flow_id() + ".json");
}

void TestQuickScopeMatchesAcrossModes() {
  auto tracker = SeedTracker("quick", HealthyRows());

  auto parallel = ConfigFor(tracker, "quick_parallel");
  parallel.mutable_validation()->set_scope("quick");
  auto sequential = ConfigFor(tracker, "quick_sequential");
  sequential.mutable_validation()->set_scope("quick");
  sequential.mutable_validation()->set_parallel(false);

  auto a = RunFlow(parallel);
  auto b = RunFlow(sequential);

  auto statuses = NodeStatuses(a);
  assert(statuses["integrity"] == "COMPLETED");
  assert(statuses["relationship"] == "COMPLETED");
  for (const auto* id : {"crud", "state", "audit", "performance"}) assert(statuses[id] == "SKIPPED");

  assert(NodeStatuses(a) == NodeStatuses(b));
  assert(a.report.validation_summary().total_checks() == b.report.validation_summary().total_checks());
  assert(a.report.validation_summary().passed() == b.report.validation_summary().passed());
  assert(a.report.overall_status() == b.report.overall_status());
  assert(a.report.configuration().scope() == "quick");
  assert(!b.report.configuration().parallel());
}

void TestIntegrityFailureBlocksDependents() {
  auto rows = HealthyRows();
  rows.push_back(
      "INSERT INTO tasks VALUES ('T-9','Stray','new','low','P-404','S-1',NULL,'2025-01-03T00:00:00Z','2025-01-03T00:00:00Z',"
      "NULL,NULL,'[]','[]','[]','import',NULL);");

  auto run = RunFlow(ConfigFor(SeedTracker("broken", rows), "broken"));

  assert(run.report.overall_status() == "FAILED");
  auto statuses = NodeStatuses(run);
  assert(statuses["integrity"] == "COMPLETED");
  for (const auto* id : {"crud", "state", "relationship", "audit"}) assert(statuses[id] == "BLOCKED");
  assert(statuses["performance"] == "SKIPPED");

  const auto& recs = run.report.recommendations();
  assert(recs.size() == 5);
  assert(recs[0].rfind("[BLOCKED] ", 0) == 0);
  assert(recs[4] == "Address critical issues in Data Integrity Validator");
}

void TestMissingTrackerFileIsNotCreated() {
  fs::create_directories(WorkDir());
  const auto path = WorkDir() / "no_such_tracker.db";
  fs::remove(path);

  bool threw = false;
  try {
    (void)flowcheck::factory::BuildStore(ConfigFor(path, "missing"));
  } catch (const flowcheck::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(!fs::exists(path));
}

void TestMissingDatabaseIsInvalidConfig() {
  auto config = ConfigLoader::Defaults();

  bool threw = false;
  try {
    (void)flowcheck::factory::Build(config);
  } catch (const flowcheck::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestHealthyTrackerPasses();
  TestQuickScopeMatchesAcrossModes();
  TestIntegrityFailureBlocksDependents();
  TestMissingTrackerFileIsNotCreated();
  TestMissingDatabaseIsInvalidConfig();

  std::cout << "flowcheck_integration_flow_orchestrator: pass\n";
  return 0;
}
