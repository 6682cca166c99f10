#include "execution_engine.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "worker_pool.hpp"

namespace flowcheck::flow {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

std::atomic<std::size_t> g_abandoned_checks{0};

// Shared by a check thread and the worker waiting on it. Whichever side
// loses the race to leave kRunning settles the abandoned count.
class CheckThreadState {
 public:
  void Finish() {
    int expected = kRunning;
    if (!phase_.compare_exchange_strong(expected, kFinished)) g_abandoned_checks.fetch_sub(1);
  }

  void Abandon() {
    g_abandoned_checks.fetch_add(1);
    int expected = kRunning;
    if (!phase_.compare_exchange_strong(expected, kAbandoned)) g_abandoned_checks.fetch_sub(1);
  }

 private:
  static constexpr int kRunning   = 0;
  static constexpr int kFinished  = 1;
  static constexpr int kAbandoned = 2;

  std::atomic<int> phase_{kRunning};
};

std::string FlowTimeoutReason(std::chrono::milliseconds timeout) {
  return "flow timeout of " + std::to_string(timeout.count()) + "ms exceeded";
}

bool DependenciesSatisfied(const FlowGraph& graph, const Node& node, std::string* reason) {
  for (const auto& dep_id : node.dependencies) {
    const auto& dep = graph.At(dep_id);
    if (dep.status != NodeStatus::kCompleted) {
      *reason = "Dependencies failed - execution blocked: " + dep_id + " is " + std::string(ToString(dep.status));
      return false;
    }
    if (dep.outcome && dep.outcome->status == OutcomeStatus::kFailed && dep.outcome->critical_count > 0) {
      *reason = "Dependencies failed - execution blocked: " + dep_id + " reported " +
                std::to_string(dep.outcome->critical_count) + " critical finding(s)";
      return false;
    }
  }
  return true;
}

void Block(Node& node, std::string reason) {
  node.status = NodeStatus::kBlocked;
  node.error  = std::move(reason);
  FLOWCHECK_LOG_WARN("node blocked", {StringField("node", node.id), StringField("reason", node.error)});
}

void Fault(Node& node, std::string error) {
  node.status = NodeStatus::kFailed;
  node.error  = std::move(error);

  CheckOutcome outcome;
  outcome.total_checks   = 1;
  outcome.failed         = 1;
  outcome.critical_count = 1;
  outcome.status         = OutcomeStatus::kFailed;
  outcome.message        = node.error;
  node.outcome           = std::move(outcome);
}

bool FailedOrCritical(const Node& node) {
  if (node.status == NodeStatus::kFailed) return true;
  return node.status == NodeStatus::kCompleted && node.outcome && node.outcome->critical_count > 0;
}

} // namespace

ExecutionEngine::ExecutionEngine(EngineOptions options) : options_(std::move(options)) {
  if (options_.max_workers == 0) options_.max_workers = 1;
}

EngineResult ExecutionEngine::Run(FlowGraph& graph, const CheckContext& ctx, ReportBuilder& report) {
  EngineResult result;
  result.started_at = util::Now();

  Deadline deadline;
  if (options_.flow_timeout.count() > 0) deadline = std::chrono::steady_clock::now() + options_.flow_timeout;

  const auto& layers = graph.Layers();
  report.SetSchedule(graph.ExecutionOrder(), layers.size());

  std::string order;
  for (const auto& id : graph.ExecutionOrder()) {
    if (!order.empty()) order += " -> ";
    order += id;
  }
  FLOWCHECK_LOG_INFO("execution order",
                     {StringField("order", order), IntField("layers", static_cast<std::int64_t>(layers.size()))});

  const std::size_t workers = options_.parallel ? options_.max_workers : 1;
  WorkerPool        pool(workers);

  auto check_deadline = [&](std::size_t layer) {
    if (result.aborted || !deadline || std::chrono::steady_clock::now() < *deadline) return;
    result.aborted      = true;
    result.abort_reason = FlowTimeoutReason(options_.flow_timeout);
    FLOWCHECK_LOG_ERROR("flow deadline exceeded", {IntField("layer", static_cast<std::int64_t>(layer))});
  };

  for (std::size_t k = 0; k < layers.size(); ++k) {
    check_deadline(k);

    std::vector<Node*> ready;
    for (const auto& id : layers[k]) {
      auto& node = graph.At(id);

      if (node.skip) {
        node.status = NodeStatus::kSkipped;
        node.error  = node.skip_reason;
        FLOWCHECK_LOG_INFO("node skipped", {StringField("node", node.id), StringField("reason", node.skip_reason)});
        continue;
      }
      if (result.aborted) {
        Block(node, "Flow aborted - execution blocked: " + result.abort_reason);
        continue;
      }

      std::string reason;
      if (!DependenciesSatisfied(graph, node, &reason)) {
        Block(node, std::move(reason));
        continue;
      }

      node.status = NodeStatus::kRunning;
      ready.push_back(&node);
    }

    FLOWCHECK_LOG_INFO("layer start", {IntField("layer", static_cast<std::int64_t>(k)),
                                       IntField("ready", static_cast<std::int64_t>(ready.size())),
                                       IntField("workers", static_cast<std::int64_t>(std::min(workers, ready.size())))});

    std::vector<Job> jobs;
    jobs.reserve(ready.size());
    for (auto* node : ready) {
      FLOWCHECK_LOG_INFO("node running", {StringField("node", node->id)});
      jobs.emplace_back([this, node, &ctx, deadline] { Execute(*node, ctx, deadline); });
    }
    pool.RunAll(std::move(jobs));

    // after the barrier too, so the last layer can abort the run
    check_deadline(k);

    for (const auto& id : layers[k]) {
      const auto& node = graph.At(id);
      observability::Metrics::Instance().RecordNodeStatus(ToString(node.status));
      if (node.status == NodeStatus::kCompleted && options_.on_completed) {
        options_.on_completed(node);
      }
      report.RecordNode(node);

      if (!result.aborted && options_.abort_on_failure && FailedOrCritical(node)) {
        result.aborted      = true;
        result.abort_reason = "failure in " + node.id;
        FLOWCHECK_LOG_WARN("aborting flow", {StringField("node", node.id)});
      }
    }
  }

  if (result.aborted) report.MarkAborted();
  result.finished_at = util::Now();
  return result;
}

void ExecutionEngine::Execute(Node& node, const CheckContext& ctx, Deadline deadline) const {
  observability::SpanScope span("flowcheck.node");
  span.SetAttribute("node.id", node.id);

  node.started_at = util::Now();

  auto timeout = options_.check_timeout;
  if (deadline) {
    // rounded up so a clamped check never gives up before the deadline
    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
    timeout = timeout.count() > 0 ? std::min(timeout, remaining) : remaining;
    // 0 would mean "no limit"
    if (timeout.count() <= 0) timeout = std::chrono::milliseconds(1);
  }

  try {
    node.outcome = Invoke(node, ctx, timeout);
    node.status  = NodeStatus::kCompleted;
  } catch (const std::exception& e) {
    Fault(node, e.what());
  } catch (...) {
    Fault(node, "unknown exception");
  }

  node.finished_at = util::Now();
  const double seconds = node.DurationSeconds().value_or(0.0);
  observability::Metrics::Instance().ObserveCheckDurationMs(node.id, seconds * 1000.0);

  if (node.status == NodeStatus::kCompleted) {
    span.SetAttribute("outcome.status", ToString(node.outcome->status));
    FLOWCHECK_LOG_INFO("node completed", {StringField("node", node.id), StringField("outcome", ToString(node.outcome->status)),
                                          IntField("findings", static_cast<std::int64_t>(node.outcome->findings.size())),
                                          DoubleField("seconds", seconds)});
  } else {
    span.RecordException(node.error);
    FLOWCHECK_LOG_ERROR("node failed", {StringField("node", node.id), StringField("error", node.error), DoubleField("seconds", seconds)});
  }
}

CheckOutcome ExecutionEngine::Invoke(const Node& node, const CheckContext& ctx, std::chrono::milliseconds timeout) const {
  if (!node.check) {
    throw std::invalid_argument("node " + node.id + " has no check");
  }
  if (timeout.count() <= 0) {
    return node.check->Validate(ctx);
  }

  // The check runs on its own thread so an overrun can be abandoned; it
  // owns copies of everything it touches.
  auto promise = std::make_shared<std::promise<CheckOutcome>>();
  auto future  = promise->get_future();
  auto state   = std::make_shared<CheckThreadState>();
  std::thread([check = node.check, ctx, promise, state] {
    try {
      promise->set_value(check->Validate(ctx));
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
    state->Finish();
  }).detach();

  if (future.wait_for(timeout) == std::future_status::timeout) {
    state->Abandon();
    throw util::CheckTimeout("check " + node.id + " timed out after " + std::to_string(timeout.count()) + "ms");
  }
  return future.get();
}

std::size_t ExecutionEngine::AbandonedChecks() {
  return g_abandoned_checks.load();
}

} // namespace flowcheck::flow
