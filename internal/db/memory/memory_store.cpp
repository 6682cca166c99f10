#include "memory_store.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace flowcheck::db::memory {

namespace {

bool Matches(const std::string& wanted, const std::string& actual) {
  return wanted.empty() || wanted == actual;
}

template <typename Record>
void SortById(std::vector<Record>& records) {
  std::stable_sort(records.begin(), records.end(), [](const Record& a, const Record& b) { return a.id < b.id; });
}

} // namespace

MemoryStore::MemoryStore() = default;

void MemoryStore::AddTask(model::TaskRecord task) {
  std::lock_guard lock(mutex_);
  tasks_.push_back(std::move(task));
}

void MemoryStore::AddSprint(model::SprintRecord sprint) {
  std::lock_guard lock(mutex_);
  sprints_.push_back(std::move(sprint));
}

void MemoryStore::AddProject(model::ProjectRecord project) {
  std::lock_guard lock(mutex_);
  projects_.push_back(std::move(project));
}

void MemoryStore::SetUnavailable(bool unavailable) {
  std::lock_guard lock(mutex_);
  unavailable_ = unavailable;
}

void MemoryStore::ThrowIfUnavailable() const {
  if (unavailable_) throw util::StoreUnavailable("memory store marked unavailable");
}

std::vector<model::TaskRecord> MemoryStore::ListTasks(const StoreFilter& filter) {
  std::lock_guard lock(mutex_);
  ThrowIfUnavailable();

  std::vector<model::TaskRecord> out;
  for (const auto& t : tasks_) {
    if (Matches(filter.sprint_id, t.sprint_id) && Matches(filter.project_id, t.project_id)) out.push_back(t);
  }
  SortById(out);
  return out;
}

std::vector<model::SprintRecord> MemoryStore::ListSprints(const StoreFilter& filter) {
  std::lock_guard lock(mutex_);
  ThrowIfUnavailable();

  std::vector<model::SprintRecord> out;
  for (const auto& s : sprints_) {
    if (Matches(filter.sprint_id, s.id) && Matches(filter.project_id, s.project_id)) out.push_back(s);
  }
  SortById(out);
  return out;
}

std::vector<model::ProjectRecord> MemoryStore::ListProjects(const StoreFilter& filter) {
  std::lock_guard lock(mutex_);
  ThrowIfUnavailable();

  std::vector<model::ProjectRecord> out;
  for (const auto& p : projects_) {
    if (Matches(filter.project_id, p.id)) out.push_back(p);
  }
  SortById(out);
  return out;
}

bool MemoryStore::IsHealthy() {
  std::lock_guard lock(mutex_);
  return !unavailable_;
}

std::string MemoryStore::Describe() const {
  return "memory";
}

} // namespace flowcheck::db::memory
