#pragma once

#include <stdexcept>
#include <string>

namespace flowcheck::util {

/*
  Central error types.

  Graph construction errors are fatal for a run. Everything a check throws
  is caught at the engine boundary and recorded as a node fault.
*/

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownDependency : public std::runtime_error {
 public:
  explicit UnknownDependency(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CycleDetected : public std::runtime_error {
 public:
  explicit CycleDetected(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateNode : public std::runtime_error {
 public:
  explicit DuplicateNode(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CheckTimeout : public std::runtime_error {
 public:
  explicit CheckTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace flowcheck::util
