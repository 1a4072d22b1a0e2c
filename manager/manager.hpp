#ifndef MANAGER_MANAGER_HPP
#define MANAGER_MANAGER_HPP

#include <atomic>
#include <string>
#include <utility>
#include <vector>

#include "executor/provisioner.hpp"
#include "language/registry.hpp"
#include "manager/report.hpp"
#include "proto/evalbox.pb.h"

namespace manager {

// Resource limits taken from the command line flags.
proto::ResourceConfig DefaultResourceConfig();

// Executes submissions: resolves the language, creates one environment,
// builds the program, runs the test cases and reports what happened.
// ExecuteSubmission may be called from several threads at once.
class Manager {
 public:
  Manager(executor::Provisioner* provisioner,
          const language::Registry& registry, proto::ResourceConfig config)
      : provisioner_(provisioner),
        registry_(registry),
        config_(std::move(config)) {}

  // Never throws: every failure is described by the returned report. The
  // environment of the submission is destroyed before returning.
  proto::ExecutionReport ExecuteSubmission(
      const std::string& code, const std::string& language,
      const std::vector<proto::TestCase>& test_cases,
      const std::atomic<bool>* cancelled = nullptr);
  proto::ExecutionReport ExecuteSubmission(
      const proto::Submission& submission,
      const std::atomic<bool>* cancelled = nullptr);

  Manager(const Manager&) = delete;
  Manager& operator=(const Manager&) = delete;
  Manager(Manager&&) = delete;
  Manager& operator=(Manager&&) = delete;

 private:
  void Execute(const std::string& code, const std::string& language,
               const std::vector<proto::TestCase>& test_cases,
               const std::atomic<bool>* cancelled, ReportBuilder* report);

  executor::Provisioner* provisioner_;
  const language::Registry& registry_;
  proto::ResourceConfig config_;
};

}  // namespace manager

#endif
