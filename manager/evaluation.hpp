#ifndef MANAGER_EVALUATION_HPP
#define MANAGER_EVALUATION_HPP

#include <stdint.h>

#include <atomic>
#include <string>
#include <vector>

#include "manager/report.hpp"
#include "manager/source_file.hpp"
#include "proto/evalbox.pb.h"

namespace manager {

// Runs a built program against the test cases of a submission, one after
// the other, in the environment of the program.
class Evaluation {
 public:
  // cancelled may be null; it is checked before every test case.
  Evaluation(SourceFile* program, int64_t timeout_millis,
             const std::atomic<bool>* cancelled)
      : program_(program),
        timeout_millis_(timeout_millis),
        cancelled_(cancelled) {}

  // Adds one result per test case to the report, in order. If the
  // environment becomes unusable, the remaining cases are not run and the
  // report fails with a provisioning error.
  void Evaluate(const std::vector<proto::TestCase>& test_cases,
                ReportBuilder* report);

  // Runs the program once with an empty input and puts its streams in the
  // report. Only a broken environment makes the report fail.
  void SmokeRun(ReportBuilder* report);

 private:
  proto::TestCaseResult RunTestCase(const proto::TestCase& test_case);
  bool Cancelled() const { return cancelled_ != nullptr && *cancelled_; }

  SourceFile* program_;
  int64_t timeout_millis_;
  const std::atomic<bool>* cancelled_;
  // Set when the environment became unusable.
  std::string system_error_;
};

}  // namespace manager

#endif  // MANAGER_EVALUATION_HPP
