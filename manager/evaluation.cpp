#include "manager/evaluation.hpp"

#include <chrono>
#include <utility>

#include "glog/logging.h"
#include "manager/comparator.hpp"

namespace manager {

namespace {

int64_t MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

void SetFailure(proto::Outcome outcome, const std::string& error,
                proto::TestCaseResult* result) {
  result->set_outcome(outcome);
  result->set_passed(false);
  result->set_actual_output("");
  result->set_error(error);
}

}  // namespace

void Evaluation::Evaluate(const std::vector<proto::TestCase>& test_cases,
                          ReportBuilder* report) {
  for (const proto::TestCase& test_case : test_cases) {
    if (!system_error_.empty()) {
      proto::TestCaseResult result;
      result.set_input(test_case.input());
      result.set_expected_output(test_case.expected_output());
      SetFailure(proto::Outcome::SYSTEM_ERROR, system_error_, &result);
      report->AddResult(std::move(result));
    } else if (Cancelled()) {
      proto::TestCaseResult result;
      result.set_input(test_case.input());
      result.set_expected_output(test_case.expected_output());
      SetFailure(proto::Outcome::CANCELLED, "Submission cancelled", &result);
      report->AddResult(std::move(result));
    } else {
      report->AddResult(RunTestCase(test_case));
    }
  }
  // The environment broke: the cases were not really evaluated.
  if (!system_error_.empty()) {
    report->Fail(proto::ErrorKind::PROVISIONING_ERROR, system_error_);
  }
}

proto::TestCaseResult Evaluation::RunTestCase(
    const proto::TestCase& test_case) {
  proto::TestCaseResult result;
  result.set_input(test_case.input());
  result.set_expected_output(test_case.expected_output());

  auto start = std::chrono::steady_clock::now();
  try {
    executor::CommandResult run = program_->Run(test_case.input(),
                                                timeout_millis_);
    result.set_duration_millis(run.duration_millis);
    result.set_exit_code(run.exit_code);
    result.set_signal(run.signal);
    result.set_actual_output(StripTrailingNewline(run.stdout_text));
    result.set_stderr(run.stderr_text);
    if (!run.Succeeded()) {
      result.set_outcome(proto::Outcome::RUNTIME_ERROR);
      result.set_passed(false);
      result.set_error(run.stderr_text.empty() ? run.Describe()
                                               : run.stderr_text);
    } else if (CompareOutputs(run.stdout_text, test_case.expected_output())) {
      result.set_outcome(proto::Outcome::PASSED);
      result.set_passed(true);
    } else {
      result.set_outcome(proto::Outcome::WRONG_OUTPUT);
      result.set_passed(false);
    }
  } catch (const executor::execution_timeout& e) {
    SetFailure(proto::Outcome::TIMEOUT, e.what(), &result);
    result.set_duration_millis(MillisSince(start));
  } catch (const executor::resource_exceeded& e) {
    SetFailure(proto::Outcome::RESOURCE_EXCEEDED, e.what(), &result);
    result.set_duration_millis(MillisSince(start));
  } catch (const executor::provisioning_error& e) {
    LOG(WARNING) << "Environment failed while running " << program_->Name()
                 << ": " << e.what();
    system_error_ = e.what();
    SetFailure(proto::Outcome::SYSTEM_ERROR, system_error_, &result);
    result.set_duration_millis(MillisSince(start));
  }
  VLOG(1) << "Test case of " << program_->Name() << ": "
          << proto::Outcome_Name(result.outcome()) << " in "
          << result.duration_millis() << "ms";
  return result;
}

void Evaluation::SmokeRun(ReportBuilder* report) {
  auto start = std::chrono::steady_clock::now();
  try {
    executor::CommandResult run = program_->Run("", timeout_millis_);
    report->SetStreams(run.stdout_text, run.stderr_text);
    report->AddDuration(run.duration_millis);
    return;
  } catch (const executor::execution_timeout& e) {
    report->SetStreams("", e.what());
  } catch (const executor::resource_exceeded& e) {
    report->SetStreams("", e.what());
  } catch (const executor::provisioning_error& e) {
    LOG(WARNING) << "Environment failed while running " << program_->Name()
                 << ": " << e.what();
    report->SetStreams("", e.what());
    report->Fail(proto::ErrorKind::PROVISIONING_ERROR, e.what());
  }
  report->AddDuration(MillisSince(start));
}

}  // namespace manager
