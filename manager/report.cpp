#include "manager/report.hpp"

#include <stdexcept>
#include <utility>

namespace manager {

ReportBuilder::ReportBuilder(const std::string& language) {
  report_.set_language(language);
}

void ReportBuilder::SetLanguage(const std::string& language) {
  report_.set_language(language);
}

void ReportBuilder::SetEnvironment(const std::string& environment_id) {
  report_.set_environment_id(environment_id);
}

void ReportBuilder::SetBuild(const BuildResult& build) {
  AddDuration(build.duration_millis);
  if (build.succeeded) return;
  report_.set_stdout(build.stdout_text);
  report_.set_stderr(build.stderr_text);
  Fail(proto::ErrorKind::COMPILE_ERROR, build.error);
}

void ReportBuilder::AddResult(proto::TestCaseResult result) {
  AddDuration(result.duration_millis());
  *report_.add_results() = std::move(result);
}

void ReportBuilder::SetStreams(const std::string& stdout_text,
                               const std::string& stderr_text) {
  report_.set_stdout(stdout_text);
  report_.set_stderr(stderr_text);
}

void ReportBuilder::AddDuration(int64_t duration_millis) {
  report_.set_execution_time_ms(report_.execution_time_ms() + duration_millis);
}

void ReportBuilder::Fail(proto::ErrorKind kind, const std::string& error) {
  if (report_.error_kind() != proto::ErrorKind::NO_ERROR) return;
  report_.set_error_kind(kind);
  report_.set_error(error);
}

proto::ExecutionReport ReportBuilder::Build() {
  if (built_) throw std::logic_error("The report was already built");
  built_ = true;
  report_.set_status(report_.error_kind() == proto::ErrorKind::NO_ERROR
                         ? proto::Status::SUCCESS
                         : proto::Status::ERROR);
  int32_t passed = 0;
  for (const proto::TestCaseResult& result : report_.results()) {
    if (result.passed()) passed++;
  }
  report_.set_passed_count(passed);
  report_.set_total_count(report_.results_size());
  return std::move(report_);
}

}  // namespace manager
