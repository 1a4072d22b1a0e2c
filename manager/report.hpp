#ifndef MANAGER_REPORT_HPP
#define MANAGER_REPORT_HPP

#include <stdint.h>

#include <string>

#include "manager/source_file.hpp"
#include "proto/evalbox.pb.h"

namespace manager {

// Collects what happened to a submission and emits its report exactly once.
class ReportBuilder {
 public:
  explicit ReportBuilder(const std::string& language);

  void SetLanguage(const std::string& language);
  void SetEnvironment(const std::string& environment_id);

  // Records the build step. A failed build makes the report a COMPILE_ERROR
  // with the streams of the compiler.
  void SetBuild(const BuildResult& build);

  void AddResult(proto::TestCaseResult result);

  // Streams of a run that is not tied to a test case.
  void SetStreams(const std::string& stdout_text,
                  const std::string& stderr_text);
  void AddDuration(int64_t duration_millis);

  // Marks the submission as not executed. The first failure wins.
  void Fail(proto::ErrorKind kind, const std::string& error);

  // Finalizes the report. Throws std::logic_error if called twice.
  proto::ExecutionReport Build();

  ReportBuilder(const ReportBuilder&) = delete;
  ReportBuilder& operator=(const ReportBuilder&) = delete;
  ReportBuilder(ReportBuilder&&) = delete;
  ReportBuilder& operator=(ReportBuilder&&) = delete;

 private:
  proto::ExecutionReport report_;
  bool built_ = false;
};

}  // namespace manager

#endif
