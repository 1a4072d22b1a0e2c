#include "manager/manager.hpp"

#include "absl/strings/ascii.h"
#include "glog/logging.h"
#include "manager/evaluation.hpp"
#include "manager/source_file.hpp"
#include "util/flags.hpp"

namespace manager {

proto::ResourceConfig DefaultResourceConfig() {
  proto::ResourceConfig config;
  config.set_cpu_share(FLAGS_cpu_share);
  config.set_memory_limit_mb(FLAGS_memory_limit_mb);
  config.set_timeout_millis(FLAGS_timeout_millis);
  config.set_compile_timeout_millis(FLAGS_compile_timeout_millis);
  config.set_max_processes(FLAGS_max_processes);
  config.set_output_limit_kb(FLAGS_output_limit_kb);
  config.set_allow_network(false);
  return config;
}

void Manager::Execute(const std::string& code, const std::string& language,
                      const std::vector<proto::TestCase>& test_cases,
                      const std::atomic<bool>* cancelled,
                      ReportBuilder* report) {
  const language::LanguageSpec& spec = registry_.Resolve(language);
  report->SetLanguage(spec.id);
  if (absl::StripAsciiWhitespace(code).empty()) {
    report->Fail(proto::ErrorKind::INVALID_SUBMISSION,
                 "Submission code is empty");
    return;
  }
  for (const std::string& program : registry_.CheckToolchain(spec)) {
    provisioner_->CheckExecutable(program);
  }

  proto::ResourceConfig config = registry_.ConfigFor(spec, config_);
  executor::EnvironmentLease env(provisioner_, config);
  report->SetEnvironment(env->Id());

  std::unique_ptr<SourceFile> program =
      SourceFile::Create(registry_, spec, provisioner_, env.Get());
  BuildResult build = program->Build(code, config.compile_timeout_millis());
  report->SetBuild(build);
  if (!build.succeeded) return;
  provisioner_->Checkpoint(env.Get());

  Evaluation evaluation(program.get(), config.timeout_millis(), cancelled);
  if (test_cases.empty()) {
    evaluation.SmokeRun(report);
  } else {
    evaluation.Evaluate(test_cases, report);
  }
}

proto::ExecutionReport Manager::ExecuteSubmission(
    const std::string& code, const std::string& language,
    const std::vector<proto::TestCase>& test_cases,
    const std::atomic<bool>* cancelled) {
  ReportBuilder report(language);
  try {
    Execute(code, language, test_cases, cancelled, &report);
  } catch (const executor::unsupported_language& e) {
    report.Fail(proto::ErrorKind::UNSUPPORTED_LANGUAGE, e.what());
  } catch (const executor::provisioning_error& e) {
    LOG(WARNING) << "Cannot execute submission: " << e.what();
    report.Fail(proto::ErrorKind::PROVISIONING_ERROR, e.what());
  } catch (const std::exception& e) {
    LOG(ERROR) << "Internal error while executing submission: " << e.what();
    report.Fail(proto::ErrorKind::INTERNAL_ERROR, e.what());
  }
  proto::ExecutionReport result = report.Build();
  LOG(INFO) << "Submission in " << result.language() << ": "
            << proto::Status_Name(result.status()) << " ("
            << proto::ErrorKind_Name(result.error_kind()) << "), "
            << result.passed_count() << "/" << result.total_count()
            << " passed in " << result.execution_time_ms() << "ms";
  return result;
}

proto::ExecutionReport Manager::ExecuteSubmission(
    const proto::Submission& submission, const std::atomic<bool>* cancelled) {
  std::vector<proto::TestCase> test_cases(submission.test_cases().begin(),
                                          submission.test_cases().end());
  return ExecuteSubmission(submission.code(), submission.language(),
                           test_cases, cancelled);
}

}  // namespace manager
