#include <iostream>
#include <iterator>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "language/registry.hpp"
#include "executor/sandbox_provisioner.hpp"
#include "manager/batch.hpp"
#include "manager/manager.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

bool ReadInput(std::string* input) {
  if (FLAGS_input.empty() || FLAGS_input == "-") {
    input->assign(std::istreambuf_iterator<char>(std::cin),
                  std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  try {
    *input = util::File::Read(FLAGS_input);
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Cannot read " << FLAGS_input << ": " << e.what();
    return false;
  }
  return true;
}

template <typename T>
bool PrintJson(const T& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    LOG(ERROR) << "Cannot serialize the report: " << status.ToString();
    return false;
  }
  std::cout << json << std::endl;
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  FLAGS_logtostderr = true;
  gflags::SetUsageMessage(
      "Runs submissions read as JSON and prints their reports.\n"
      "  evalbox [--input=submission.json] [flags]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  const language::Registry& registry = language::Registry::Default();
  if (FLAGS_list_languages) {
    for (const std::string& id : registry.Languages()) {
      std::cout << id << std::endl;
    }
    return 0;
  }

  std::string input;
  if (!ReadInput(&input)) return 1;

  google::protobuf::util::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = false;
  proto::Submission submission;
  proto::SubmissionBatch batch;
  bool is_batch = false;
  if (!google::protobuf::util::JsonStringToMessage(input, &submission,
                                                   parse_options)
           .ok()) {
    auto status = google::protobuf::util::JsonStringToMessage(input, &batch,
                                                              parse_options);
    if (!status.ok()) {
      LOG(ERROR) << "Cannot parse the input: " << status.ToString();
      return 1;
    }
    is_batch = true;
  }

  executor::SandboxProvisioner provisioner;
  manager::Manager manager(&provisioner, registry,
                           manager::DefaultResourceConfig());
  if (is_batch) {
    manager::BatchRunner runner(&manager, FLAGS_max_environments);
    return PrintJson(runner.Run(batch)) ? 0 : 1;
  }
  return PrintJson(manager.ExecuteSubmission(submission)) ? 0 : 1;
}
