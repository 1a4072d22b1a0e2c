#include "executor/sandbox_provisioner.hpp"

#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace executor {

namespace {
const constexpr int32_t kMaxFiles = 1024;
}  // namespace

class SandboxProvisioner::SandboxEnvironment : public Environment {
 public:
  SandboxEnvironment(std::string id, std::unique_ptr<util::TempDir> tmp,
                     std::string box_dir, std::string io_dir,
                     proto::ResourceConfig config,
                     std::unique_ptr<sandbox::Sandbox> sandbox,
                     std::unique_ptr<EnvironmentSlot> slot)
      : Environment(std::move(id), box_dir, std::move(config)),
        tmp(std::move(tmp)),
        box_dir(std::move(box_dir)),
        io_dir(std::move(io_dir)),
        sandbox(std::move(sandbox)),
        slot(std::move(slot)) {}

  std::unique_ptr<util::TempDir> tmp;
  std::string box_dir;
  std::string io_dir;
  std::unique_ptr<sandbox::Sandbox> sandbox;
  std::unique_ptr<EnvironmentSlot> slot;
  // Entries of box_dir at the last checkpoint.
  bool checkpointed = false;
  std::set<std::string> pristine;
};

SandboxProvisioner::Options SandboxProvisioner::OptionsFromFlags() {
  Options options;
  options.temp_directory = FLAGS_temp_directory;
  options.sandbox = FLAGS_sandbox;
  options.max_environments =
      FLAGS_max_environments > 0 ? FLAGS_max_environments : 1;
  options.keep_sandboxes = FLAGS_keep_sandboxes;
  options.uid = FLAGS_sandbox_uid;
  options.gid = FLAGS_sandbox_gid;
  return options;
}

SandboxProvisioner::SandboxProvisioner(Options options)
    : options_(std::move(options)), drop_privileges_(geteuid() == 0) {}

SandboxProvisioner::EnvironmentSlot::EnvironmentSlot(
    SandboxProvisioner* provisioner)
    : provisioner_(provisioner) {
  std::lock_guard<std::mutex> lck(provisioner_->mutex_);
  if (provisioner_->alive_ >= provisioner_->options_.max_environments) {
    throw provisioning_error(
        absl::StrCat("Too many environments: ", provisioner_->alive_,
                     " are already alive"));
  }
  provisioner_->alive_++;
}

SandboxProvisioner::EnvironmentSlot::~EnvironmentSlot() {
  std::lock_guard<std::mutex> lck(provisioner_->mutex_);
  provisioner_->alive_--;
}

size_t SandboxProvisioner::AliveEnvironments() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return alive_;
}

std::unique_ptr<Environment> SandboxProvisioner::Create(
    const proto::ResourceConfig& config) {
  if (config.allow_network()) {
    throw provisioning_error("Environments with network access are not "
                             "supported");
  }
  auto slot = absl::make_unique<EnvironmentSlot>(this);
  std::unique_ptr<sandbox::Sandbox> sb =
      sandbox::Sandbox::Create(options_.sandbox);
  if (!sb) {
    throw provisioning_error(
        options_.sandbox.empty()
            ? "No usable sandbox"
            : absl::StrCat("Sandbox ", options_.sandbox, " is not usable"));
  }
  if (!sb->IsIsolated()) {
    // Only an explicit choice may give up the isolation of the commands.
    if (options_.sandbox.empty()) {
      throw provisioning_error(
          absl::StrCat("No isolating sandbox is usable and the ", sb->Name(),
                       " sandbox was not requested explicitly"));
    }
    LOG_FIRST_N(WARNING, 1)
        << "Using the " << sb->Name()
        << " sandbox: commands are not isolated from the network and the "
           "filesystem";
  }

  std::unique_ptr<util::TempDir> tmp;
  std::string box_dir;
  std::string io_dir;
  try {
    tmp = absl::make_unique<util::TempDir>(options_.temp_directory);
    box_dir = util::File::JoinPath(tmp->Path(), kBoxDir);
    io_dir = util::File::JoinPath(tmp->Path(), kIoDir);
    util::File::MakeDirs(box_dir);
    util::File::MakeDirs(io_dir);
    if (drop_privileges_) {
      // The unprivileged identity must be able to reach and write the box,
      // but not the io directory.
      if (chmod(tmp->Path().c_str(), S_IRWXU | S_IXGRP | S_IXOTH) == -1 ||
          chown(box_dir.c_str(), options_.uid, options_.gid) == -1) {
        throw std::system_error(errno, std::system_category(),
                                "chown " + box_dir);
      }
    }
  } catch (const std::system_error& e) {
    throw provisioning_error(
        absl::StrCat("Cannot create the environment: ", e.what()));
  }
  if (options_.keep_sandboxes) tmp->Keep();

  std::string id =
      absl::StrCat(sb->Name(), "-", util::File::BaseName(tmp->Path()));
  LOG(INFO) << "Created environment " << id << " in " << tmp->Path();
  return absl::make_unique<SandboxEnvironment>(
      std::move(id), std::move(tmp), std::move(box_dir), std::move(io_dir),
      config, std::move(sb), std::move(slot));
}

SandboxProvisioner::SandboxEnvironment* SandboxProvisioner::Get(
    Environment* env) const {
  auto* sandbox_env = dynamic_cast<SandboxEnvironment*>(env);
  if (sandbox_env == nullptr) {
    throw std::invalid_argument("Environment was not created by this "
                                "provisioner");
  }
  if (sandbox_env->Destroyed()) {
    throw provisioning_error(
        absl::StrCat("Environment ", env->Id(), " was destroyed"));
  }
  return sandbox_env;
}

void SandboxProvisioner::CheckExecutable(const std::string& program) const {
  if (drop_privileges_) {
    if (!util::File::IsExecutableBy(program, options_.uid, options_.gid)) {
      throw provisioning_error(absl::StrCat(program, " cannot be run by uid ",
                                            options_.uid, " gid ",
                                            options_.gid));
    }
  } else if (access(program.c_str(), X_OK) == -1) {
    throw provisioning_error(
        absl::StrCat(program, " cannot be run: ", strerror(errno)));
  }
}

void SandboxProvisioner::WriteFile(Environment* env, const std::string& name,
                                   const std::string& contents) {
  SandboxEnvironment* senv = Get(env);
  if (!util::File::IsPlainName(name)) {
    throw std::invalid_argument("Invalid file name: " + name);
  }
  std::string path = util::File::JoinPath(senv->box_dir, name);
  try {
    util::File::Write(path, contents, /*overwrite=*/true);
    if (drop_privileges_ &&
        chown(path.c_str(), options_.uid, options_.gid) == -1) {
      throw std::system_error(errno, std::system_category(), "chown " + path);
    }
  } catch (const std::system_error& e) {
    throw provisioning_error(
        absl::StrCat("Cannot write ", name, ": ", e.what()));
  }
}

void SandboxProvisioner::Checkpoint(Environment* env) {
  SandboxEnvironment* senv = Get(env);
  try {
    std::vector<std::string> entries = util::File::ListDir(senv->box_dir);
    senv->pristine = std::set<std::string>(entries.begin(), entries.end());
  } catch (const std::system_error& e) {
    throw provisioning_error(
        absl::StrCat("Cannot list the environment: ", e.what()));
  }
  senv->checkpointed = true;
  VLOG(1) << env->Id() << ": checkpoint of " << senv->pristine.size()
          << " entries";
}

void SandboxProvisioner::Restore(Environment* env) {
  SandboxEnvironment* senv = Get(env);
  if (!senv->checkpointed) {
    throw provisioning_error(
        absl::StrCat("Environment ", env->Id(), " has no checkpoint"));
  }
  try {
    for (const std::string& entry : util::File::ListDir(senv->box_dir)) {
      if (senv->pristine.count(entry)) continue;
      VLOG(1) << env->Id() << ": removing leftover " << entry;
      util::File::RemoveTree(util::File::JoinPath(senv->box_dir, entry));
    }
  } catch (const std::system_error& e) {
    throw provisioning_error(
        absl::StrCat("Cannot restore the environment: ", e.what()));
  }
}

CommandResult SandboxProvisioner::Run(Environment* env,
                                      const std::vector<std::string>& argv,
                                      const std::string& stdin_data,
                                      int64_t timeout_millis) {
  SandboxEnvironment* senv = Get(env);
  if (argv.empty()) throw std::invalid_argument("Empty command");
  const proto::ResourceConfig& config = env->Config();

  sandbox::ExecutionOptions exec_options(senv->box_dir, argv[0]);
  exec_options.args.assign(argv.begin() + 1, argv.end());
  exec_options.env = {
      absl::StrCat("PATH=", kSearchPath),
      "HOME=" + senv->box_dir,
      "TMPDIR=" + senv->box_dir,
      "LANG=C.UTF-8",
  };

  // Limits. The cpu time limit is only a backstop for the wall limit.
  exec_options.wall_limit_millis = timeout_millis;
  exec_options.cpu_limit_millis = timeout_millis * 2;
  exec_options.memory_limit_kb = config.memory_limit_mb() * 1024;
  exec_options.cpu_share = config.cpu_share();
  exec_options.max_procs = config.max_processes();
  exec_options.max_files = kMaxFiles;
  exec_options.max_file_size_kb = config.output_limit_kb();
  if (drop_privileges_) {
    exec_options.uid = options_.uid;
    exec_options.gid = options_.gid;
  }

  // Standard streams, fresh for every command.
  exec_options.stdin_file = util::File::JoinPath(senv->io_dir, "stdin");
  exec_options.stdout_file = util::File::JoinPath(senv->io_dir, "stdout");
  exec_options.stderr_file = util::File::JoinPath(senv->io_dir, "stderr");
  sandbox::ExecutionInfo info;
  std::string error_msg;
  try {
    for (const std::string& file :
         {exec_options.stdout_file, exec_options.stderr_file}) {
      if (util::File::Exists(file)) util::File::Remove(file);
    }
    util::File::Write(exec_options.stdin_file, stdin_data, /*overwrite=*/true);
  } catch (const std::system_error& e) {
    throw provisioning_error(
        absl::StrCat("Cannot prepare the standard streams: ", e.what()));
  }

  VLOG(1) << env->Id() << ": running " << absl::StrJoin(argv, " ");
  if (!senv->sandbox->Execute(exec_options, &info, &error_msg)) {
    throw provisioning_error(
        absl::StrCat("Cannot run ", argv[0], ": ", error_msg));
  }
  VLOG(1) << env->Id() << ": " << argv[0] << " exited with code "
          << info.status_code << ", signal " << info.signal << " after "
          << info.wall_time_millis << "ms";

  if (info.memory_limit_exceeded) throw resource_exceeded(info.message);
  if (info.time_limit_exceeded) throw execution_timeout(timeout_millis);
  if (info.output_limit_exceeded) throw resource_exceeded(info.message);

  CommandResult result;
  result.exit_code = info.status_code;
  result.signal = info.signal;
  result.duration_millis = info.wall_time_millis;
  result.memory_usage_kb = info.memory_usage_kb;
  const int64_t limit = config.output_limit_kb() * 1024;
  try {
    result.stdout_text = util::File::Read(exec_options.stdout_file, limit);
    result.stderr_text = util::File::Read(exec_options.stderr_file, limit);
  } catch (const std::system_error& e) {
    throw provisioning_error(
        absl::StrCat("Cannot read the output of ", argv[0], ": ", e.what()));
  }
  return result;
}

void SandboxProvisioner::Destroy(Environment* env) {
  auto* senv = dynamic_cast<SandboxEnvironment*>(env);
  if (senv == nullptr || senv->Destroyed()) return;
  senv->SetDestroyed();
  senv->sandbox.reset();
  senv->tmp.reset();
  senv->slot.reset();
  LOG(INFO) << "Destroyed environment " << env->Id();
}

}  // namespace executor
