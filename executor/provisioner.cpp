#include "executor/provisioner.hpp"

#include <string.h>

#include "glog/logging.h"

namespace executor {

std::string CommandResult::Describe() const {
  if (signal != 0) {
    return "Process killed by signal " + std::to_string(signal) + " (" +
           strsignal(signal) + ")";
  }
  return "Process exited with code " + std::to_string(exit_code);
}

EnvironmentLease::EnvironmentLease(Provisioner* provisioner,
                                   const proto::ResourceConfig& config)
    : provisioner_(provisioner), env_(provisioner->Create(config)) {
  if (!env_) throw provisioning_error("No environment was created");
}

void EnvironmentLease::Release() {
  if (!env_ || env_->Destroyed()) return;
  provisioner_->Destroy(env_.get());
  env_->SetDestroyed();
}

EnvironmentLease::~EnvironmentLease() {
  try {
    Release();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Failed to destroy environment " << env_->Id() << ": "
               << e.what();
  }
}

}  // namespace executor
