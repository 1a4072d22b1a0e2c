#ifndef MANAGER_BATCH_HPP
#define MANAGER_BATCH_HPP

#include <stddef.h>

#include "manager/manager.hpp"
#include "proto/evalbox.pb.h"

namespace manager {

// Executes a batch of submissions on a fixed number of threads. The i-th
// report of the result belongs to the i-th submission.
class BatchRunner {
 public:
  BatchRunner(Manager* manager, size_t num_threads);

  proto::ReportBatch Run(const proto::SubmissionBatch& batch);

 private:
  Manager* manager_;
  size_t num_threads_;
};

}  // namespace manager

#endif
