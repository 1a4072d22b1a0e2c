#include "manager/batch.hpp"

#include <algorithm>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "glog/logging.h"

namespace manager {

BatchRunner::BatchRunner(Manager* manager, size_t num_threads)
    : manager_(manager), num_threads_(std::max<size_t>(num_threads, 1)) {}

proto::ReportBatch BatchRunner::Run(const proto::SubmissionBatch& batch) {
  const int total = batch.submissions_size();
  std::vector<proto::ExecutionReport> reports(total);
  std::mutex mutex;
  int next = 0;

  auto thread_body = [&]() {
    while (true) {
      int current;
      {
        std::lock_guard<std::mutex> lck(mutex);
        if (next >= total) break;
        current = next++;
      }
      VLOG(1) << "Executing submission " << current + 1 << "/" << total;
      reports[current] =
          manager_->ExecuteSubmission(batch.submissions(current));
    }
  };

  size_t num_threads = std::min<size_t>(num_threads_, total);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < num_threads; i++) threads.emplace_back(thread_body);
  for (std::thread& thread : threads) thread.join();

  proto::ReportBatch result;
  for (proto::ExecutionReport& report : reports) {
    *result.add_reports() = std::move(report);
  }
  return result;
}

}  // namespace manager
