#include "sandbox/sandbox.hpp"

#include "glog/logging.h"

namespace sandbox {

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(const std::string& name, Sandbox::create_t create,
                        Sandbox::score_t score) {
  Boxes_()->push_back(Entry{name, create, score});
}

std::vector<std::string> Sandbox::Names() {
  std::vector<std::string> names;
  for (const Entry& box : *Boxes_()) names.push_back(box.name);
  return names;
}

std::unique_ptr<Sandbox> Sandbox::Create(const std::string& name) {
  const store_t& boxes = *Boxes_();
  if (!name.empty()) {
    for (const Entry& box : boxes) {
      if (box.name != name) continue;
      if (box.score() < 0) {
        LOG(ERROR) << "Sandbox " << name << " cannot be used on this system";
        return nullptr;
      }
      return std::unique_ptr<Sandbox>(box.create());
    }
    LOG(ERROR) << "Unknown sandbox " << name;
    return nullptr;
  }
  // Scores do not change while the process runs.
  static const int best_sandbox = [&boxes]() {
    int best = -1;
    int best_score = 0;
    for (size_t i = 0; i < boxes.size(); i++) {
      int score = boxes[i].score();
      VLOG(1) << "Sandbox " << boxes[i].name << " has score " << score;
      if (score > best_score) {
        best_score = score;
        best = i;
      }
    }
    return best;
  }();
  if (best_sandbox == -1) {
    LOG(ERROR) << "No sandbox could be found";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(boxes[best_sandbox].create());
}

}  // namespace sandbox
