#include "app/SnapshotBuffers.hpp"

#include <utility>

namespace procsight::app {

SnapshotBuffers::SnapshotBuffers() {
  a_.seq = 0; b_.seq = 0;
}

procsight::model::Snapshot& SnapshotBuffers::back() { return *back_; }

void SnapshotBuffers::publish() {
  std::lock_guard<std::mutex> lk(swap_mu_);
  back_->seq = front_->seq + 1;
  std::swap(front_, back_);
  seq_.store(front_->seq, std::memory_order_release);
}

const procsight::model::Snapshot& SnapshotBuffers::front() const {
  std::lock_guard<std::mutex> lk(swap_mu_);
  return *front_;
}

procsight::model::Snapshot SnapshotBuffers::read() const {
  std::lock_guard<std::mutex> lk(swap_mu_);
  return *front_;
}

} // namespace procsight::app
