#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace warden::core {

/*
  Per-update mutexes. Transitions of one update id run one at a time in
  this process; different ids never contend. Entries live as long as the
  table.
*/
class UpdateLocks {
 public:
  std::shared_ptr<std::mutex> For(int64_t update_id) {
    std::lock_guard<std::mutex> lock(guard_);
    auto&                       update_mutex = mutexes_[update_id];
    if (!update_mutex) {
      update_mutex = std::make_shared<std::mutex>();
    }
    return update_mutex;
  }

 private:
  std::mutex                                               guard_;
  std::unordered_map<int64_t, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace warden::core
