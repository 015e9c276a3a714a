#include "batch/batch_id_allocator.hpp"

namespace merkseal {

BatchIdAllocator &BatchIdAllocator::instance() {
  static BatchIdAllocator inst;
  return inst;
}

void BatchIdAllocator::advancePast(uint64_t id) {
  uint64_t current = next_.load(std::memory_order_relaxed);
  while (current <= id &&
         !next_.compare_exchange_weak(current, id + 1,
                                      std::memory_order_relaxed)) {
  }
}

} // namespace merkseal
