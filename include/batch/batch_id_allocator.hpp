#ifndef MERKSEAL_BATCH_ID_ALLOCATOR_HPP
#define MERKSEAL_BATCH_ID_ALLOCATOR_HPP

#include <atomic>
#include <cstdint>

namespace merkseal {

/**
 * @brief Monotonic batch identifier source.
 *
 * next() is a single atomic increment, so concurrent callers always get
 * distinct ids. Identifiers are never reclaimed.
 */
class BatchIdAllocator {
public:
  explicit BatchIdAllocator(uint64_t first = 1) : next_(first) {}

  BatchIdAllocator(const BatchIdAllocator &) = delete;
  BatchIdAllocator &operator=(const BatchIdAllocator &) = delete;

  /// Process-wide allocator, starting at 1.
  static BatchIdAllocator &instance();

  uint64_t next() { return next_.fetch_add(1, std::memory_order_relaxed); }

  /// Ensure the next id handed out is greater than @p id. Never lowers it.
  void advancePast(uint64_t id);

  uint64_t peek() const { return next_.load(std::memory_order_relaxed); }

private:
  std::atomic<uint64_t> next_;
};

} // namespace merkseal

#endif // MERKSEAL_BATCH_ID_ALLOCATOR_HPP
