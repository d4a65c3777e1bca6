#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ms {

// Parse checkpoint text: optional surrounding whitespace around one
// non-negative decimal integer. Anything else is nullopt.
std::optional<std::uint64_t> parse_checkpoint(std::string_view text);

// Resume marker persisted as plain decimal text at a fixed path.
// save() goes through "<path>.tmp" + rename and never persists a value
// lower than the highest one this store has loaded or written.
class CheckpointStore {
public:
  explicit CheckpointStore(std::string path);

  // 0 when the file is absent or unparsable (logged, never fatal).
  std::uint64_t load();

  bool save(std::uint64_t index, std::string* err = nullptr);

  // Writes `index` even below the floor, which then drops to it. For when
  // output behind the saved value never reached the file.
  bool rewind(std::uint64_t index, std::string* err = nullptr);

  // Absent file is not an error.
  bool remove(std::string* err = nullptr);

  bool exists() const;
  std::uint64_t floor() const;
  const std::string& path() const noexcept { return path_; }

private:
  bool write_locked(std::uint64_t index, std::string* err);

  std::string path_;
  mutable std::mutex mu_;
  std::uint64_t floor_{0};
};

// Monotonic maximum shared by concurrent writers.
class HighWaterMark {
public:
  explicit HighWaterMark(std::uint64_t initial = 0) noexcept : v_(initial) {}

  // True only when the stored value increased.
  bool raise(std::uint64_t candidate) noexcept {
    std::uint64_t cur = v_.load(std::memory_order_relaxed);
    while (candidate > cur) {
      if (v_.compare_exchange_weak(cur, candidate, std::memory_order_acq_rel,
                                   std::memory_order_relaxed))
        return true;
    }
    return false;
  }

  std::uint64_t value() const noexcept { return v_.load(std::memory_order_acquire); }

private:
  std::atomic<std::uint64_t> v_;
};

}
