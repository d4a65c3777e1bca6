#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ms {

// Single append-only destination shared by all workers. One writer at a
// time; others block on the lock.
class OutputSink {
public:
  struct Config {
    bool        dedup        = false;      // skip lines already in the file or written this run
    std::size_t buffer_bytes = 64 * 1024;
  };

  enum class Append { Written, Duplicate, Failed };

  explicit OutputSink(std::string path);
  OutputSink(std::string path, Config cfg);
  ~OutputSink();

  OutputSink(const OutputSink&) = delete;
  OutputSink& operator=(const OutputSink&) = delete;

  // Creates parent directories and opens in append mode.
  bool open(std::string* err = nullptr);

  // Writes `line` plus '\n'. Failed is sticky: every later call fails too.
  Append append(std::string_view line);

  bool flush(std::string* err = nullptr);
  void close();

  std::uint64_t lines_written() const noexcept;
  std::uint64_t duplicates() const noexcept;
  bool failed() const noexcept;
  std::string error() const;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
