#pragma once
#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <thread>
#include <vector>

namespace ms {

enum class CancelReason { None, Interrupt, Request, Failure };

const char* to_string(CancelReason r) noexcept;

// false -> true only; the first reason wins.
class CancellationToken {
public:
  // True for the call that flipped the flag.
  bool request(CancelReason why) noexcept {
    int expected = static_cast<int>(CancelReason::None);
    return reason_.compare_exchange_strong(expected, static_cast<int>(why),
                                           std::memory_order_acq_rel);
  }

  bool cancelled() const noexcept {
    return reason_.load(std::memory_order_acquire) != static_cast<int>(CancelReason::None);
  }

  CancelReason reason() const noexcept {
    return static_cast<CancelReason>(reason_.load(std::memory_order_acquire));
  }

private:
  std::atomic<int> reason_{static_cast<int>(CancelReason::None)};
};

// Hands an interrupt to whatever currently owns the work. An interrupt that
// arrives while nothing is attached stays pending and is delivered by the
// next attach(), so a signal sent during start-up is not lost.
class InterruptRouter {
public:
  using Target = std::function<void(CancelReason)>;

  void interrupt();

  // True if a pending interrupt was delivered to `t` during the call.
  bool attach(Target t);
  void detach();
  bool pending() const;

private:
  mutable std::mutex mu_;
  Target target_;
  bool pending_ = false;
};

// Dedicated listener thread for process signals. The constructor blocks
// the signals in the calling thread, so it must run before any worker
// threads exist; threads created afterwards inherit the mask and the
// signals are only ever consumed here via sigwait().
class SignalListener {
public:
  using Handler = std::function<void(int signo, int count)>;

  explicit SignalListener(Handler h, std::initializer_list<int> signals = {SIGINT, SIGTERM});
  ~SignalListener();

  SignalListener(const SignalListener&) = delete;
  SignalListener& operator=(const SignalListener&) = delete;

  // Joins the listener; wakes it with SIGUSR2.
  void stop();
  int received() const noexcept { return count_.load(); }

private:
  void loop();

  Handler handler_;
  std::vector<int> signals_;
  std::atomic<bool> stopping_{false};
  std::atomic<int> count_{0};
  std::thread th_;
};

}
