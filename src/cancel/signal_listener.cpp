#include "mnemonic_sieve/cancellation.hpp"
#include <pthread.h>
#include <signal.h>
#include <utility>

namespace ms {

const char* to_string(CancelReason r) noexcept {
  switch (r) {
    case CancelReason::None:      return "none";
    case CancelReason::Interrupt: return "interrupt";
    case CancelReason::Request:   return "request";
    case CancelReason::Failure:   return "failure";
  }
  return "unknown";
}

// The target runs under mu_, so detach() returning means it is not running.
void InterruptRouter::interrupt() {
  std::lock_guard<std::mutex> lk(mu_);
  if (target_) {
    target_(CancelReason::Interrupt);
    return;
  }
  pending_ = true;
}

bool InterruptRouter::attach(Target t) {
  std::lock_guard<std::mutex> lk(mu_);
  target_ = std::move(t);
  if (!pending_ || !target_) return false;
  pending_ = false;
  target_(CancelReason::Interrupt);
  return true;
}

void InterruptRouter::detach() {
  std::lock_guard<std::mutex> lk(mu_);
  target_ = nullptr;
}

bool InterruptRouter::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_;
}

static sigset_t make_set(const std::vector<int>& signals) {
  sigset_t set;
  sigemptyset(&set);
  for (int s : signals) sigaddset(&set, s);
  sigaddset(&set, SIGUSR2);
  return set;
}

SignalListener::SignalListener(Handler h, std::initializer_list<int> signals)
  : handler_(std::move(h)), signals_(signals) {
  sigset_t set = make_set(signals_);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  th_ = std::thread([this]{ loop(); });
}

SignalListener::~SignalListener() { stop(); }

void SignalListener::loop() {
  const sigset_t set = make_set(signals_);
  while (true) {
    int signo = 0;
    if (sigwait(&set, &signo) != 0) continue;
    if (stopping_.load(std::memory_order_acquire)) return;
    if (signo == SIGUSR2) continue;
    const int n = count_.fetch_add(1) + 1;
    if (handler_) handler_(signo, n);
  }
}

void SignalListener::stop() {
  if (!th_.joinable()) return;
  stopping_.store(true, std::memory_order_release);
  pthread_kill(th_.native_handle(), SIGUSR2);
  th_.join();
}

}
