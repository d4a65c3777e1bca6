#include "mnemonic_sieve/cancellation.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>
#include <signal.h>
#include <unistd.h>

static int fails = 0;
static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

int main(){
  {
    ms::CancellationToken t;
    expect(!t.cancelled() && t.reason() == ms::CancelReason::None, "fresh token");
    std::atomic<int> winners{0};
    std::vector<std::thread> ts;
    for (int i = 0; i < 8; ++i)
      ts.emplace_back([&]{ if (t.request(ms::CancelReason::Request)) ++winners; });
    for (auto& th : ts) th.join();
    expect(winners.load() == 1, "exactly one request flips the token");
    expect(!t.request(ms::CancelReason::Failure) && t.reason() == ms::CancelReason::Request,
           "first reason wins");
  }

  // signals are consumed by the listener thread, counted, and never kill the process
  {
    std::atomic<int> seen{0};
    std::atomic<int> last_count{0};
    ms::SignalListener l([&](int signo, int count){
      if (signo == SIGINT) ++seen;
      last_count = count;
    });
    // process-directed, and one at a time: pending signals of the same kind merge
    for (int want = 1; want <= 2; ++want) {
      ::kill(::getpid(), SIGINT);
      for (int i = 0; i < 200 && seen.load() < want; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    l.stop();
    expect(seen.load() == 2 && last_count.load() == 2 && l.received() == 2, "two interrupts delivered in order");
    l.stop();  // idempotent
  }

  // an interrupt with nothing attached waits for the next owner
  {
    ms::InterruptRouter router;
    std::vector<ms::CancelReason> got;
    router.interrupt();
    expect(router.pending(), "interrupt before attach is held");
    expect(router.attach([&](ms::CancelReason why){ got.push_back(why); }), "attach delivers the held interrupt");
    expect(got.size() == 1 && got[0] == ms::CancelReason::Interrupt && !router.pending(),
           "held interrupt delivered once");

    router.interrupt();
    expect(got.size() == 2 && !router.pending(), "attached target receives the interrupt directly");

    router.detach();
    router.interrupt();
    expect(got.size() == 2 && router.pending(), "after detach the interrupt is held again");
    std::vector<ms::CancelReason> next;
    expect(router.attach([&](ms::CancelReason why){ next.push_back(why); }) && next.size() == 1,
           "next owner receives it");
  }
  {
    ms::InterruptRouter router;
    int calls = 0;
    expect(!router.attach([&](ms::CancelReason){ ++calls; }) && calls == 0, "attach without a pending interrupt");
  }

  // a signal sent before anything is attached still reaches the owner
  {
    ms::InterruptRouter router;
    std::atomic<int> seen{0};
    ms::SignalListener l([&](int, int){ router.interrupt(); ++seen; });
    ::kill(::getpid(), SIGINT);
    for (int i = 0; i < 200 && seen.load() < 1; ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ms::CancellationToken token;
    router.attach([&](ms::CancelReason why){ token.request(why); });
    l.stop();
    expect(token.reason() == ms::CancelReason::Interrupt, "early signal cancels the late owner");
  }

  if (fails) return 1;
  std::cout << "[PASS] cancellation\n";
  return 0;
}
