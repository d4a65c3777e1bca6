#pragma once
#include "mnemonic_sieve/config.hpp"
#include "mnemonic_sieve/predicate.hpp"
#include <string>

namespace ms {

// cpp-httplib front end for runs:
//   GET  /          status page
//   GET  /progress  latest progress snapshot + state (JSON)
//   POST /start     start a run; optional body {"input": "...", "output": "..."};
//                   409 while a run is active or a cancelled run still drains
//   POST /cancel    cancel the active run
//   GET  /report    run.json of the last finished run
// One run at a time; runs execute on a background thread.
class ControlServer {
public:
  struct Config {
    std::string host = "0.0.0.0";
    int port = 8080;
  };

  ControlServer(Config cfg, RunConfig base, LinePredicate pred);
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Non-blocking bind; false on bind error. Port 0 picks a free port.
  bool bind();
  int port() const;

  // Blocking; returns when stop() is called.
  bool listen();
  // stop() before listen() has started accepting is lost.
  void stop();
  bool is_listening() const;

  // Cancels the active run, if any. False when nothing was running.
  bool cancel_active();

  // Waits for the background run to finish.
  void join_active();

private:
  struct Impl;
  Impl* p_;
};

}
