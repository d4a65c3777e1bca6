#include "mnemonic_sieve/batch_runner.hpp"
#include "mnemonic_sieve/cancellation.hpp"
#include "mnemonic_sieve/config.hpp"
#include "mnemonic_sieve/control_server.hpp"
#include "mnemonic_sieve/predicate.hpp"
#include "mnemonic_sieve/progress.hpp"
#include "mnemonic_sieve/report_writer.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Routes the first interrupt to the runner or the server; holds it until
// one of them attaches.
ms::InterruptRouter g_router;

void on_signal(int signo, int count) {
  if (count > 1) {
    // checkpoint was already written by the first interrupt
    std::cerr << "\n[signal] second interrupt, exiting now\n";
    std::fflush(stdout);
    std::_Exit(0);
  }
  std::cerr << "\n[signal] received signal " << signo << ", stopping...\n";
  g_router.interrupt();
}

int serve(const ms::RunConfig& cfg, ms::LinePredicate pred) {
  ms::ControlServer::Config scfg;
  scfg.port = cfg.port;
  ms::ControlServer server(scfg, cfg, std::move(pred));
  if (!server.bind()) {
    std::cerr << "Server failed to start on port " << cfg.port << "\n";
    return 1;
  }
  std::cout << "[http] listening on port " << server.port() << std::endl;

  std::atomic<bool> finished{false};
  bool ok = false;
  std::thread th([&] {
    ok = server.listen();
    finished.store(true);
  });
  // attach once stop() can take effect
  while (!finished.load() && !server.is_listening())
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  g_router.attach([&server](ms::CancelReason) {
    server.cancel_active();
    server.stop();
  });
  th.join();
  g_router.detach();

  server.cancel_active();
  server.join_active();
  return ok ? 0 : 1;
}

int run_once(const ms::RunConfig& cfg, ms::LinePredicate pred) {
  ms::ProgressReporter::Callback on_progress;
  if (!cfg.quiet) {
    on_progress = [](const ms::ProgressSnapshot& s) {
      std::cout << "\r\x1B[K" << ms::format_progress_line(s) << std::flush;
    };
  }

  ms::BatchRunner::Options opt = ms::BatchRunner::options_from(cfg);
  opt.log_to_console = !cfg.quiet;
  ms::BatchRunner runner(std::move(opt), std::move(pred), std::move(on_progress));
  // an interrupt received during start-up cancels the run before it begins
  g_router.attach([&runner](ms::CancelReason why) { runner.cancel(why); });
  const ms::RunOutcome out = runner.run();
  g_router.detach();
  if (!cfg.quiet) std::cout << "\n";

  switch (out.state) {
    case ms::RunState::Completed:
      std::cout << "Validation complete!\n"
                << "Valid mnemonics found: " << out.valid << "\n"
                << "Time taken: " << ms::format_duration(out.wall_seconds) << "\n"
                << "Processing speed: " << static_cast<std::uint64_t>(out.lines_per_sec)
                << " lines/s\n";
      break;
    case ms::RunState::Cancelled:
      std::cout << "Cancelled. Checkpoint saved at position: " << out.checkpoint << "\n";
      break;
    default:
      std::cerr << "\nError: " << out.error << "\n";
      break;
  }

  if (!cfg.report_dir.empty()) {
    std::string err;
    if (ms::write_run_report(cfg.report_dir, out, &err))
      std::cout << "[report] " << cfg.report_dir << "/report.html\n";
    else
      std::cerr << "[report] " << err << "\n";
  }

  if (!out.drained) {
    std::cerr << "[run] " << out.error << ", exiting\n";
    std::fflush(stdout);
    std::_Exit(ms::exit_code(out));
  }
  return ms::exit_code(out);
}

}

int main(int argc, char** argv) {
  // before any other thread exists, so every thread inherits the blocked mask
  ms::SignalListener signals(on_signal);

  ms::RunConfig cfg;
  const ms::CliResult cli = ms::parse_cli(argc, argv, cfg);
  if (cli.action == ms::CliAction::Help) {
    std::cout << ms::usage();
    return 0;
  }
  if (cli.action == ms::CliAction::Error) {
    std::cerr << "[config] " << cli.error << "\n" << ms::usage();
    return 2;
  }

  if (!cfg.serve && !std::filesystem::exists(cfg.input_path)) {
    std::cerr << "Error: Input file not found at '" << cfg.input_path << "'\n";
    return 1;
  }

  auto validator = std::make_shared<ms::MnemonicValidator>();
  std::string err;
  if (!validator->load_wordlist(cfg.wordlist_path, &err)) {
    std::cerr << "Error: " << err << "\n";
    return 1;
  }

  const int rc = cfg.serve ? serve(cfg, validator->as_predicate())
                           : run_once(cfg, validator->as_predicate());
  signals.stop();
  return rc;
}
