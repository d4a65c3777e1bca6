#include "mnemonic_sieve/control_server.hpp"
#include "mnemonic_sieve/batch_runner.hpp"
#include "mnemonic_sieve/progress.hpp"
#include "mnemonic_sieve/report_writer.hpp"
#include "mnemonic_sieve/run_json.hpp"

#include <httplib.h>
#include <simdjson.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace ms {

static const char* kJson = "application/json; charset=utf-8";

static std::string html_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default:  out += c; break;
    }
  }
  return out;
}

static std::string message_json(const std::string& key, const std::string& msg) {
  return "{\"" + key + "\":" + json_quote(msg) + "}";
}

// Reads optional "input"/"output" string overrides.
static bool parse_start_body(const std::string& body, RunConfig& cfg, std::string& err) {
  if (body.find_first_not_of(" \t\r\n") == std::string::npos) return true;
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(body);
    auto doc = parser.iterate(padded);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      const std::string_view key = field.unescaped_key();
      if (key == "input") {
        cfg.input_path = std::string(std::string_view(field.value().get_string()));
      } else if (key == "output") {
        cfg.output_path = std::string(std::string_view(field.value().get_string()));
        cfg.auto_output = false;
      } else {
        err = "unknown field '" + std::string(key) + "'";
        return false;
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    err = std::string("invalid JSON body: ") + e.what();
    return false;
  }
  return true;
}

struct ControlServer::Impl {
  Config cfg;
  RunConfig base;
  LinePredicate pred;
  httplib::Server svr;
  int bound_port = -1;

  std::mutex mu;                  // active, worker
  std::shared_ptr<BatchRunner> active;
  std::thread worker;

  std::mutex last_mu;             // written by the run thread
  bool have_last = false;
  std::string last_run_json;

  Impl(Config c, RunConfig b, LinePredicate p)
    : cfg(std::move(c)), base(std::move(b)), pred(std::move(p)) {}

  // Idle counts: the run thread may not have entered run() yet.
  bool running() const {
    if (!active) return false;
    const RunState s = active->state();
    return s == RunState::Idle || s == RunState::Running;
  }

  // Cancelled run whose pipeline outlived the grace period and still
  // writes to its output file.
  bool draining() const { return active && active->pipeline_active(); }

  std::string state_name() {
    std::lock_guard<std::mutex> lk(mu);
    return to_string(active ? active->state() : RunState::Idle);
  }

  std::string progress_json() {
    std::shared_ptr<BatchRunner> r;
    {
      std::lock_guard<std::mutex> lk(mu);
      r = active;
    }
    ProgressSnapshot snap = r ? r->progress() : ProgressSnapshot{};
    std::string body = to_json(snap);
    // splice "state" into the snapshot object
    body.insert(body.size() - 1, ",\"state\":" + json_quote(state_name()));
    return body;
  }

  std::string index_html() {
    const ProgressSnapshot snap = [&] {
      std::lock_guard<std::mutex> lk(mu);
      return active ? active->progress() : ProgressSnapshot{};
    }();
    std::string html = "<!doctype html><html><head><meta charset='utf-8'>"
                       "<title>mnemonic-sieve</title></head><body><h1>mnemonic-sieve</h1>";
    html += "<p>State: " + html_escape(state_name()) + "</p>";
    html += "<p>" + html_escape(format_progress_line(snap)) + "</p>";
    if (!snap.status.empty()) html += "<p>Status: " + html_escape(snap.status) + "</p>";
    html += "<p><a href=\"/progress\">progress</a> | <a href=\"/report\">last report</a></p>";
    html += "</body></html>";
    return html;
  }

  // Called with mu held; the run thread never takes mu.
  void reap() {
    if (worker.joinable() && !running()) worker.join();
  }

  int start(const std::string& body, std::string& reply) {
    RunConfig rc = base;
    std::string err;
    if (!parse_start_body(body, rc, err)) {
      reply = message_json("error", err);
      return 400;
    }
    if (!validate(rc, &err)) {
      reply = message_json("error", err);
      return 400;
    }

    std::lock_guard<std::mutex> lk(mu);
    if (running()) {
      reply = message_json("error", "a run is already active");
      return 409;
    }
    if (draining()) {
      reply = message_json("error", "previous run still draining");
      return 409;
    }
    reap();

    BatchRunner::Options opt = BatchRunner::options_from(rc);
    opt.log_to_console = !rc.quiet;
    auto runner = std::make_shared<BatchRunner>(std::move(opt), pred);
    active = runner;
    const std::string report_dir = rc.report_dir;
    worker = std::thread([this, runner, report_dir] {
      RunOutcome o = runner->run();
      const std::string rj = RunJsonWriter::to_json(o);
      if (!report_dir.empty()) {
        std::string rerr;
        if (!write_run_report(report_dir, o, &rerr))
          std::cerr << "[report] " << rerr << "\n";
      }
      std::lock_guard<std::mutex> g(last_mu);
      have_last = true;
      last_run_json = rj;
    });
    std::cerr << "[http] run started: " << rc.input_path << " -> " << rc.output_path << "\n";
    reply = message_json("status", "started");
    return 202;
  }

  bool cancel() {
    std::lock_guard<std::mutex> lk(mu);
    if (!running()) return false;
    return active->cancel(CancelReason::Request);
  }

  void join() {
    std::thread t;
    {
      std::lock_guard<std::mutex> lk(mu);
      t = std::move(worker);
    }
    if (t.joinable()) t.join();
  }

  void routes() {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Get("/progress", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(progress_json(), kJson);
    });

    svr.Post("/start", [this](const httplib::Request& req, httplib::Response& res) {
      std::string reply;
      res.status = start(req.body, reply);
      res.set_content(reply, kJson);
    });

    svr.Post("/cancel", [this](const httplib::Request&, httplib::Response& res) {
      if (!cancel()) {
        res.status = 409;
        res.set_content(message_json("error", "no active run"), kJson);
        return;
      }
      std::cerr << "[http] cancel requested\n";
      res.status = 202;
      res.set_content(message_json("status", "cancelling"), kJson);
    });

    svr.Get("/report", [this](const httplib::Request&, httplib::Response& res) {
      std::lock_guard<std::mutex> lk(last_mu);
      if (!have_last) {
        res.status = 404;
        res.set_content(message_json("error", "no finished run"), kJson);
        return;
      }
      res.set_content(last_run_json, kJson);
    });
  }
};

ControlServer::ControlServer(Config cfg, RunConfig base, LinePredicate pred)
  : p_(new Impl(std::move(cfg), std::move(base), std::move(pred))) { p_->routes(); }

ControlServer::~ControlServer() {
  stop();
  cancel_active();
  join_active();
  delete p_;
}

bool ControlServer::bind() {
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.host);
    return p_->bound_port > 0;
  }
  if (!p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) return false;
  p_->bound_port = p_->cfg.port;
  return true;
}

int ControlServer::port() const { return p_->bound_port; }

bool ControlServer::listen() {
  if (p_->bound_port < 0 && !bind()) return false;
  return p_->svr.listen_after_bind();
}

void ControlServer::stop() { p_->svr.stop(); }
bool ControlServer::is_listening() const { return p_->svr.is_running(); }
bool ControlServer::cancel_active() { return p_->cancel(); }
void ControlServer::join_active() { p_->join(); }

}
