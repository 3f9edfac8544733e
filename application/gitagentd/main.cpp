#include "server.hpp"

#include <gitagent/analyzer.hpp>
#include <gitagent/config.hpp>
#include <gitagent/repos.hpp>
#include <gitagent/router.hpp>
#include <gitagent/session.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <thread>

#include <pthread.h>

#ifndef GITAGENT_VERSION
#define GITAGENT_VERSION "unknown"
#endif

using namespace gitagent;

static void setup_logging(const Config &cfg) {
  if (cfg.log_file) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_file->string(), cfg.log_rotate_max, cfg.log_rotate_files);
      spdlog::set_default_logger(
          std::make_shared<spdlog::logger>("gitagentd", sink));
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("failed to open log file {}: {}; logging to stderr",
                   cfg.log_file->string(), e.what());
    }
  } else {
    spdlog::set_default_logger(spdlog::stderr_color_mt("gitagentd"));
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (cfg.verbose)
    spdlog::set_level(spdlog::level::debug);
}

int main(int argc, char **argv) {
  auto pr = parse_cli(argc, argv, std::getenv("GITAGENT_ANALYZER_CMD"));
  if (!pr.cfg) {
    spdlog::error("{}", pr.error);
    print_usage(argv[0]);
    return 2;
  }
  const Config &cfg = *pr.cfg;
  if (cfg.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (cfg.version) {
    fmt::print("gitagentd {}\n", GITAGENT_VERSION);
    return 0;
  }

  setup_logging(cfg);

  // Signals are taken synchronously by one thread; every other thread
  // inherits the blocked mask.
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  SessionManager sessions(cfg.session_options());
  if (cfg.repo) {
    std::string err;
    if (!sessions.select(*cfg.repo, &err))
      spdlog::error("cannot open initial repository {}: {}",
                    cfg.repo->string(), err);
  }

  std::shared_ptr<Analyzer> analyzer;
  if (!cfg.analyzer_cmd.empty()) {
    analyzer = std::make_shared<CommandAnalyzer>(cfg.analyzer_cmd);
    spdlog::info("analysis via {}", cfg.analyzer_cmd.front());
  } else {
    spdlog::info("no analyzer configured; polls will not carry summaries");
  }

  auto roots = cfg.repo_search;
  if (roots.empty()) {
    const char *home = std::getenv("HOME");
    if (home && *home)
      roots = default_search_roots(home);
  }
  Router router(sessions, analyzer, roots);

  std::unique_ptr<gitagentd::Server> srv;
  try {
    srv = std::make_unique<gitagentd::Server>(
        cfg.addr, cfg.port, cfg.workers,
        [&router](const Request &r) { return router.handle(r); });
  } catch (const std::exception &e) {
    spdlog::error("cannot listen on {}:{}: {}", cfg.addr, cfg.port, e.what());
    return 1;
  }

  std::thread sig_th([&] {
    int sig = 0;
    sigwait(&sigs, &sig);
    spdlog::info("signal {} received, shutting down", sig);
    srv->stop();
  });

  srv->run();
  sig_th.join();

  sessions.shutdown();
  spdlog::info("bye");
  return 0;
}
