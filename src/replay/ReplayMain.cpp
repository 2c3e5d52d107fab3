// Repository: Reprise
// Component: Replay Harness
// Purpose: Runs one recovery session against a scripted engine and prints the outcome.
// Copyright (c) 2026 Reprise
//
// Diagnostics binary. The controller, resume store and notifier are the
// production components; only the engine is scripted.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reprise/advance/ExternalLookup.hpp"
#include "reprise/config/SessionConfig.hpp"
#include "reprise/engine/ScriptedMediaEngine.hpp"
#include "reprise/notify/AdvanceNotifier.hpp"
#include "reprise/notify/HttpTransport.hpp"
#include "reprise/recovery/SessionRecoveryController.h"
#include "reprise/resume/ResumeStore.hpp"
#include "reprise/runtime/SerialExecutor.hpp"
#include "reprise/session/ContentIdentity.hpp"
#include "reprise/util/Logger.hpp"

namespace {

using reprise::recovery::SessionRecoveryController;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string url;
  std::string script_path;
  std::string resume_file = "reprise_resume.jsonl";
  std::string callback;
  std::string stream_addon;
  std::optional<int64_t> resume_hint_ms;
  reprise::session::ContentHints hints;
  bool expect_result = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --url REF --script PATH [OPTIONS]\n"
            << "\n"
            << "Replays a scripted engine timeline through the session recovery controller.\n"
            << "\n"
            << "REQUIRED:\n"
            << "  --url REF             Content reference (URL or path)\n"
            << "  --script PATH         JSONL engine script (one event per line)\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --resume-file PATH    Resume store file (default: reprise_resume.jsonl)\n"
            << "  --callback URL        JSON-RPC callback (default: ?callback= on --url)\n"
            << "  --resume-hint-ms MS   Start position; overrides the resume store\n"
            << "  --season N            Season hint\n"
            << "  --episode N           Episode hint\n"
            << "  --show-id ID          Catalog id hint\n"
            << "  --stream-addon URL    Stream addon base URL for next-episode lookup\n"
            << "  --expect-result       Caller reads a structured result\n"
            << "  --help                Show this help message\n"
            << "\n"
            << "EXIT CODES: 0 terminal outcome, 1 startup failure, 2 usage error\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      const bool has_value = i + 1 < argc;
      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--url" && has_value) {
        args.url = argv[++i];
      } else if (arg == "--script" && has_value) {
        args.script_path = argv[++i];
      } else if (arg == "--resume-file" && has_value) {
        args.resume_file = argv[++i];
      } else if (arg == "--callback" && has_value) {
        args.callback = argv[++i];
      } else if (arg == "--stream-addon" && has_value) {
        args.stream_addon = argv[++i];
      } else if (arg == "--resume-hint-ms" && has_value) {
        args.resume_hint_ms = std::stoll(argv[++i]);
      } else if (arg == "--season" && has_value) {
        args.hints.season = std::stoi(argv[++i]);
      } else if (arg == "--episode" && has_value) {
        args.hints.episode = std::stoi(argv[++i]);
      } else if (arg == "--show-id" && has_value) {
        args.hints.show_id = argv[++i];
      } else if (arg == "--expect-result") {
        args.expect_result = true;
      } else {
        args.error = "Unknown or incomplete argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid numeric argument: ") + e.what();
    return args;
  }

  if (args.url.empty() || args.script_path.empty()) {
    args.error = "--url and --script are required";
    return args;
  }
  args.valid = true;
  return args;
}

void PrintOutcome(const reprise::session::TerminalOutcome& outcome) {
  std::cout << "outcome=" << reprise::session::OutcomeKindName(outcome.kind) << "\n"
            << "reason=" << outcome.reason << "\n";
  if (outcome.result) {
    std::cout << "result.position_ms=" << outcome.result->position_ms << "\n"
              << "result.duration_ms=" << outcome.result->duration_ms << "\n";
    if (outcome.result->season) std::cout << "result.season=" << *outcome.result->season << "\n";
    if (outcome.result->episode) {
      std::cout << "result.episode=" << *outcome.result->episode << "\n";
    }
  }
  if (outcome.next) {
    std::cout << "next.content_ref=" << outcome.next->content_ref << "\n"
              << "next.kind=" << reprise::session::DescribeKind(outcome.next->kind) << "\n";
  }
}

// Runs `fn` on `executor` and waits for it.
template <typename Fn>
auto RunOn(reprise::runtime::ISerialExecutor& executor, Fn fn) -> decltype(fn()) {
  std::packaged_task<decltype(fn())()> task(std::move(fn));
  auto future = task.get_future();
  auto shared = std::make_shared<decltype(task)>(std::move(task));
  executor.Post([shared] { (*shared)(); });
  return future.get();
}

}  // namespace

int main(int argc, char* argv[]) {
  const CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::vector<reprise::engine::ScriptStep> steps;
  {
    std::ifstream in(args.script_path);
    if (!in) {
      std::cerr << "Error: cannot open script " << args.script_path << "\n";
      return 1;
    }
    try {
      steps = reprise::engine::ParseEngineScript(in);
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  reprise::config::SessionConfig config = reprise::config::SessionConfig::FromEnvironment();
  config.expect_result = args.expect_result;

  std::unique_ptr<reprise::resume::FileResumeStore> resume_store;
  try {
    resume_store = std::make_unique<reprise::resume::FileResumeStore>(args.resume_file);
  } catch (const std::exception& e) {
    std::cerr << "Error: resume store: " << e.what() << "\n";
    return 1;
  }

  auto transport = std::make_shared<reprise::notify::CurlHttpTransport>();
  reprise::notify::JsonRpcNotifier notifier(
      reprise::notify::ResolveCallbackUrl(args.callback, args.url), transport,
      config.rpc_timeout_ms, config.max_pending_messages);

  reprise::runtime::ThreadSerialExecutor serial("session");
  reprise::runtime::ThreadSerialExecutor background("lookup");
  reprise::runtime::ThreadSerialExecutor timeline("engine");

  SessionRecoveryController::Dependencies deps;
  deps.serial = &serial;
  deps.background = &background;
  deps.resume_store = resume_store.get();
  deps.notifier = &notifier;
  if (!args.stream_addon.empty()) {
    deps.streams = std::make_shared<reprise::advance::HttpStreamResolver>(
        args.stream_addon, transport, config.rpc_timeout_ms);
  }
  deps.engine_factory = [&timeline, &steps]() -> std::unique_ptr<reprise::engine::IMediaEngine> {
    return std::make_unique<reprise::engine::ScriptedMediaEngine>(timeline, steps);
  };

  reprise::session::Session session;
  session.content_ref = args.url;
  session.kind = reprise::session::ResolveContentIdentity(args.hints, args.url);

  auto outcome_promise = std::make_shared<std::promise<reprise::session::TerminalOutcome>>();
  auto outcome_future = outcome_promise->get_future();

  auto controller = std::make_unique<SessionRecoveryController>(deps, config);
  controller->SetOutcomeCallback(
      [outcome_promise](const reprise::session::TerminalOutcome& outcome) {
        outcome_promise->set_value(outcome);
      });

  const auto start = RunOn(serial, [&controller, &session, &args] {
    return controller->Start(session, args.resume_hint_ms);
  });
  if (!start.success) {
    std::cerr << "Error: " << start.message << "\n";
    RunOn(serial, [&controller] { controller.reset(); });
    return 1;
  }
  std::cerr << "[HARNESS] " << reprise::session::DescribeKind(session.kind) << " started at "
            << start.start_position_ms << "ms\n";

  bool stop_requested = false;
  while (outcome_future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
    if (!stop_requested && g_termination_requested.load(std::memory_order_acquire)) {
      stop_requested = true;
      std::cerr << "[HARNESS] termination requested, stopping session\n";
      serial.Post([&controller] { controller->Stop(); });
    }
  }
  const reprise::session::TerminalOutcome outcome = outcome_future.get();

  // Controller and engine go away on the session sequence; the timeline
  // outlives the engine.
  RunOn(serial, [&controller] {
    controller->Stop();
    controller.reset();
  });
  timeline.Shutdown();
  background.Shutdown();
  serial.Shutdown();
  notifier.WaitIdle();
  if (!resume_store->Flush()) {
    reprise::util::Logger::Warn("[HARNESS] resume store flush failed");
  }

  PrintOutcome(outcome);
  const auto stats = notifier.GetStats();
  std::cerr << "[HARNESS] notifier delivered=" << stats.delivered << " failed=" << stats.failed
            << " dropped=" << stats.dropped << "\n";
  return 0;
}
