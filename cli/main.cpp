#include <keycadence/cli/options.hpp>
#include <keycadence/engine/engine.hpp>
#include <keycadence/keyboard/sender.hpp>
#include <keycadence/log.hpp>
#include <keycadence/process/watcher.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

using namespace keycadence;

static volatile std::sig_atomic_t g_stop_requested = 0;
static void stop_sig_handler(int) { g_stop_requested = 1; }

namespace {

// Forwards SIGINT/SIGTERM to the engine. The handler only sets a flag; the
// relay thread turns it into a cancellation.
class SignalRelay {
public:
  explicit SignalRelay(engine::Control &control) : m_control(control) {
    std::signal(SIGINT, stop_sig_handler);
    std::signal(SIGTERM, stop_sig_handler);
    m_thread = std::thread([this] {
      while (!m_done.load()) {
        if (g_stop_requested) {
          KEYCADENCE_LOG_INFO("keycadence: stop requested by signal");
          m_control.cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });
  }

  ~SignalRelay() {
    m_done.store(true);
    if (m_thread.joinable())
      m_thread.join();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
  }

  SignalRelay(const SignalRelay &) = delete;
  SignalRelay &operator=(const SignalRelay &) = delete;

private:
  engine::Control &m_control;
  std::atomic<bool> m_done{false};
  std::thread m_thread;
};

int run(const cli::Options &opts) {
  engine::Settings base;
  if (opts.configPath)
    base = engine::loadSettings(*opts.configPath);
  const engine::Settings settings = cli::mergeSettings(opts, base);

  keyboard::KeyResolver resolver;
  const engine::Configuration config = engine::validate(settings, resolver);

  if (opts.saveConfigPath) {
    engine::saveSettings(settings, *opts.saveConfigPath);
    std::cout << "Configuration saved to: " << *opts.saveConfigPath << "\n";
  }

  std::cout << engine::describe(config) << "\n"
            << "Press Ctrl+C to stop.\n\n";

  keyboard::Sender sender;
  if (!sender.isReady()) {
    KEYCADENCE_LOG_WARN("keycadence: input injection is not available; "
                        "keystrokes will fail");
  }

  engine::Control control;
  engine::ConsoleReporter reporter(std::cout);
  engine::Engine eng(
      {sender, process::makeSystemProcessSource(), control, reporter});

  SignalRelay relay(control);
  const engine::RunOutcome outcome = eng.run(config);
  KEYCADENCE_LOG_INFO("keycadence: finished with %s",
                      engine::runOutcomeToString(outcome));
  return cli::exitCodeFor(outcome);
}

} // namespace

int main(int argc, char **argv) {
  cli::Options opts;
  try {
    opts = cli::parseArguments(argc, argv);
  } catch (const Error &e) {
    std::cerr << "Error: " << e.what() << "\n\n" << cli::usage();
    return cli::exitCodeFor(e.kind());
  }

  if (opts.help) {
    std::cout << cli::usage();
    return cli::kExitOk;
  }
  if (opts.version) {
    std::cout << "keycadence " << libraryVersion() << "\n";
    return cli::kExitOk;
  }
  if (opts.debug)
    log::setLevel(log::Level::Debug);

  std::cout << cli::banner() << "\n";
  KEYCADENCE_LOG_INFO("keycadence: started argc=%d", argc);

  try {
    return run(opts);
  } catch (const Error &e) {
    KEYCADENCE_LOG_ERROR("keycadence: %s (%s)", e.what(),
                         errorKindToString(e.kind()));
    std::cerr << "Error: " << e.what() << "\n";
    return cli::exitCodeFor(e.kind());
  } catch (const std::exception &e) {
    KEYCADENCE_LOG_ERROR("keycadence: unexpected failure: %s", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
