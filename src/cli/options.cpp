/**
 * @file cli/options.cpp
 * @brief Hand-rolled argument parsing and settings merging.
 */

#include <keycadence/cli/options.hpp>

#include <keycadence/engine/duration.hpp>
#include <keycadence/log.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace keycadence::cli {

namespace {

constexpr std::chrono::milliseconds kDefaultInterval{1000};

[[noreturn]] void invalid(const std::string &message) {
  throw Error(ErrorKind::InvalidConfiguration, message);
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    const size_t pos = s.find(sep, start);
    parts.push_back(s.substr(start, pos == std::string_view::npos
                                        ? std::string_view::npos
                                        : pos - start));
    if (pos == std::string_view::npos)
      break;
    start = pos + 1;
  }
  return parts;
}

uint32_t parseCount(const std::string &flag, const std::string &value) {
  const std::string_view v = trim(value);
  if (v.empty() || !std::ranges::all_of(v, [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      }))
    invalid(flag + " expects a non-negative integer, got '" + value + "'");
  uint64_t n = 0;
  for (char c : v) {
    n = n * 10 + static_cast<uint64_t>(c - '0');
    if (n > std::numeric_limits<uint32_t>::max())
      invalid(flag + " value '" + value + "' is too large");
  }
  return static_cast<uint32_t>(n);
}

bool parseBool(const std::string &flag, const std::string &value) {
  std::string v(trim(value));
  std::ranges::transform(v, v.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  if (v == "true" || v == "1" || v == "yes" || v == "on")
    return true;
  if (v == "false" || v == "0" || v == "no" || v == "off")
    return false;
  invalid(flag + " expects true or false, got '" + value + "'");
}

std::chrono::milliseconds parseListDuration(std::string_view text,
                                            std::string_view entry) {
  try {
    return engine::parseDuration(text);
  } catch (const Error &e) {
    invalid("Invalid interval in '" + std::string(entry) + "': " + e.what());
  }
}

// Splits "key[:dur]" entries separated by @p sep.
template <typename Entry>
std::vector<Entry> parseList(std::string_view text, char sep,
                             const char *what) {
  std::vector<Entry> out;
  for (std::string_view raw : split(text, sep)) {
    const std::string_view part = trim(raw);
    if (part.empty())
      continue;
    const std::vector<std::string_view> fields = split(part, ':');
    if (fields.size() > 2)
      invalid("Invalid " + std::string(what) + " entry '" + std::string(part) +
              "'. Use 'key:interval' or just 'key'");
    const std::string key(trim(fields[0]));
    if (key.empty())
      invalid("Missing key in " + std::string(what) + " entry '" +
              std::string(part) + "'");
    const auto interval = fields.size() == 2
                              ? parseListDuration(fields[1], part)
                              : kDefaultInterval;
    out.push_back({key, interval});
  }
  if (out.empty())
    invalid("Empty " + std::string(what) + " provided");
  return out;
}

} // namespace

std::vector<engine::SequenceEntry> parseSequenceList(std::string_view text) {
  return parseList<engine::SequenceEntry>(text, ',', "key sequence");
}

std::vector<engine::IndependentEntry>
parseIndependentList(std::string_view text) {
  return parseList<engine::IndependentEntry>(text, ';', "independent keys");
}

Options parseArguments(int argc, const char *const *argv) {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::optional<std::string> inlineValue;
    if (arg.rfind("--", 0) == 0) {
      const auto eq = arg.find('=');
      if (eq != std::string::npos) {
        inlineValue = arg.substr(eq + 1);
        arg.resize(eq);
      }
    }

    auto value = [&]() -> std::string {
      if (inlineValue)
        return *inlineValue;
      if (i + 1 >= argc)
        invalid(arg + " requires an argument");
      return argv[++i];
    };
    auto noValue = [&] {
      if (inlineValue)
        invalid(arg + " does not take a value");
    };

    if (arg == "-h" || arg == "--help") {
      noValue();
      opts.help = true;
    } else if (arg == "--version") {
      noValue();
      opts.version = true;
    } else if (arg == "-p" || arg == "--process") {
      opts.process = value();
    } else if (arg == "-k" || arg == "--key") {
      opts.key = value();
    } else if (arg == "-i" || arg == "--interval") {
      const std::string v = value();
      try {
        opts.interval = engine::parseDuration(v);
      } catch (const Error &e) {
        invalid(std::string("--interval: ") + e.what());
      }
    } else if (arg == "-s" || arg == "--sequence") {
      opts.sequence = value();
    } else if (arg == "--independent-keys") {
      opts.independentKeys = value();
    } else if (arg == "-r" || arg == "--max-retries") {
      opts.maxRetries = parseCount("--max-retries", value());
    } else if (arg == "--pause-hotkey") {
      opts.pauseHotkey = value();
    } else if (arg == "-v" || arg == "--verbose") {
      noValue();
      opts.verbose = true;
    } else if (arg == "-c" || arg == "--config") {
      opts.configPath = value();
    } else if (arg == "--save-config") {
      opts.saveConfigPath = value();
    } else if (arg == "--loop-sequence") {
      opts.loopSequence = parseBool("--loop-sequence", value());
    } else if (arg == "--no-loop") {
      noValue();
      opts.loopSequence = false;
    } else if (arg == "--repeat-count") {
      opts.repeatCount = parseCount("--repeat-count", value());
    } else if (arg == "--debug") {
      noValue();
      opts.debug = true;
    } else {
      invalid("Unknown option '" + arg + "'");
    }
  }

  if (opts.sequence && opts.independentKeys)
    invalid("--sequence and --independent-keys cannot be combined; choose one "
            "mode");
  if (opts.key && (opts.sequence || opts.independentKeys))
    invalid("--key cannot be combined with --sequence or --independent-keys");
  return opts;
}

engine::Settings mergeSettings(const Options &options, engine::Settings base) {
  if (options.process)
    base.processName = *options.process;
  if (options.maxRetries)
    base.maxRetries = *options.maxRetries;
  if (options.pauseHotkey)
    base.pauseHotkey = *options.pauseHotkey;
  if (options.verbose)
    base.verbose = true;
  if (options.loopSequence)
    base.loopSequence = *options.loopSequence;
  if (options.repeatCount)
    base.repeatCount = *options.repeatCount;

  if (options.independentKeys) {
    base.independentKeys = parseIndependentList(*options.independentKeys);
    base.keySequence.clear();
  } else if (options.sequence) {
    base.keySequence = parseSequenceList(*options.sequence);
    base.independentKeys.clear();
  } else if (options.key) {
    base.keySequence = {
        {*options.key, options.interval.value_or(kDefaultInterval)}};
    base.independentKeys.clear();
  } else if (options.interval) {
    KEYCADENCE_LOG_WARN("--interval has no effect without --key");
  }
  return base;
}

std::string usage() {
  std::ostringstream os;
  os << "Usage: keycadence [options]\n"
     << "\n"
     << "Sends keystrokes to a window of a running process.\n"
     << "\n"
     << "  -p, --process NAME         target process (case-insensitive "
        "substring)\n"
     << "  -k, --key KEY              single key, e.g. r, space, f1, ctrl+c\n"
     << "  -i, --interval DUR         pause after --key (default 1000ms)\n"
     << "  -s, --sequence LIST        key:dur,key:dur,... pressed in order\n"
     << "      --independent-keys LIST\n"
     << "                             key:dur;key:dur;... each on its own "
        "timer\n"
     << "  -r, --max-retries N        attempts to find the process (default "
        "10)\n"
     << "      --pause-hotkey KEY     pause hotkey stored in the settings\n"
     << "  -v, --verbose              report every keystroke\n"
     << "  -c, --config PATH          load settings from a JSON file\n"
     << "      --save-config PATH     write the effective settings to PATH\n"
     << "      --loop-sequence BOOL   loop the sequence (default true)\n"
     << "      --no-loop              same as --loop-sequence false\n"
     << "      --repeat-count N       passes to run, 0 = unbounded (default "
        "0)\n"
     << "      --debug                debug logging\n"
     << "  -h, --help                 show this help\n"
     << "      --version              show the version\n"
     << "\n"
     << "Durations: N, Nms, Ns or Nm (N alone means milliseconds).\n";
  return os.str();
}

std::string banner() {
  std::ostringstream os;
  os << "keycadence v" << libraryVersion() << "\n"
     << "\n"
     << "WARNING: this tool is intended for offline/single-player games "
        "only.\n"
     << "Do not use it with online games or anti-cheat systems; doing so may "
        "result in permanent bans.\n"
     << "Use at your own risk.\n";
  return os.str();
}

int exitCodeFor(engine::RunOutcome outcome) {
  return outcome == engine::RunOutcome::FailureBudgetExhausted
             ? kExitFailureBudget
             : kExitOk;
}

int exitCodeFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ProcessNotFound:
  case ErrorKind::WindowNotFound:
    return kExitProcessNotFound;
  case ErrorKind::ProcessExited:
  case ErrorKind::Cancelled:
    return kExitOk;
  case ErrorKind::InjectionFailed:
    return kExitFailureBudget;
  default:
    return kExitInvalidConfiguration;
  }
}

} // namespace keycadence::cli
