/**
 * @file engine/config.cpp
 * @brief Settings (de)serialization with nlohmann/json and validation.
 */

#include <keycadence/engine/config.hpp>

#include <keycadence/engine/duration.hpp>
#include <keycadence/error.hpp>
#include <keycadence/log.hpp>

#include <cctype>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace keycadence::engine {

using nlohmann::json;
using nlohmann::ordered_json;

namespace {

[[noreturn]] void invalid(const std::string &message) {
  throw Error(ErrorKind::InvalidConfiguration, message);
}

std::string trimmed(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return std::string(s);
}

// Accepts "250ms"/"2s"/"5m"/"750", a non-negative integer of milliseconds, or
// a {"secs": N, "nanos": N} object.
std::chrono::milliseconds durationFromJson(const json &v,
                                           const std::string &where) {
  if (v.is_string()) {
    try {
      return parseDuration(v.get<std::string>());
    } catch (const Error &e) {
      invalid(where + ": " + e.what());
    }
  }
  if (v.is_number_unsigned()) {
    const auto ms = v.get<uint64_t>();
    if (ms > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      invalid(where + ": duration too large");
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
  }
  if (v.is_number_integer())
    invalid(where + ": durations cannot be negative");
  if (v.is_object() && v.contains("secs") && v["secs"].is_number_unsigned()) {
    const auto secs = v["secs"].get<uint64_t>();
    uint64_t nanos = 0;
    if (v.contains("nanos")) {
      if (!v["nanos"].is_number_unsigned())
        invalid(where + ": 'nanos' must be a non-negative integer");
      nanos = v["nanos"].get<uint64_t>();
    }
    if (secs > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) /
                   2000)
      invalid(where + ": duration too large");
    return std::chrono::milliseconds(
        static_cast<int64_t>(secs * 1000 + nanos / 1000000));
  }
  invalid(where + ": expected a duration such as \"500ms\", \"2s\" or 750");
}

std::string stringField(const json &obj, const char *name,
                        const std::string &where) {
  auto it = obj.find(name);
  if (it == obj.end())
    invalid(where + ": missing required field '" + name + "'");
  if (!it->is_string())
    invalid(where + ": field '" + name + "' must be a string");
  return it->get<std::string>();
}

bool boolField(const json &obj, const char *name, bool fallback) {
  auto it = obj.find(name);
  if (it == obj.end())
    return fallback;
  if (!it->is_boolean())
    invalid(std::string("field '") + name + "' must be true or false");
  return it->get<bool>();
}

uint32_t countField(const json &obj, const char *name, uint32_t fallback) {
  auto it = obj.find(name);
  if (it == obj.end())
    return fallback;
  if (!it->is_number_unsigned() ||
      it->get<uint64_t>() > std::numeric_limits<uint32_t>::max())
    invalid(std::string("field '") + name +
            "' must be a non-negative integer");
  return static_cast<uint32_t>(it->get<uint64_t>());
}

const json *arrayField(const json &obj, const char *name) {
  auto it = obj.find(name);
  if (it == obj.end() || it->is_null())
    return nullptr;
  if (!it->is_array())
    invalid(std::string("field '") + name + "' must be an array");
  return &*it;
}

void checkKey(const keyboard::KeyResolver &resolver, const std::string &key,
              const std::string &where) {
  try {
    resolver.validate(key);
  } catch (const Error &e) {
    invalid(where + ": " + e.what());
  }
}

void checkDuration(std::chrono::milliseconds d, const std::string &where) {
  if (d < std::chrono::milliseconds(1))
    invalid(where + ": must be at least 1ms (got " + formatDuration(d) + ")");
}

} // namespace

Settings parseSettings(std::string_view jsonText) {
  json j;
  try {
    j = json::parse(jsonText);
  } catch (const json::parse_error &e) {
    invalid(std::string("Malformed settings JSON: ") + e.what());
  }
  if (!j.is_object())
    invalid("Settings must be a JSON object");

  Settings s;
  s.processName = stringField(j, "process_name", "settings");

  if (const json *seq = arrayField(j, "key_sequence")) {
    for (size_t i = 0; i < seq->size(); ++i) {
      const json &e = (*seq)[i];
      const std::string where = "key_sequence[" + std::to_string(i) + "]";
      if (!e.is_object())
        invalid(where + ": expected an object with 'key' and 'interval_after'");
      if (!e.contains("interval_after"))
        invalid(where + ": missing required field 'interval_after'");
      s.keySequence.push_back(
          {stringField(e, "key", where),
           durationFromJson(e["interval_after"], where + ".interval_after")});
    }
  }

  if (const json *ind = arrayField(j, "independent_keys")) {
    for (size_t i = 0; i < ind->size(); ++i) {
      const json &e = (*ind)[i];
      const std::string where = "independent_keys[" + std::to_string(i) + "]";
      if (!e.is_object())
        invalid(where + ": expected an object with 'key' and 'interval'");
      if (!e.contains("interval"))
        invalid(where + ": missing required field 'interval'");
      s.independentKeys.push_back(
          {stringField(e, "key", where),
           durationFromJson(e["interval"], where + ".interval")});
    }
  }

  s.maxRetries = countField(j, "max_retries", s.maxRetries);

  if (auto it = j.find("pause_hotkey"); it != j.end()) {
    if (it->is_null())
      s.pauseHotkey.clear();
    else if (it->is_string())
      s.pauseHotkey = it->get<std::string>();
    else
      invalid("field 'pause_hotkey' must be a string or null");
  }

  s.verbose = boolField(j, "verbose", s.verbose);
  s.loopSequence = boolField(j, "loop_sequence", s.loopSequence);
  s.repeatCount = countField(j, "repeat_count", s.repeatCount);
  return s;
}

std::string serializeSettings(const Settings &settings) {
  ordered_json j;
  j["process_name"] = settings.processName;

  j["key_sequence"] = ordered_json::array();
  for (const SequenceEntry &e : settings.keySequence) {
    j["key_sequence"].push_back(
        ordered_json{{"key", e.key},
                     {"interval_after", formatDuration(e.intervalAfter)}});
  }

  j["independent_keys"] = ordered_json::array();
  for (const IndependentEntry &e : settings.independentKeys) {
    j["independent_keys"].push_back(ordered_json{
        {"key", e.key}, {"interval", formatDuration(e.interval)}});
  }

  j["max_retries"] = settings.maxRetries;
  if (settings.pauseHotkey.empty())
    j["pause_hotkey"] = nullptr;
  else
    j["pause_hotkey"] = settings.pauseHotkey;
  j["verbose"] = settings.verbose;
  j["loop_sequence"] = settings.loopSequence;
  j["repeat_count"] = settings.repeatCount;

  return j.dump(2) + "\n";
}

Settings loadSettings(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    invalid("Cannot open settings file '" + path.string() + "'");
  std::ostringstream buf;
  buf << in.rdbuf();
  KEYCADENCE_LOG_DEBUG("Settings: loaded %zu bytes from %s",
                       buf.str().size(), path.string().c_str());
  try {
    return parseSettings(buf.str());
  } catch (const Error &e) {
    invalid(path.string() + ": " + e.what());
  }
}

void saveSettings(const Settings &settings,
                  const std::filesystem::path &path) {
  const std::string text = serializeSettings(settings);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    invalid("Cannot write settings file '" + path.string() + "'");
  out << text;
  out.flush();
  if (!out)
    invalid("Failed writing settings file '" + path.string() + "'");
  KEYCADENCE_LOG_INFO("Settings: saved to %s", path.string().c_str());
}

Configuration validate(const Settings &settings,
                       const keyboard::KeyResolver &resolver) {
  Configuration config;
  config.processName = trimmed(settings.processName);
  if (config.processName.empty())
    invalid("No process name specified. Use --process or set process_name "
            "in the settings file.");

  if (settings.maxRetries == 0)
    invalid("max_retries must be at least 1");
  config.maxRetries = settings.maxRetries;

  const bool hasSequence = !settings.keySequence.empty();
  const bool hasIndependent = !settings.independentKeys.empty();
  if (!hasSequence && !hasIndependent)
    invalid("No key actions specified. Use --key, --sequence or "
            "--independent-keys, or provide them in the settings file.");
  if (hasSequence && hasIndependent)
    invalid("key_sequence and independent_keys cannot both be set; choose "
            "one mode");

  for (size_t i = 0; i < settings.keySequence.size(); ++i)
    checkKey(resolver, settings.keySequence[i].key,
             "key_sequence[" + std::to_string(i) + "]");
  for (size_t i = 0; i < settings.independentKeys.size(); ++i)
    checkKey(resolver, settings.independentKeys[i].key,
             "independent_keys[" + std::to_string(i) + "]");

  for (size_t i = 0; i < settings.keySequence.size(); ++i)
    checkDuration(settings.keySequence[i].intervalAfter,
                  "key_sequence[" + std::to_string(i) + "].interval_after");
  for (size_t i = 0; i < settings.independentKeys.size(); ++i)
    checkDuration(settings.independentKeys[i].interval,
                  "independent_keys[" + std::to_string(i) + "].interval");

  config.pauseHotkey = trimmed(settings.pauseHotkey);
  if (!config.pauseHotkey.empty())
    checkKey(resolver, config.pauseHotkey, "pause_hotkey");

  config.verbose = settings.verbose;

  if (hasSequence) {
    SequentialMode mode;
    for (const SequenceEntry &e : settings.keySequence)
      mode.steps.push_back({e.key, e.intervalAfter});
    mode.loopForever = settings.loopSequence;
    mode.repeatCount = settings.repeatCount;
    config.mode = std::move(mode);
  } else {
    IndependentMode mode;
    for (const IndependentEntry &e : settings.independentKeys)
      mode.timers.push_back({e.key, e.interval});
    config.mode = std::move(mode);
  }
  return config;
}

std::string describe(const Configuration &config) {
  std::ostringstream os;
  os << "Target process: " << config.processName << "\n";

  if (const auto *seq = std::get_if<SequentialMode>(&config.mode)) {
    std::chrono::milliseconds cycle{0};
    os << "Mode: sequential\nSequence: ";
    for (size_t i = 0; i < seq->steps.size(); ++i) {
      if (i > 0)
        os << " -> ";
      os << "'" << seq->steps[i].key << "' (" << seq->steps[i].pauseAfter.count()
         << "ms)";
      cycle += seq->steps[i].pauseAfter;
    }
    os << "\nCycle time: " << cycle.count() << "ms\n";
    if (!seq->loopForever)
      os << "Repeat: single pass\n";
    else if (seq->repeatCount > 0)
      os << "Repeat: " << seq->repeatCount << " pass"
         << (seq->repeatCount == 1 ? "" : "es") << "\n";
    else
      os << "Repeat: until stopped\n";
  } else {
    const auto &ind = std::get<IndependentMode>(config.mode);
    os << "Mode: independent\nTimers: ";
    for (size_t i = 0; i < ind.timers.size(); ++i) {
      if (i > 0)
        os << ", ";
      os << "'" << ind.timers[i].key << "' every "
         << ind.timers[i].period.count() << "ms";
    }
    os << "\n";
  }

  os << "Max attempts: " << config.maxRetries << "\n";
  os << "Pause hotkey: "
     << (config.pauseHotkey.empty() ? std::string("none") : config.pauseHotkey)
     << "\n";
  return os.str();
}

} // namespace keycadence::engine
