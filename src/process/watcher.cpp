/**
 * @file process/watcher.cpp
 * @brief ProcessWatcher and process name matching.
 */

#include <keycadence/process/watcher.hpp>

#include <keycadence/log.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace keycadence::process {

namespace {

std::string lowered(std::string_view s) {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

} // namespace

bool processNameMatches(std::string_view processName,
                        std::string_view pattern) {
  if (pattern.empty())
    return false;
  return lowered(processName).find(lowered(pattern)) != std::string::npos;
}

ProcessWatcher::ProcessWatcher(std::shared_ptr<const ProcessSource> source)
    : m_source(std::move(source)) {
  if (!m_source)
    throw std::invalid_argument("ProcessWatcher requires a process source");
}

void ProcessWatcher::snapshot() { m_table = m_source->list(); }

std::optional<uint32_t> ProcessWatcher::findFirst(std::string_view name) {
  snapshot();
  for (const ProcessInfo &p : m_table) {
    if (processNameMatches(p.name, name)) {
      KEYCADENCE_LOG_DEBUG("ProcessWatcher: '%.*s' matched %s (pid %u)",
                           static_cast<int>(name.size()), name.data(),
                           p.name.c_str(), p.pid);
      return p.pid;
    }
  }
  return std::nullopt;
}

bool ProcessWatcher::isAlive(std::string_view name) {
  snapshot();
  return std::ranges::any_of(m_table, [name](const ProcessInfo &p) {
    return processNameMatches(p.name, name);
  });
}

} // namespace keycadence::process
