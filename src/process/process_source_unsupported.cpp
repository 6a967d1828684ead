/**
 * @file process/process_source_unsupported.cpp
 * @brief Empty process source for hosts without an implementation.
 */

#if !defined(__linux__) && !defined(_WIN32)

#include <keycadence/log.hpp>
#include <keycadence/process/watcher.hpp>

namespace keycadence::process {

namespace {

class EmptyProcessSource final : public ProcessSource {
public:
  std::vector<ProcessInfo> list() const override { return {}; }
};

} // namespace

std::shared_ptr<ProcessSource> makeSystemProcessSource() {
  KEYCADENCE_LOG_WARN("ProcessSource: process enumeration is not supported "
                      "on this platform");
  return std::make_shared<EmptyProcessSource>();
}

} // namespace keycadence::process

#endif
