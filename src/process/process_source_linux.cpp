/**
 * @file process/process_source_linux.cpp
 * @brief Process enumeration through /proc.
 */

#if defined(__linux__)

#include <keycadence/process/watcher.hpp>

#include <keycadence/log.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace keycadence::process {

namespace {

namespace fs = std::filesystem;

bool isPidDirectory(const std::string &name) {
  if (name.empty())
    return false;
  for (char c : name) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

// Executable basename from /proc/<pid>/exe; kernel threads and processes of
// other users have no readable link, for those /proc/<pid>/comm is used.
std::string processName(const fs::path &dir) {
  std::error_code ec;
  const fs::path exe = fs::read_symlink(dir / "exe", ec);
  if (!ec && !exe.empty())
    return exe.filename().string();

  std::ifstream comm(dir / "comm");
  std::string name;
  std::getline(comm, name);
  return name;
}

class ProcfsProcessSource final : public ProcessSource {
public:
  std::vector<ProcessInfo> list() const override {
    std::vector<ProcessInfo> out;
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
      KEYCADENCE_LOG_ERROR("ProcessSource: cannot read /proc: %s",
                           ec.message().c_str());
      return out;
    }
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      const fs::directory_entry &entry = *it;
      const std::string base = entry.path().filename().string();
      if (!isPidDirectory(base))
        continue;
      std::string name = processName(entry.path());
      if (name.empty())
        continue; // exited while we were listing
      out.push_back(
          {static_cast<uint32_t>(std::stoul(base)), std::move(name)});
    }
    return out;
  }
};

} // namespace

std::shared_ptr<ProcessSource> makeSystemProcessSource() {
  return std::make_shared<ProcfsProcessSource>();
}

} // namespace keycadence::process

#endif // __linux__
