/**
 * @file process/process_source_windows.cpp
 * @brief Process enumeration through a Toolhelp32 snapshot.
 */

#ifdef _WIN32
#include <Windows.h>
#include <TlHelp32.h>
#include <keycadence/log.hpp>
#include <keycadence/process/watcher.hpp>

namespace keycadence::process {

namespace {

std::string narrow(const wchar_t *wide) {
  const int len =
      WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
  if (len <= 1)
    return {};
  std::string out(static_cast<size_t>(len - 1), '\0');
  WideCharToMultiByte(CP_UTF8, 0, wide, -1, out.data(), len, nullptr, nullptr);
  return out;
}

class ToolhelpProcessSource final : public ProcessSource {
public:
  std::vector<ProcessInfo> list() const override {
    std::vector<ProcessInfo> out;
    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot == INVALID_HANDLE_VALUE) {
      KEYCADENCE_LOG_ERROR("ProcessSource: CreateToolhelp32Snapshot failed "
                           "(error %lu)",
                           GetLastError());
      return out;
    }

    PROCESSENTRY32W pe32{};
    pe32.dwSize = sizeof(PROCESSENTRY32W);
    if (Process32FirstW(snapshot, &pe32)) {
      do {
        out.push_back({static_cast<uint32_t>(pe32.th32ProcessID),
                       narrow(pe32.szExeFile)});
      } while (Process32NextW(snapshot, &pe32));
    }
    CloseHandle(snapshot);
    return out;
  }
};

} // namespace

std::shared_ptr<ProcessSource> makeSystemProcessSource() {
  return std::make_shared<ToolhelpProcessSource>();
}

} // namespace keycadence::process

#endif // _WIN32
