#include <keycadence/error.hpp>

namespace keycadence {

const char *errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidConfiguration:
    return "InvalidConfiguration";
  case ErrorKind::ProcessNotFound:
    return "ProcessNotFound";
  case ErrorKind::WindowNotFound:
    return "WindowNotFound";
  case ErrorKind::UnsupportedKey:
    return "UnsupportedKey";
  case ErrorKind::InvalidCombination:
    return "InvalidCombination";
  case ErrorKind::InjectionFailed:
    return "InjectionFailed";
  case ErrorKind::ProcessExited:
    return "ProcessExited";
  case ErrorKind::Cancelled:
    return "Cancelled";
  default:
    return "Unknown";
  }
}

Error::Error(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), m_kind(kind) {}

} // namespace keycadence
