#pragma once

#include <stdexcept>
#include <string>

namespace vocab {

enum class ErrorKind {
  NotFound,
  InvalidSessionState,
  StoreUnavailable,
  SettingsInvalid
};

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::InvalidSessionState: return "invalid_session_state";
    case ErrorKind::StoreUnavailable: return "store_unavailable";
    case ErrorKind::SettingsInvalid: return "settings_invalid";
  }
  return "not_found";
}

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// Referenced language, word or user does not exist.
class NotFound : public Error {
public:
  explicit NotFound(const std::string& message) : Error(ErrorKind::NotFound, message) {}
};

// The session cannot serve the request in its current phase; restart it.
class InvalidSessionState : public Error {
public:
  explicit InvalidSessionState(const std::string& message)
      : Error(ErrorKind::InvalidSessionState, message) {}
};

// Backing store failed. Never retried inside the core.
class StoreUnavailable : public Error {
public:
  explicit StoreUnavailable(const std::string& message)
      : Error(ErrorKind::StoreUnavailable, message) {}
};

class SettingsInvalid : public Error {
public:
  explicit SettingsInvalid(const std::string& message)
      : Error(ErrorKind::SettingsInvalid, message) {}
};

} // namespace vocab
