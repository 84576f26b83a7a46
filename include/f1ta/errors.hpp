#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

// Exceptions used by the IO shell (config and CSV loaders). The analytics
// core reports failure through its return types instead.
namespace f1ta::errors {

inline std::string append_context(std::string message, std::string_view context) {
  if (!context.empty()) {
    message = std::string(context) + ": " + message;
  }
  return message;
}

class F1taError : public std::runtime_error {
public:
  explicit F1taError(std::string message, std::string context = {})
    : std::runtime_error(append_context(std::move(message), context)),
      context_(std::move(context)) {}

  const std::string& context() const noexcept { return context_; }

private:
  std::string context_{};
};

// Bad or unreadable configuration file.
class ConfigError : public F1taError {
public:
  using F1taError::F1taError;
};

// Session directory missing or unusable.
class InputError : public F1taError {
public:
  using F1taError::F1taError;
};

} // namespace f1ta::errors
