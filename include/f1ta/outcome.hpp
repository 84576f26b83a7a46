#pragma once
#include <optional>
#include <utility>

namespace f1ta {

// Why a computation produced no value.
enum class Unavailable : int {
  ProviderError,  // session or fetch failed; nothing loaded
  MissingData     // a required channel/sequence is absent or empty
};

inline const char* unavailable_name(Unavailable u) {
  return u == Unavailable::ProviderError ? "provider error" : "missing data";
}

// Value or typed "unavailable" reason. Never a sentinel number.
template <class T>
class Outcome {
public:
  // Nothing computed yet: no session has been loaded.
  Outcome() : why_(Unavailable::ProviderError) {}
  Outcome(T v) : value_(std::move(v)) {}
  Outcome(Unavailable why) : why_(why) {}

  bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return *value_; }
  const T& operator*() const { return *value_; }
  const T* operator->() const { return &*value_; }

  // Only meaningful when !ok().
  Unavailable reason() const { return why_; }

  T value_or(T fallback) const { return value_ ? *value_ : std::move(fallback); }

private:
  std::optional<T> value_;
  Unavailable why_{Unavailable::MissingData};
};

} // namespace f1ta
