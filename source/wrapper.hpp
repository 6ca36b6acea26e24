#pragma once

#include <utility>

// Wrap a value and provide value on request.
//
// Used to give unique named types so that two parameters sharing an underlying type can't be swapped by accident.
//
// e.g.:
//
// WRAPPER(UtcOffset, std::chrono::minutes);
// ...
// auto resolve(const RawTimestamp& raw, timestamp reference_now, UtcOffset fallback) -> ResolvedTimestamp;
//
// Passing a bare std::chrono::minutes where the offset belongs no longer compiles.
#define WRAPPER(name, T) \
  class name \
  { \
    public: \
      using wrapped_type = T; \
      explicit name(T val) \
          : m_wrapped(std::move(val)) { \
      } \
  \
      name() = delete; \
  \
      auto val() const -> T { \
        return m_wrapped; \
      } \
  \
      auto cref() const -> const T& { \
        return m_wrapped; \
      } \
  \
      auto operator==(const name& other) const -> bool = default; \
  \
    private: \
      T m_wrapped; \
  }
