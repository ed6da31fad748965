#pragma once

/**
 * @file common.hpp
 * @brief Debug assertions and small helpers shared by the scene code
 */

#include <algorithm>
#include <cctype>
#include <cpptrace/cpptrace.hpp>
#include <format>
#include <string_view>
#include <utility>

#include "logger.hpp"
#include "profiler.hpp"

// Debug builds turn a broken invariant into a logged, traced exception so the
// caller's frame is visible. Release builds compile the check out.
#ifdef DEBUG
#define MINIR_ASSERT(condition, message)                                       \
  do {                                                                         \
    if (!(condition)) {                                                        \
      ::minir::core::Logger::Core.critical("Assertion `{}` failed: {}",        \
                                           #condition, message);               \
      throw cpptrace::runtime_error(std::format(                               \
          "assertion `{}` failed at {}:{}: {}", #condition, __FILE__,          \
          __LINE__, message));                                                 \
    }                                                                          \
  } while (0)
#else
#define MINIR_ASSERT(condition, message) (void)(0)
#endif

namespace minir::util {

// Runs a callable when the scope unwinds, normally or by exception.
template <typename Func> class ScopeGuard {
public:
  explicit ScopeGuard(Func &&f) : m_func(std::move(f)) {}
  ~ScopeGuard() { m_func(); }

  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard &operator=(const ScopeGuard &) = delete;

private:
  Func m_func;
};

template <typename Func> [[nodiscard]] auto makeScopeGuard(Func &&func) {
  return ScopeGuard<Func>(std::forward<Func>(func));
}

// ASCII-only; object and light component names are plain identifiers.
inline bool iequals(std::string_view a, std::string_view b) noexcept {
  return std::ranges::equal(a, b, [](unsigned char lhs, unsigned char rhs) {
    return std::tolower(lhs) == std::tolower(rhs);
  });
}

} // namespace minir::util
