#pragma once

#include <cstdint>

#include "source/common/common/logger.h"

#include "absl/strings/str_cat.h"

namespace KernelTls {
namespace Assert {

/**
 * Logs the failure to the misc logger and aborts the process.
 */
[[noreturn]] void invokeFatalHandler(const char* file, int line, absl::string_view details);

/**
 * Counts and logs a KTLS_BUG() hit. The first hit at a call site logs at error, the rest are
 * rate limited to powers of two.
 */
void invokeBugHandler(const char* file, int line, absl::string_view condition,
                      absl::string_view details);

/**
 * @return the number of KTLS_BUG() hits seen so far. Used by tests.
 */
uint64_t bugHitCount();

} // namespace Assert

/**
 * Logs the failed condition through the misc logger and aborts, in every build mode.
 */
#define RELEASE_ASSERT(X, DETAILS)                                                                 \
  do {                                                                                             \
    if (!(X)) {                                                                                    \
      ::KernelTls::Assert::invokeFatalHandler(__FILE__, __LINE__,                                  \
                                              absl::StrCat("assert failure: ", #X, ". Details: ",  \
                                                           DETAILS));                              \
    }                                                                                              \
  } while (false)

#ifndef NDEBUG
#define ASSERT(X) RELEASE_ASSERT(X, "")
#else
// This non-implementation ensures that its argument is a valid expression that can be statically
// casted to a bool, but the expression is never evaluated and will be compiled away.
#define ASSERT(X)                                                                                  \
  do {                                                                                             \
    constexpr bool __assert_dummy_variable = false && static_cast<bool>(X);                        \
    (void)__assert_dummy_variable;                                                                 \
  } while (false)
#endif

/**
 * Indicate a panic situation and exit.
 */
#define PANIC(X) ::KernelTls::Assert::invokeFatalHandler(__FILE__, __LINE__, X)

/**
 * Indicate a failure condition that should never be met in normal circumstances. In contrast
 * with ASSERT, a KTLS_BUG is compiled in release mode and only logs: it must only be used where
 * the process can safely keep running.
 */
#define KTLS_BUG(CONDITION, DETAILS)                                                              \
  do {                                                                                             \
    if (!(CONDITION)) {                                                                            \
      ::KernelTls::Assert::invokeBugHandler(__FILE__, __LINE__, #CONDITION, DETAILS);              \
    }                                                                                              \
  } while (false)

#define PANIC_DUE_TO_CORRUPT_ENUM PANIC("corrupted enum");

} // namespace KernelTls
