#pragma once

namespace KernelTls {
/**
 * Friendly name for a pure virtual routine.
 */
#define PURE = 0
} // namespace KernelTls
