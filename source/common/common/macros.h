#pragma once

namespace KernelTls {

/**
 * Helper macros for generating enums and string tables from one list.
 */
#define GENERATE_ENUM(X) X,
#define GENERATE_STRING(X) #X,

/**
 * Construct On First Use idiom.
 * See https://isocpp.org/wiki/faq/ctors#static-init-order-on-first-use.
 */
#define CONSTRUCT_ON_FIRST_USE(type, ...)                                                          \
  do {                                                                                             \
    static const type* objectptr = new type{__VA_ARGS__};                                          \
    return *objectptr;                                                                             \
  } while (0)

/**
 * Have a generic unreferenced parameter macro.
 */
#define UNREFERENCED_PARAMETER(X) ((void)(X))

} // namespace KernelTls
