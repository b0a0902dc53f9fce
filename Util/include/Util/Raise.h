#ifndef UTIL_RAISE_H_
#define UTIL_RAISE_H_

#include "Compiler.h"
#include <utility>

/**
 * @brief Throws an exception of type `E` constructed from `args`.
 * Kept out of line so that error paths do not bloat the callers.
 *
 * @param args The arguments forwarded to the constructor of `E`.
 */
template <class E, class... Args>
[[noreturn]] COLD_CODE void Raise(Args &&...args) {
	throw E{std::forward<Args>(args)...};
}

#endif
