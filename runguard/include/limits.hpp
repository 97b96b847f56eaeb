#pragma once

#include "runguard_options.hpp"

namespace runner {

/**
 * Limit current process resources usage.
 *
 * Called in the forked child before execve. Only async-signal-safe
 * functions are used, since the parent may be multithreaded.
 *
 * @return 0 on success, otherwise the errno of the failing call.
 */
int set_restrictions(const runguard_options &opt);

}  // namespace runner
