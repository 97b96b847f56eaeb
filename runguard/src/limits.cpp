#include "limits.hpp"
#include <errno.h>
#include <math.h>
#include <sys/resource.h>

namespace runner {

static int set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        return errno;
    return 0;
}

int set_restrictions(const runguard_options &opt) {
    int err;

    if (opt.use_cpu_limit) {
        // SIGXCPU is delivered at the soft limit, SIGKILL at the hard one
        rlim_t cpu = (rlim_t)ceil(opt.cpu_limit);
        if ((err = set_rlimit(RLIMIT_CPU, cpu, cpu + 1)) != 0) return err;
    }

    if (opt.memory_limit >= 0) {
        if ((err = set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit)) != 0) return err;
    }

    if (opt.file_limit >= 0) {
        if ((err = set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit)) != 0) return err;
    }

    if (opt.nproc >= 0) {
        if ((err = set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc)) != 0) return err;
    }

    if (opt.no_core_dumps) {
        if ((err = set_rlimit(RLIMIT_CORE, 0, 0)) != 0) return err;
    }

    return 0;
}

}  // namespace runner
