// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Shared `main` of the test executables.
 *
 * 1. **Worker mode**: when `argv[1]` has the form "module.scenario", the call is
 *    handed to the registered dispatchers. Workers are fake tool servers and fake
 *    stdio MCP servers that the tests start through the supervisor or a bridge,
 *    and they manage their own lifecycle.
 *
 * 2. **Test runner mode**: runs GoogleTest. Fixtures that need lifecycle modules
 *    own a LifecycleGuard for the duration of their suite.
 */
#include "test_entrypoint.h"
#include "mesh_base.hpp"
#include <vector>

std::string g_self_exe_path;

static std::vector<WorkerDispatchFn> &worker_dispatchers()
{
    static std::vector<WorkerDispatchFn> list;
    return list;
}

void register_worker_dispatcher(WorkerDispatchFn fn)
{
    worker_dispatchers().push_back(fn);
}

int main(int argc, char **argv)
{
    // Re-spawning needs an absolute path; the working directory may differ later.
    g_self_exe_path = mcpmesh::platform::get_executable_name(/*include_path=*/true);
    if (g_self_exe_path.empty() || g_self_exe_path == "unknown")
        g_self_exe_path = (argc >= 1) ? argv[0] : "";

    // A wrapped stdio child that dies must surface as EPIPE, not kill the runner.
    mcpmesh::platform::ignore_broken_pipe_signal();

    if (argc > 1)
    {
        std::string mode_str = argv[1];
        if (mode_str.find('.') != std::string::npos && mode_str.rfind("--", 0) != 0)
        {
            for (auto fn : worker_dispatchers())
            {
                int r = fn(argc, argv);
                if (r != -1)
                    return r;
            }
            fmt::print(stderr, "[WORKER FAILURE] no dispatcher handles '{}'\n", mode_str);
            return 64;
        }
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
