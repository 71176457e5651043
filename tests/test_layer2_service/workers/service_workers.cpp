// tests/test_layer2_service/workers/service_workers.cpp
#include "service_workers.h"
#include "mesh_service.hpp"
#include "test_entrypoint.h"

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

using namespace mcpmesh::utils;

namespace
{
void noop_startup(const char * /*arg*/) {}
} // namespace

namespace mcpmesh::tests::worker::service
{

int filelock_hold_lock(int argc, char **argv)
{
    if (argc < 4)
    {
        fmt::print(stderr, "usage: filelock.hold_lock <path> <ms>\n");
        return 64;
    }
    const std::string path = argv[2];
    const int hold_ms = std::stoi(argv[3]);

    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                            FileLock::GetLifecycleModule()));
    FileLock lock(path, ResourceType::File, LockMode::Blocking);
    if (!lock.valid())
    {
        fmt::print(stderr, "[WORKER FAILURE] cannot lock {}: {}\n", path, lock.error_code().message());
        return 1;
    }
    std::cout << "LOCKED" << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms));
    return 0;
}

int lifecycle_dependency_cycle()
{
    ModuleDef a("test::CycleA");
    a.add_dependency("test::CycleB");
    a.set_startup(&noop_startup);
    ModuleDef b("test::CycleB");
    b.add_dependency("test::CycleA");
    b.set_startup(&noop_startup);
    LifecycleGuard lifecycle(MakeModDefList(std::move(a), std::move(b)));
    return 0; // not reached: the cycle is fatal
}

int lifecycle_unknown_dependency()
{
    ModuleDef a("test::Orphan");
    a.add_dependency("test::DoesNotExist");
    LifecycleGuard lifecycle(MakeModDefList(std::move(a)));
    return 0;
}

} // namespace mcpmesh::tests::worker::service

namespace
{
struct ServiceWorkerRegistrar
{
    ServiceWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                using namespace mcpmesh::tests::worker::service;
                if (mode == "filelock.hold_lock")
                    return filelock_hold_lock(argc, argv);
                if (mode == "lifecycle.dependency_cycle")
                    return lifecycle_dependency_cycle();
                if (mode == "lifecycle.unknown_dependency")
                    return lifecycle_unknown_dependency();
                return -1;
            });
    }
};
static ServiceWorkerRegistrar g_service_registrar;
} // namespace
