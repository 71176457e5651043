/**
 * @file debug_info.cpp
 * @brief Stack trace printing for mcpmesh::debug::print_stack_trace().
 *
 * POSIX: frames come from backtrace(); each frame is resolved with dladdr() and the
 * symbol demangled with abi::__cxa_demangle. When dladdr has no symbol the raw
 * backtrace_symbols() text is printed instead.
 * Windows: CaptureStackBackTrace + SymFromAddr/SymGetLineFromAddr64.
 */
#include "mesh_base.hpp"

#if defined(MCPMESH_PLATFORM_WIN64)
#include <dbghelp.h>
#pragma comment(lib, "dbghelp.lib")
#elif defined(MCPMESH_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#endif

#include <cstdlib>
#include <memory>

namespace mcpmesh::debug
{

#if defined(MCPMESH_IS_POSIX)

namespace
{
std::string demangle(const char *name)
{
    if (name == nullptr)
        return "??";
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> out(abi::__cxa_demangle(name, nullptr, nullptr, &status),
                                                std::free);
    return (status == 0 && out) ? std::string(out.get()) : std::string(name);
}
} // namespace

void print_stack_trace() noexcept
{
    constexpr int kMaxFrames = 64;
    void *frames[kMaxFrames];
    const int count = ::backtrace(frames, kMaxFrames);
    if (count <= 0)
    {
        std::fprintf(stderr, "  (no stack trace available)\n");
        return;
    }

    std::unique_ptr<char *, void (*)(void *)> symbols(::backtrace_symbols(frames, count), std::free);
    std::fprintf(stderr, "Stack trace (%d frames):\n", count - 1);
    // Frame 0 is print_stack_trace itself.
    for (int i = 1; i < count; ++i)
    {
        try
        {
            Dl_info info{};
            if (::dladdr(frames[i], &info) != 0 && info.dli_sname != nullptr)
            {
                const auto offset = static_cast<const char *>(frames[i]) -
                                    static_cast<const char *>(info.dli_saddr);
                fmt::print(stderr, "  #{:<2} {} + {:#x} [{}]\n", i - 1, demangle(info.dli_sname),
                           offset, format_tools::filename_only(info.dli_fname ? info.dli_fname : "??"));
            }
            else
            {
                fmt::print(stderr, "  #{:<2} {}\n", i - 1, symbols ? symbols.get()[i] : "??");
            }
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "  #%-2d (frame formatting failed: %s)\n", i - 1, e.what());
        }
    }
    std::fflush(stderr);
}

#elif defined(MCPMESH_PLATFORM_WIN64)

void print_stack_trace() noexcept
{
    HANDLE process = GetCurrentProcess();
    SymSetOptions(SYMOPT_LOAD_LINES | SYMOPT_DEFERRED_LOADS | SYMOPT_UNDNAME);
    SymInitialize(process, nullptr, TRUE);

    void *frames[64];
    const USHORT count = CaptureStackBackTrace(1, 64, frames, nullptr);
    alignas(SYMBOL_INFO) char storage[sizeof(SYMBOL_INFO) + MAX_SYM_NAME] = {};
    auto *symbol = reinterpret_cast<SYMBOL_INFO *>(storage);
    symbol->SizeOfStruct = sizeof(SYMBOL_INFO);
    symbol->MaxNameLen = MAX_SYM_NAME;

    std::fprintf(stderr, "Stack trace (%u frames):\n", static_cast<unsigned>(count));
    for (USHORT i = 0; i < count; ++i)
    {
        const auto addr = reinterpret_cast<DWORD64>(frames[i]);
        IMAGEHLP_LINE64 line{};
        line.SizeOfStruct = sizeof(line);
        DWORD disp = 0;
        const bool have_sym = SymFromAddr(process, addr, nullptr, symbol) != FALSE;
        if (SymGetLineFromAddr64(process, addr, &disp, &line))
        {
            std::fprintf(stderr, "  #%-2u %s (%s:%lu)\n", static_cast<unsigned>(i),
                         have_sym ? symbol->Name : "??", line.FileName, line.LineNumber);
        }
        else
        {
            std::fprintf(stderr, "  #%-2u %s\n", static_cast<unsigned>(i), have_sym ? symbol->Name : "??");
        }
    }
    SymCleanup(process);
    std::fflush(stderr);
}

#else

void print_stack_trace() noexcept
{
    std::fprintf(stderr, "  (stack trace not supported on this platform)\n");
}

#endif

} // namespace mcpmesh::debug
