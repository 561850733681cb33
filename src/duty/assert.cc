#include "assert.hh"

#include <duty/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <vector>

#ifdef DUTY_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<duty::impl::assertion_handler>& handler_stack()
{
    static std::vector<duty::impl::assertion_handler> handlers;
    return handlers;
}

// the whole report goes out in a single write
void report_to_stderr(duty::impl::assertion_info const& info)
{
    auto const& loc = info.location;

    auto report = std::string("duty: assertion `") + info.expression + "` failed\n";
    report += "  " + info.message + '\n';
    report += "  at " + std::string(loc.file_name()) + ':' + std::to_string(loc.line()) + ':'
            + std::to_string(loc.column()) + '\n';
    report += "  in " + std::string(loc.function_name()) + '\n';

    std::fputs(report.c_str(), stderr);
    std::fflush(stderr);
}
} // namespace

void duty::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(duty::move(handler));
}

void duty::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

duty::isize duty::impl::assertion_handler_count()
{
    return isize(handler_stack().size());
}

DUTY_COLD_FUNC void duty::impl::handle_assert_failure(char const* expression,
                                                      char const* message,
                                                      duty::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
        report_to_stderr(info);
    else
        handlers.back()(info); // may throw

    // caller breaks and aborts
}

bool duty::impl::is_debugger_connected() noexcept
{
#ifdef DUTY_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(DUTY_OS_LINUX)
    // "TracerPid:\t<pid>" is non-zero while a tracer is attached
    try
    {
        auto status = std::ifstream("/proc/self/status");
        auto line = std::string();
        while (std::getline(status, line))
            if (line.starts_with("TracerPid:"))
                return std::atoi(line.c_str() + 10) != 0;
    }
    catch (std::exception const&)
    {
        // treated as "no debugger", the assertion still aborts
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void duty::impl::perform_abort() noexcept
{
    std::abort();
}
