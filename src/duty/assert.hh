#pragma once

// Lean header with minimal dependencies, cheap to include everywhere.
#include <duty/macros.hh>
#include <duty/source_location.hh>

// =========================================================================================================
// DUTY_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// Features:
//   - Simple string literal error messages (no formatting dependencies)
//   - Automatic source location capture (file, line, function)
//   - Debugger integration: breaks into debugger when attached, otherwise aborts
//   - Expression stringification for clear error reporting
//   - Active in debug and release-with-debug-info builds by default
//
// When assertions are active:
//   See DUTY_ASSERT_ENABLED in <duty/macros.hh>.
//   In DUTY_RELEASE builds, assertions are disabled unless DUTY_ENABLE_ASSERT_IN_RELEASE is defined.
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - Exceptions      -> failures the caller is expected to handle (e.g. duty::key_not_found)
//   - optional<T>     -> plain absence (e.g. map::get on a missing key)
//
// Important:
//   NEVER trigger assertions based on user input or external conditions!
//   Production builds can provide a custom assertion handler (see <duty/assert-handler.hh>).
//
// Usage:
//   DUTY_ASSERT(ptr != nullptr, "pointer must not be null");
//   DUTY_ASSERT(is_valid(), "cannot call an invalid duty::function_ref");
//
#define DUTY_ASSERT(cond, msg) DUTY_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// DUTY_ASSERT_ALWAYS - Always-active assertion
//
// Like DUTY_ASSERT but remains active in all build configurations, including release builds.
//
#define DUTY_ASSERT_ALWAYS(cond, msg) DUTY_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// DUTY_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define DUTY_DEBUG_BREAK() DUTY_IMPL_DEBUG_BREAK()

// =========================================================================================================
// DUTY_BREAK_AND_ABORT - Debug break followed by program termination
//
#define DUTY_BREAK_AND_ABORT() (DUTY_DEBUG_BREAK(), ::duty::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace duty::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler, or prints diagnostics to stderr if there is none
// Note: does not abort, caller must follow with DUTY_BREAK_AND_ABORT()
DUTY_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, duty::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace duty::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef DUTY_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define DUTY_IMPL_DEBUG_BREAK() (::duty::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(DUTY_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: declared here to avoid pulling in <csignal>
extern "C" int raise(int) noexcept;
#define DUTY_IMPL_DEBUG_BREAK() (::duty::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define DUTY_IMPL_DEBUG_BREAK() void(0)

#endif

#define DUTY_IMPL_ASSERT_ALWAYS(cond, msg)                                                       \
    do                                                                                           \
    {                                                                                            \
        if (!(cond)) [[unlikely]]                                                                \
        {                                                                                        \
            ::duty::impl::handle_assert_failure(#cond, msg, ::duty::source_location::current()); \
            DUTY_BREAK_AND_ABORT();                                                              \
        }                                                                                        \
    } while (false)

#if DUTY_ASSERT_ENABLED

#define DUTY_IMPL_ASSERT(cond, msg) DUTY_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define DUTY_IMPL_ASSERT(cond, msg) \
    do                              \
    {                               \
        DUTY_UNUSED(cond);          \
        DUTY_UNUSED(msg);           \
    } while (false)

#endif
