#pragma once

#include <duty/fwd.hh>
#include <duty/macros.hh>
#include <duty/source_location.hh>
#include <duty/utility.hh>

#include <functional>
#include <string>

// =========================================================================================================
// Assertion handlers
// =========================================================================================================
//
// Every failed DUTY_ASSERT is reported to the most recently pushed handler.
// With no handler installed, the failure is printed to stderr.
// Either way the program aborts afterwards, unless the handler throws.
//
// Throwing handlers are how tests observe precondition violations:
//
//   auto guard = duty::impl::scoped_assertion_handler([](duty::impl::assertion_info const& info) {
//       throw precondition_violated{info.message};
//   });
//   (void)empty_optional.value(); // throws precondition_violated instead of aborting
//
// The handler stack is process-global and unsynchronized.

namespace duty::impl
{
/// What a handler learns about a failed assertion
struct assertion_info
{
    std::string expression; ///< stringified condition, e.g. "self.has_value()"
    std::string message;
    duty::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// No-op on an empty stack
void pop_assertion_handler();

/// Number of currently installed handlers
[[nodiscard]] isize assertion_handler_count();

/// Installs a handler for the lifetime of this object
/// Pops on destruction, also while unwinding from an exception thrown by the handler itself.
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler) { push_assertion_handler(duty::move(handler)); }
    ~scoped_assertion_handler() { pop_assertion_handler(); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace duty::impl
