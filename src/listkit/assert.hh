#pragma once

// Lean header with minimal dependencies, included by every listkit header.
#include <listkit/macros.hh>
#include <listkit/source_location.hh>

// =========================================================================================================
// LK_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime. On failure the active assertion handler is called
// (see <listkit/assert-handler.hh>), the debugger is signalled if attached, and the process aborts.
//
// Active in LK_DEBUG and LK_RELWITHDEBINFO builds, stripped in LK_RELEASE unless
// LK_ENABLE_ASSERT_IN_RELEASE is defined.
//
// Error handling strategy:
//   - Assertions          -> programmer errors (bad index, bad random bound, invalid function_ref call)
//   - lk::argument_error  -> a required argument was not provided by the caller
//   - no-op               -> empty or absent lists, no matching element
//
// Usage:
//   LK_ASSERT(0 <= i && i < size, "index out of bounds");
//   LK_ASSERT(bound > 0, "bound must be positive");
//
#define LK_ASSERT(cond, msg) LK_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// LK_ASSERT_ALWAYS - Always-active assertion
//
// Like LK_ASSERT but remains active in all build configurations.
//
#define LK_ASSERT_ALWAYS(cond, msg) LK_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// LK_BREAK_AND_ABORT - Debug break (if a debugger is attached) followed by program termination
//
#define LK_BREAK_AND_ABORT() (LK_IMPL_DEBUG_BREAK(), ::lk::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace lk::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler or prints to stderr
// Note: does not abort, caller must follow with LK_BREAK_AND_ABORT()
LK_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, lk::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;

// Marks the calling thread as running a listkit operation until destroyed.
// A failing assertion inside (e.g. raised by a user predicate) reports the operation
// and the place it was called from, in addition to the assertion's own location.
// Scopes nest per thread, the innermost one is reported.
//
// Usage (inside a list operation taking a `site` parameter):
//   auto const scope = lk::impl::operation_scope("lk::remove_all", site);
struct operation_scope
{
    operation_scope(char const* name, lk::source_location caller) noexcept;
    ~operation_scope();

    operation_scope(operation_scope const&) = delete;
    operation_scope& operator=(operation_scope const&) = delete;

    [[nodiscard]] char const* name() const { return _name; }
    [[nodiscard]] lk::source_location const& caller() const { return _caller; }

    /// innermost active scope of the calling thread, nullptr outside of any operation
    [[nodiscard]] static operation_scope const* current() noexcept;

private:
    char const* _name;
    lk::source_location _caller;
    operation_scope const* _enclosing;
};
} // namespace lk::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef LK_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define LK_IMPL_DEBUG_BREAK() (::lk::impl::is_debugger_connected() ? __debugbreak() : void(0))

#else

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: declared here so that this header does not pull in <csignal>
extern "C" int raise(int) noexcept;
#define LK_IMPL_DEBUG_BREAK() (::lk::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#endif

#define LK_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::lk::impl::handle_assert_failure(#cond, msg, ::lk::source_location::current()); \
            LK_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if LK_ASSERT_ENABLED

#define LK_IMPL_ASSERT(cond, msg) LK_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message must still compile
#define LK_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        LK_UNUSED(cond);          \
        LK_UNUSED(msg);           \
    } while (false)

#endif
