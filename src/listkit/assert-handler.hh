#pragma once

#include <listkit/macros.hh>
#include <listkit/source_location.hh>

#include <functional>
#include <string>

namespace lk::impl
{
// Customizable assertion handler stack
// NOTE: handlers are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = lk::impl::scoped_assertion_handler([](lk::impl::assertion_info const& info) {
//           report(info);
//           throw recoverable_failure{info.message};
//       });
//
//       auto idx = lk::uniform_below(rng, bound); // a failing LK_ASSERT in here ends up in the handler
//   }

struct assertion_info
{
    std::string expression;
    std::string message;
    lk::source_location location;

    // listkit operation that was running when the assertion failed, empty outside of one
    std::string operation;
    // call site of that operation, only meaningful if operation is not empty
    lk::source_location caller;
};

// Human-readable multi-line report, as printed by the default handler
[[nodiscard]] std::string format_assertion_report(assertion_info const& info);

// Push a custom assertion handler; it receives all failures until popped
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler
// NOTE: prefer scoped_assertion_handler, which also pops when a handler throws
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace lk::impl
