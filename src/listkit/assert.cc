#include "assert.hh"

#include <listkit/assert-handler.hh>

#include <cstdlib>
#include <iostream>
#include <string_view>
#include <vector>

#if defined(LK_COMPILER_MSVC)
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#elif defined(LK_OS_LINUX)
#include <fstream>
#endif

namespace
{
using handler_t = std::move_only_function<void(lk::impl::assertion_info const&)>;

// installed handlers, the last one is active
// NOTE: shared by all threads, push/pop must be externally synchronized
std::vector<handler_t> g_handlers;

// innermost list operation running on this thread
thread_local lk::impl::operation_scope const* t_operation = nullptr;

void append_location(std::string& out, lk::source_location const& loc)
{
    out += loc.file_name();
    out += ':';
    out += std::to_string(loc.line());
    out += " (";
    out += loc.function_name();
    out += ')';
}
} // namespace

lk::impl::operation_scope::operation_scope(char const* name, lk::source_location caller) noexcept
  : _name(name), _caller(caller), _enclosing(t_operation)
{
    t_operation = this;
}

lk::impl::operation_scope::~operation_scope()
{
    t_operation = _enclosing;
}

lk::impl::operation_scope const* lk::impl::operation_scope::current() noexcept
{
    return t_operation;
}

std::string lk::impl::format_assertion_report(assertion_info const& info)
{
    auto report = std::string("listkit assertion failed: ");
    report += info.message;
    report += "\n  condition:  ";
    report += info.expression;
    report += "\n  checked at: ";
    append_location(report, info.location);
    report += '\n';

    if (!info.operation.empty())
    {
        report += "  during:     ";
        report += info.operation;
        report += "\n  called at:  ";
        append_location(report, info.caller);
        report += '\n';
    }

    return report;
}

void lk::impl::push_assertion_handler(handler_t handler)
{
    g_handlers.push_back(std::move(handler));
}

void lk::impl::pop_assertion_handler()
{
    if (!g_handlers.empty())
        g_handlers.pop_back();
}

lk::impl::scoped_assertion_handler::scoped_assertion_handler(handler_t handler)
{
    push_assertion_handler(std::move(handler));
}

lk::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

LK_COLD_FUNC void lk::impl::handle_assert_failure(char const* expression, char const* message, lk::source_location location)
{
    auto info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (auto const* op = operation_scope::current())
    {
        info.operation = op->name();
        info.caller = op->caller();
    }

    if (g_handlers.empty())
        std::cerr << format_assertion_report(info) << std::flush;
    else
        g_handlers.back()(info);

    // caller aborts via LK_BREAK_AND_ABORT
}

bool lk::impl::is_debugger_connected() noexcept
{
#if defined(LK_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(LK_OS_LINUX)
    // "TracerPid:\t<pid>" is non-zero while a tracer is attached
    constexpr auto key = std::string_view("TracerPid:");

    auto status = std::ifstream("/proc/self/status");
    auto line = std::string();
    while (std::getline(status, line))
    {
        if (!line.starts_with(key))
            continue;

        return std::strtol(line.c_str() + key.size(), nullptr, 10) != 0;
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void lk::impl::perform_abort() noexcept
{
    std::abort();
}
