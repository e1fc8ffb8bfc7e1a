#include "assert.hh"

#include <fallible/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

#ifdef FL_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef FL_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// handlers are shared so the topmost one can run without holding the lock
// (it may throw, or trigger a nested assertion that needs the stack again)
struct handler_stack
{
    std::mutex mutex;
    std::vector<std::shared_ptr<fl::impl::assertion_handler>> handlers;
};

handler_stack& handlers()
{
    static handler_stack stack;
    return stack;
}

void report_to_stderr(fl::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << "Assertion failed: " << info.expression << '\n'
              << "  Message: " << info.message << '\n'
              << "  Location: " << loc.file_name() << ':' << loc.line() << ':' << loc.column() << " ("
              << loc.function_name() << ")\n";
}
} // namespace

void fl::impl::push_assertion_handler(assertion_handler handler)
{
    auto entry = std::make_shared<assertion_handler>(std::move(handler));
    auto& stack = handlers();
    std::lock_guard lock(stack.mutex);
    stack.handlers.push_back(std::move(entry));
}

void fl::impl::pop_assertion_handler()
{
    auto& stack = handlers();
    std::lock_guard lock(stack.mutex);
    if (!stack.handlers.empty())
        stack.handlers.pop_back();
}

fl::isize fl::impl::assertion_handler_count()
{
    auto& stack = handlers();
    std::lock_guard lock(stack.mutex);
    return isize(stack.handlers.size());
}

fl::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

fl::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

FL_COLD_FUNC void fl::impl::handle_assert_failure(char const* expression, char const* message, fl::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    std::shared_ptr<assertion_handler> top;
    {
        auto& stack = handlers();
        std::lock_guard lock(stack.mutex);
        if (!stack.handlers.empty())
            top = stack.handlers.back();
    }

    if (top)
        (*top)(info);
    else
        report_to_stderr(info);

    // the abort is issued by the assert macro so the debugger breaks at the call site
}

bool fl::impl::is_debugger_connected() noexcept
{
#ifdef FL_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(FL_OS_LINUX)
    auto* f = std::fopen("/proc/self/status", "r");
    if (!f)
        return false;

    int tracer = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), f))
    {
        if (std::strncmp(line, "TracerPid:", 10) == 0)
        {
            std::sscanf(line + 10, "%d", &tracer);
            break;
        }
    }
    std::fclose(f);
    return tracer != 0;
#else
    return false;
#endif
}

[[noreturn]] void fl::impl::perform_abort() noexcept
{
    std::abort();
}
