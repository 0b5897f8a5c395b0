#pragma once

#include <listkit/assert.hh>
#include <listkit/fwd.hh>
#include <listkit/utility.hh>

#include <functional>
#include <memory>
#include <type_traits>

/// Non-owning reference to a callable object with signature R(Args...)
///
/// This is how listkit takes predicates: lambdas, functors and plain functions all convert implicitly,
/// and there is a well-defined "absent" state that the list operations reject with lk::argument_error.
///
/// IMPORTANT LIFETIME RULE:
///   function_ref never owns. A referenced callable object must outlive the function_ref.
///   Passing a lambda directly as a function argument is always fine.
///   Function pointers are stored by value, so they never dangle.
///
/// Absent (invalid) states:
///   - default construction:           lk::function_ref<bool(int const&)>{}
///   - construction from nullptr:      lk::function_ref<bool(int const&)>(nullptr)
///   - construction from a null function pointer
///
/// Usage example:
///   bool is_even(int const& x) { return x % 2 == 0; }
///
///   lk::remove_first(values, is_even);
///   lk::remove_first(values, [](int const& x) { return x > 10; });
template <class R, class... Args>
struct lk::function_ref<R(Args...)>
{
    // internal storage
private:
    union storage
    {
        void* object;
        void (*function)();
    };

    storage _payload = {nullptr};
    R (*_thunk)(storage, Args...) = nullptr;

    // construction
public:
    /// creates an absent function_ref
    /// calling operator() on it is a programmer error
    function_ref() = default;

    /// creates an absent function_ref, same as default construction
    function_ref(nullptr_t) {}

    /// construct from any callable invocable as R(Args...)
    /// function pointers that are null produce an absent function_ref
    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref>         //
                 && !std::is_same_v<std::remove_cvref_t<F>, nullptr_t>         //
                 && std::is_invocable_r_v<R, std::remove_reference_t<F>&, Args...>)
    function_ref(F&& f)
    {
        using Fn = std::remove_reference_t<F>;

        if constexpr (std::is_function_v<Fn> || std::is_function_v<std::remove_pointer_t<std::remove_cv_t<Fn>>>)
        {
            using fn_ptr_t = std::conditional_t<std::is_function_v<Fn>, Fn*, std::remove_cv_t<Fn>>;

            fn_ptr_t const fn = f;
            if constexpr (!std::is_function_v<Fn>)
                if (fn == nullptr)
                    return;

            _payload.function = reinterpret_cast<void (*)()>(fn); // NOLINT
            _thunk = [](storage s, Args... args) -> R
            { return std::invoke_r<R>(reinterpret_cast<fn_ptr_t>(s.function), lk::forward<Args>(args)...); }; // NOLINT
        }
        else
        {
            _payload.object = const_cast<void*>(static_cast<void const volatile*>(std::addressof(f))); // NOLINT
            _thunk = [](storage s, Args... args) -> R
            { return std::invoke_r<R>(*static_cast<Fn*>(s.object), lk::forward<Args>(args)...); };
        }
    }

    // copy and move (trivial, compiler-generated)
public:
    function_ref(function_ref const&) = default;
    function_ref(function_ref&&) = default;
    function_ref& operator=(function_ref const&) = default;
    function_ref& operator=(function_ref&&) = default;
    ~function_ref() = default;

    // queries
public:
    /// false for the absent states listed above
    [[nodiscard]] bool is_valid() const { return _thunk != nullptr; }

    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    // invocation
public:
    /// precondition: is_valid()
    R operator()(Args... args) const
    {
        LK_ASSERT(_thunk != nullptr, "calling an absent function_ref");
        return _thunk(_payload, lk::forward<Args>(args)...);
    }
};
