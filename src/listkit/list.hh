#pragma once

#include <listkit/assert.hh>
#include <listkit/error.hh>
#include <listkit/function_ref.hh>
#include <listkit/fwd.hh>
#include <listkit/random.hh>
#include <listkit/span.hh>
#include <listkit/utility.hh>

#include <functional>
#include <type_traits>
#include <unordered_set>

// =========================================================================================================
// In-place operations on lists
// =========================================================================================================
//
// A "list" is any container with contiguous storage (data() + size()), e.g. std::vector<T>.
// Operations that keep the length also accept an lk::span<T>.
// Operations that shorten the list additionally need a way to drop the tail
// (erase(first, last), remove_back() or pop_back()).
// Every operation has a pointer overload where nullptr means "no list" and behaves like an empty list.
//
// Matching:
//   replace_first(list, pred, value)    - overwrite the first element matching pred
//   remove_first(list, pred)            - remove the first element matching pred, order preserved
//   remove_all(list, pred [, state])    - remove all matching elements in one stable pass, returns count
//
// Randomness:
//   shuffle(list [, rng])               - uniform Fisher-Yates permutation, fast generator
//   secure_shuffle(list)                - same, drawing from the OS CSPRNG
//   random_element(list [, rng])        - pointer to a uniformly chosen element, nullptr if empty
//   get_random(list [, rng])            - copy of a uniformly chosen element, T{} if empty
//
// Conversion:
//   to_unique_set(list [, hash, eq])    - std::unordered_set of the distinct elements
//
// Errors:
//   An absent predicate (see lk::function_ref) throws lk::argument_error before anything is modified.
//   Empty or absent lists are never an error, the predicate is not even looked at then.
//

namespace lk
{
namespace impl
{
template <class T>
constexpr bool is_span = false;
template <class T>
constexpr bool is_span<lk::span<T>> = true;
} // namespace impl

/// any container with contiguous storage, elements may be const
template <class ListT>
concept readable_list = !impl::is_span<std::remove_cv_t<ListT>> && requires(ListT& list) {
    requires std::is_pointer_v<decltype(list.data())>;
    { list.size() } -> std::convertible_to<isize>;
};

/// pointer to the first element, e.g. int* for std::vector<int>, int const* for std::vector<int> const
template <readable_list ListT>
using list_element_t = std::remove_pointer_t<decltype(std::declval<ListT&>().data())>;

/// element type without cv, used in predicate signatures
template <readable_list ListT>
using list_value_t = std::remove_cv_t<list_element_t<ListT>>;

/// a readable_list whose elements can be assigned
template <class ListT>
concept mutable_list = readable_list<ListT> && !std::is_const_v<list_element_t<ListT>>;

/// a mutable_list that can also drop elements from its end
template <class ListT>
concept shrinkable_list = mutable_list<ListT>
                       && (requires(ListT& list) { list.erase(list.begin(), list.end()); } //
                           || requires(ListT& list) { list.remove_back(); }                //
                           || requires(ListT& list) { list.pop_back(); });

/// predicate signature for the element type T
template <class T>
using element_predicate = lk::function_ref<bool(std::remove_cv_t<T> const&)>;

namespace impl
{
template <mutable_list ListT>
[[nodiscard]] constexpr lk::span<list_element_t<ListT>> as_span(ListT& list)
{
    return lk::span<list_element_t<ListT>>(list);
}

template <readable_list ListT>
[[nodiscard]] constexpr lk::span<list_element_t<ListT>> as_readonly_span(ListT& list)
{
    return lk::span<list_element_t<ListT>>(list);
}

/// drops everything behind the first new_size elements
template <shrinkable_list ListT>
constexpr void truncate_list(ListT& list, isize new_size)
{
    LK_ASSERT(0 <= new_size && new_size <= isize(list.size()), "truncate_list: new size out of bounds");

    if constexpr (requires { list.erase(list.begin(), list.end()); })
        list.erase(list.begin() + new_size, list.end());
    else if constexpr (requires { list.remove_back(); })
        while (isize(list.size()) > new_size)
            list.remove_back();
    else
        while (isize(list.size()) > new_size)
            list.pop_back();
}

/// index of the first element matching the predicate, -1 if there is none
template <class T>
[[nodiscard]] constexpr isize index_of_first(lk::span<T> elements, element_predicate<T> const& predicate)
{
    for (isize i = 0; i < elements.size(); ++i)
        if (predicate(elements[i]))
            return i;
    return -1;
}

/// Stable removal: drops every element for which is_removed holds, keeping the relative order
/// of the survivors, and returns how many were dropped.
/// Single forward pass; each survivor is moved at most once and the list is truncated once.
/// If is_removed (or a move) throws, the unscanned elements are moved down behind the survivors
/// found so far and the list is truncated before rethrowing, so it never holds moved-from slots.
template <shrinkable_list ListT, class RemovedF>
isize remove_matching(ListT& list, RemovedF&& is_removed)
{
    auto const elements = impl::as_span(list);
    auto const size = elements.size();

    // [0, write) are survivors, [read, size) is not yet scanned
    isize write = 0;
    isize read = 0;
    try
    {
        for (; read < size; ++read)
        {
            if (is_removed(elements[read]))
                continue;

            if (write != read)
                elements[write] = lk::move(elements[read]);
            ++write;
        }
    }
    catch (...)
    {
        if (write != read)
            for (auto i = read; i < size; ++i)
                elements[write + (i - read)] = lk::move(elements[i]);

        impl::truncate_list(list, write + (size - read));
        throw;
    }

    impl::truncate_list(list, write);
    return size - write;
}
} // namespace impl

// =========================================================================================================
// replace_first
// =========================================================================================================

/// Overwrites the first element (lowest index) for which predicate holds with new_value.
/// Later matches are left alone. Returns true if an element was replaced.
/// Empty lists are a no-op; an absent predicate on a non-empty list throws lk::argument_error.
/// O(n), no allocation.
template <class T>
bool replace_first(lk::span<T> list,
                   element_predicate<T> predicate,
                   std::remove_cv_t<T> new_value,
                   lk::source_location site = lk::source_location::current())
{
    static_assert(!std::is_const_v<T>, "replace_first needs mutable elements");

    if (list.empty())
        return false;

    if (!predicate.is_valid())
        impl::throw_missing_argument("predicate", site);

    auto const scope = impl::operation_scope("lk::replace_first", site);

    auto const idx = impl::index_of_first(list, predicate);
    if (idx < 0)
        return false;

    list[idx] = lk::move(new_value);
    return true;
}

template <mutable_list ListT>
bool replace_first(ListT& list,
                   element_predicate<list_value_t<ListT>> predicate,
                   list_value_t<ListT> new_value,
                   lk::source_location site = lk::source_location::current())
{
    return lk::replace_first(impl::as_span(list), predicate, lk::move(new_value), site);
}

template <mutable_list ListT>
bool replace_first(ListT* list,
                   element_predicate<list_value_t<ListT>> predicate,
                   list_value_t<ListT> new_value,
                   lk::source_location site = lk::source_location::current())
{
    if (list == nullptr)
        return false;

    return lk::replace_first(*list, predicate, lk::move(new_value), site);
}

// =========================================================================================================
// remove_first
// =========================================================================================================

/// Removes the first element (lowest index) for which predicate holds.
/// Everything behind it moves down by one slot in a single pass, then the list shrinks by one.
/// Order of all other elements is preserved. Returns true if an element was removed.
/// Empty lists are a no-op; an absent predicate on a non-empty list throws lk::argument_error.
template <shrinkable_list ListT>
bool remove_first(ListT& list,
                  element_predicate<list_value_t<ListT>> predicate,
                  lk::source_location site = lk::source_location::current())
{
    auto const elements = impl::as_span(list);
    if (elements.empty())
        return false;

    if (!predicate.is_valid())
        impl::throw_missing_argument("predicate", site);

    auto const scope = impl::operation_scope("lk::remove_first", site);

    auto const idx = impl::index_of_first(elements, predicate);
    if (idx < 0)
        return false;

    for (auto i = idx + 1; i < elements.size(); ++i)
        elements[i - 1] = lk::move(elements[i]);

    impl::truncate_list(list, elements.size() - 1);
    return true;
}

template <shrinkable_list ListT>
bool remove_first(ListT* list,
                  element_predicate<list_value_t<ListT>> predicate,
                  lk::source_location site = lk::source_location::current())
{
    if (list == nullptr)
        return false;

    return lk::remove_first(*list, predicate, site);
}

// =========================================================================================================
// remove_all
// =========================================================================================================

/// Removes every element for which predicate(element, state) holds and returns how many were removed.
/// state is handed to every predicate call, so matching can depend on caller context without captures:
///   lk::remove_all(values, [](int const& v, int const& limit) { return v > limit; }, 10);
///
/// Single forward pass with separate read and write positions:
///   - survivors keep their relative order
///   - each survivor is moved at most once (no per-removal shifting)
///   - the list is truncated once at the end
/// If the predicate throws, the list keeps the survivors scanned so far followed by every unscanned element.
/// Empty lists return 0; an absent predicate on a non-empty list throws lk::argument_error.
template <shrinkable_list ListT, class StateT>
isize remove_all(ListT& list,
                 lk::function_ref<bool(list_value_t<ListT> const&, std::remove_reference_t<StateT>&)> predicate,
                 StateT&& state,
                 lk::source_location site = lk::source_location::current())
{
    if (impl::as_span(list).empty())
        return 0;

    if (!predicate.is_valid())
        impl::throw_missing_argument("predicate", site);

    auto const scope = impl::operation_scope("lk::remove_all", site);
    return impl::remove_matching(list, [&](list_value_t<ListT> const& elem) { return predicate(elem, state); });
}

/// stateless variant of remove_all
template <shrinkable_list ListT>
isize remove_all(ListT& list,
                 element_predicate<list_value_t<ListT>> predicate,
                 lk::source_location site = lk::source_location::current())
{
    if (impl::as_span(list).empty())
        return 0;

    if (!predicate.is_valid())
        impl::throw_missing_argument("predicate", site);

    auto const scope = impl::operation_scope("lk::remove_all", site);
    return impl::remove_matching(list, predicate);
}

template <shrinkable_list ListT, class StateT>
isize remove_all(ListT* list,
                 lk::function_ref<bool(list_value_t<ListT> const&, std::remove_reference_t<StateT>&)> predicate,
                 StateT&& state,
                 lk::source_location site = lk::source_location::current())
{
    if (list == nullptr)
        return 0;

    return lk::remove_all(*list, predicate, state, site);
}

template <shrinkable_list ListT>
isize remove_all(ListT* list,
                 element_predicate<list_value_t<ListT>> predicate,
                 lk::source_location site = lk::source_location::current())
{
    if (list == nullptr)
        return 0;

    return lk::remove_all(*list, predicate, site);
}

// =========================================================================================================
// shuffle / secure_shuffle
// =========================================================================================================

/// In-place Fisher-Yates shuffle: for n = size-1 down to 1, swap element n with a uniformly drawn k in [0, n].
/// Every permutation is equally likely provided rng is uniform.
/// Lists with fewer than two elements are left untouched and consume no randomness.
/// Elements are exchanged with lk::swap, so custom ADL swaps are used.
template <class T, class RngT>
void shuffle(lk::span<T> list, RngT&& rng)
{
    static_assert(!std::is_const_v<T>, "shuffle needs mutable elements");

    for (auto n = list.size() - 1; n > 0; --n)
    {
        auto const k = lk::uniform_up_to(rng, n);
        if (k != n)
            lk::swap(list[n], list[k]);
    }
}

/// shuffles with the calling thread's fast generator
template <class T>
void shuffle(lk::span<T> list)
{
    lk::shuffle(list, lk::thread_rng());
}

template <mutable_list ListT, class RngT>
void shuffle(ListT& list, RngT&& rng)
{
    lk::shuffle(impl::as_span(list), rng);
}

template <mutable_list ListT>
void shuffle(ListT& list)
{
    lk::shuffle(impl::as_span(list), lk::thread_rng());
}

template <mutable_list ListT, class RngT>
void shuffle(ListT* list, RngT&& rng)
{
    if (list != nullptr)
        lk::shuffle(*list, rng);
}

template <mutable_list ListT>
void shuffle(ListT* list)
{
    if (list != nullptr)
        lk::shuffle(*list);
}

/// Same algorithm as shuffle but every index is drawn from lk::secure_rng.
/// Use when the resulting order must not be predictable by an adversary. Considerably slower.
template <class T>
void secure_shuffle(lk::span<T> list)
{
    lk::shuffle(list, lk::secure_rng{});
}

template <mutable_list ListT>
void secure_shuffle(ListT& list)
{
    lk::secure_shuffle(impl::as_span(list));
}

template <mutable_list ListT>
void secure_shuffle(ListT* list)
{
    if (list != nullptr)
        lk::secure_shuffle(*list);
}

// =========================================================================================================
// random_element / get_random
// =========================================================================================================

/// Pointer to a uniformly selected element, nullptr for an empty list.
/// A single-element list returns its element without drawing from rng.
template <class T, class RngT>
[[nodiscard]] T* random_element(lk::span<T> list, RngT&& rng)
{
    if (list.empty())
        return nullptr;

    if (list.size() == 1)
        return list.data();

    return list.data() + lk::uniform_below(rng, list.size());
}

template <class T>
[[nodiscard]] T* random_element(lk::span<T> list)
{
    return lk::random_element(list, lk::thread_rng());
}

template <readable_list ListT, class RngT>
[[nodiscard]] list_element_t<ListT>* random_element(ListT& list, RngT&& rng)
{
    return lk::random_element(impl::as_readonly_span(list), rng);
}

template <readable_list ListT>
[[nodiscard]] list_element_t<ListT>* random_element(ListT& list)
{
    return lk::random_element(impl::as_readonly_span(list), lk::thread_rng());
}

template <readable_list ListT, class RngT>
[[nodiscard]] list_element_t<ListT>* random_element(ListT* list, RngT&& rng)
{
    return list == nullptr ? nullptr : lk::random_element(*list, rng);
}

template <readable_list ListT>
[[nodiscard]] list_element_t<ListT>* random_element(ListT* list)
{
    return list == nullptr ? nullptr : lk::random_element(*list);
}

/// Copy of a uniformly selected element, or a value-initialized T (0, nullptr, empty string, ...)
/// for an empty list. Use random_element if T{} is a legitimate element and must be told apart.
template <class T, class RngT>
[[nodiscard]] std::remove_cv_t<T> get_random(lk::span<T> list, RngT&& rng)
{
    static_assert(std::is_default_constructible_v<std::remove_cv_t<T>>, "get_random needs a default value for empty lists");

    if (auto const* elem = lk::random_element(list, rng))
        return *elem;

    return std::remove_cv_t<T>{};
}

template <class T>
[[nodiscard]] std::remove_cv_t<T> get_random(lk::span<T> list)
{
    return lk::get_random(list, lk::thread_rng());
}

template <readable_list ListT, class RngT>
[[nodiscard]] list_value_t<ListT> get_random(ListT& list, RngT&& rng)
{
    return lk::get_random(impl::as_readonly_span(list), rng);
}

template <readable_list ListT>
[[nodiscard]] list_value_t<ListT> get_random(ListT& list)
{
    return lk::get_random(impl::as_readonly_span(list), lk::thread_rng());
}

template <readable_list ListT, class RngT>
[[nodiscard]] list_value_t<ListT> get_random(ListT* list, RngT&& rng)
{
    return list == nullptr ? list_value_t<ListT>{} : lk::get_random(*list, rng);
}

template <readable_list ListT>
[[nodiscard]] list_value_t<ListT> get_random(ListT* list)
{
    return list == nullptr ? list_value_t<ListT>{} : lk::get_random(*list);
}

// =========================================================================================================
// to_unique_set
// =========================================================================================================

/// New std::unordered_set holding a copy of every distinct element.
/// Distinctness is decided by HashT and KeyEqualT, which default to std::hash and std::equal_to.
/// Pass both to use a different notion of equality (they must agree: equal elements hash equally).
/// The set reserves the list size up front; the result never aliases the list.
template <class T,
          class HashT = std::hash<std::remove_cv_t<T>>,
          class KeyEqualT = std::equal_to<std::remove_cv_t<T>>>
[[nodiscard]] std::unordered_set<std::remove_cv_t<T>, HashT, KeyEqualT> to_unique_set(lk::span<T> list,
                                                                                     HashT const& hash = HashT{},
                                                                                     KeyEqualT const& equal = KeyEqualT{})
{
    auto result = std::unordered_set<std::remove_cv_t<T>, HashT, KeyEqualT>(0, hash, equal);
    if (list.empty())
        return result;

    result.reserve(size_t(list.size()));
    for (auto const& elem : list)
        result.insert(elem);

    return result;
}

template <readable_list ListT,
          class HashT = std::hash<list_value_t<ListT>>,
          class KeyEqualT = std::equal_to<list_value_t<ListT>>>
[[nodiscard]] std::unordered_set<list_value_t<ListT>, HashT, KeyEqualT> to_unique_set(ListT& list,
                                                                                     HashT const& hash = HashT{},
                                                                                     KeyEqualT const& equal = KeyEqualT{})
{
    return lk::to_unique_set(impl::as_readonly_span(list), hash, equal);
}

template <readable_list ListT,
          class HashT = std::hash<list_value_t<ListT>>,
          class KeyEqualT = std::equal_to<list_value_t<ListT>>>
[[nodiscard]] std::unordered_set<list_value_t<ListT>, HashT, KeyEqualT> to_unique_set(ListT* list,
                                                                                     HashT const& hash = HashT{},
                                                                                     KeyEqualT const& equal = KeyEqualT{})
{
    if (list == nullptr)
        return std::unordered_set<list_value_t<ListT>, HashT, KeyEqualT>(0, hash, equal);

    return lk::to_unique_set(*list, hash, equal);
}

} // namespace lk
