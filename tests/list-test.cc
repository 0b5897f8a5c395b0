#include <listkit/list.hh>

#include <nexus/test.hh>

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace
{
template <class T>
bool elements_are(std::vector<T> const& list, std::initializer_list<std::type_identity_t<T>> expected)
{
    return std::equal(list.begin(), list.end(), expected.begin(), expected.end());
}

bool is_two(int const& x)
{
    return x == 2;
}

// counts move assignments to verify the compaction does not shift elements repeatedly
struct tracked
{
    int value = 0;
    static inline int move_assign_count = 0;

    tracked() = default;
    explicit tracked(int v) : value(v) {}

    tracked(tracked const&) = default;
    tracked(tracked&&) = default;
    tracked& operator=(tracked const&) = default;
    tracked& operator=(tracked&& rhs) noexcept
    {
        ++move_assign_count;
        value = rhs.value;
        return *this;
    }
};

// list without erase, only able to drop its last element
struct back_only_list
{
    std::vector<int> items;

    int* data() { return items.data(); }
    lk::isize size() const { return lk::isize(items.size()); }
    void remove_back() { items.pop_back(); }
};

// runs f and reports whether it threw lk::argument_error for the predicate
template <class F>
bool throws_missing_predicate(F&& f)
{
    try
    {
        f();
    }
    catch (lk::argument_error const& e)
    {
        return e.argument_name() == "predicate";
    }
    return false;
}
} // namespace

static_assert(lk::shrinkable_list<std::vector<int>>);
static_assert(lk::shrinkable_list<back_only_list>);
static_assert(lk::mutable_list<std::array<int, 3>>);
static_assert(!lk::shrinkable_list<std::array<int, 3>>);
static_assert(lk::readable_list<std::vector<int> const>);
static_assert(!lk::mutable_list<std::vector<int> const>);
static_assert(!lk::readable_list<lk::span<int>>);

// =========================================================================================================
// replace_first
// =========================================================================================================

TEST("list - replace_first replaces the first match only")
{
    auto list = std::vector<int>{1, 2, 2, 3};

    CHECK(lk::replace_first(list, [](int const& x) { return x == 2; }, 9));

    CHECK(elements_are(list, {1, 9, 2, 3}));
}

TEST("list - replace_first")
{
    SECTION("no match leaves the list untouched")
    {
        auto list = std::vector<int>{1, 2, 3};
        CHECK(!lk::replace_first(list, [](int const& x) { return x == 4; }, 9));
        CHECK(elements_are(list, {1, 2, 3}));
    }

    SECTION("match at the last index")
    {
        auto list = std::vector<int>{1, 2, 3};
        CHECK(lk::replace_first(list, [](int const& x) { return x == 3; }, 7));
        CHECK(elements_are(list, {1, 2, 7}));
    }

    SECTION("plain function as predicate")
    {
        auto list = std::vector<int>{2, 2};
        CHECK(lk::replace_first(list, is_two, 5));
        CHECK(elements_are(list, {5, 2}));
    }

    SECTION("works on a span")
    {
        int data[] = {4, 5, 6};
        CHECK(lk::replace_first(lk::span<int>(data), [](int const& x) { return x > 4; }, 0));
        CHECK(data[0] == 4);
        CHECK(data[1] == 0);
        CHECK(data[2] == 6);
    }

    SECTION("works on a fixed size array")
    {
        auto list = std::array<std::string, 3>{"a", "b", "c"};
        CHECK(lk::replace_first(list, [](std::string const& s) { return s == "b"; }, "x"));
        CHECK(list[1] == "x");
    }

    SECTION("new value is moved in")
    {
        auto list = std::vector<std::string>{"keep", "old"};
        auto value = std::string(100, 'z');
        CHECK(lk::replace_first(list, [](std::string const& s) { return s == "old"; }, std::move(value)));
        CHECK(list[1] == std::string(100, 'z'));
    }
}

TEST("list - replace_first on empty and absent lists")
{
    SECTION("empty list with absent predicate is a no-op")
    {
        auto list = std::vector<int>{};
        CHECK(!lk::replace_first(list, nullptr, 9));
        CHECK(list.empty());
    }

    SECTION("absent list with absent predicate is a no-op")
    {
        std::vector<int>* list = nullptr;
        CHECK(!lk::replace_first(list, nullptr, 9));
    }

    SECTION("pointer to a list behaves like the list")
    {
        auto list = std::vector<int>{1, 2};
        CHECK(lk::replace_first(&list, is_two, 3));
        CHECK(elements_are(list, {1, 3}));
    }
}

TEST("list - replace_first rejects an absent predicate before mutating")
{
    auto list = std::vector<int>{1};

    CHECK(throws_missing_predicate([&] { lk::replace_first(list, nullptr, 9); }));
    CHECK(throws_missing_predicate([&] { lk::replace_first(list, lk::element_predicate<int>{}, 9); }));

    bool (*null_fn)(int const&) = nullptr;
    CHECK(throws_missing_predicate([&] { lk::replace_first(list, null_fn, 9); }));

    CHECK(elements_are(list, {1}));
}

TEST("list - argument_error reports the call site")
{
    auto list = std::vector<int>{1};
    int const expected_line = __LINE__ + 3;
    try
    {
        lk::replace_first(list, nullptr, 9);
        CHECK(false);
    }
    catch (std::invalid_argument const& e)
    {
        auto const* err = dynamic_cast<lk::argument_error const*>(&e);
        REQUIRE(err != nullptr);
        CHECK(int(err->site().line()) == expected_line);
        CHECK(std::string(err->site().file_name()).ends_with("list-test.cc"));
        CHECK(std::string(e.what()).find("predicate") != std::string::npos);
    }
}

// =========================================================================================================
// remove_first
// =========================================================================================================

TEST("list - remove_first")
{
    SECTION("removes only the first match")
    {
        auto list = std::vector<int>{1, 2, 2, 3};
        CHECK(lk::remove_first(list, is_two));
        CHECK(elements_are(list, {1, 2, 3}));
    }

    SECTION("shifts the tail down by one and keeps the head")
    {
        auto list = std::vector<int>{5, 6, 7, 8, 9};
        CHECK(lk::remove_first(list, [](int const& x) { return x == 7; }));
        CHECK(elements_are(list, {5, 6, 8, 9}));
    }

    SECTION("first and last element")
    {
        auto list = std::vector<int>{1, 2, 3};
        CHECK(lk::remove_first(list, [](int const& x) { return x == 1; }));
        CHECK(elements_are(list, {2, 3}));
        CHECK(lk::remove_first(list, [](int const& x) { return x == 3; }));
        CHECK(elements_are(list, {2}));
        CHECK(lk::remove_first(list, is_two));
        CHECK(list.empty());
    }

    SECTION("no match leaves the list untouched")
    {
        auto list = std::vector<int>{1, 3, 5};
        CHECK(!lk::remove_first(list, is_two));
        CHECK(elements_are(list, {1, 3, 5}));
    }

    SECTION("non-trivial elements")
    {
        auto list = std::vector<std::string>{"alpha", "beta", "gamma"};
        CHECK(lk::remove_first(list, [](std::string const& s) { return s.starts_with('b'); }));
        CHECK(elements_are(list, {"alpha", "gamma"}));
    }

    SECTION("list that can only remove its back")
    {
        auto list = back_only_list{{4, 2, 4}};
        CHECK(lk::remove_first(list, is_two));
        CHECK(elements_are(list.items, {4, 4}));
    }
}

TEST("list - remove_first on empty and absent lists")
{
    auto empty = std::vector<int>{};
    CHECK(!lk::remove_first(empty, nullptr));
    CHECK(empty.empty());

    std::vector<int>* absent = nullptr;
    CHECK(!lk::remove_first(absent, nullptr));

    auto list = std::vector<int>{2, 2};
    CHECK(lk::remove_first(&list, is_two));
    CHECK(elements_are(list, {2}));
}

TEST("list - remove_first rejects an absent predicate before mutating")
{
    auto list = std::vector<int>{1, 2, 3};

    CHECK(throws_missing_predicate([&] { lk::remove_first(list, nullptr); }));
    CHECK(throws_missing_predicate([&] { lk::remove_first(&list, lk::element_predicate<int>{}); }));

    CHECK(elements_are(list, {1, 2, 3}));
}

// =========================================================================================================
// remove_all
// =========================================================================================================

TEST("list - remove_all removes every match and returns the count")
{
    auto list = std::vector<int>{1, 2, 2, 3, 4};

    auto const removed = lk::remove_all(
        list, [](int const& x, lk::nullptr_t) { return x == 2; }, nullptr);

    CHECK(removed == 2);
    CHECK(elements_are(list, {1, 3, 4}));
}

TEST("list - remove_all")
{
    SECTION("state is passed to every predicate call")
    {
        auto list = std::vector<int>{5, 12, 7, 30, 1, 11};
        auto const limit = 10;

        auto const removed = lk::remove_all(
            list, [](int const& x, int const& max) { return x > max; }, limit);

        CHECK(removed == 3);
        CHECK(elements_are(list, {5, 7, 1}));
    }

    SECTION("mutable state")
    {
        auto list = std::vector<int>{1, 2, 3, 4, 5, 6};
        auto calls = 0;

        auto const removed = lk::remove_all(
            list,
            [](int const& x, int& counter)
            {
                ++counter;
                return x % 2 == 0;
            },
            calls);

        CHECK(removed == 3);
        CHECK(calls == 6);
        CHECK(elements_are(list, {1, 3, 5}));
    }

    SECTION("stateless overload")
    {
        auto list = std::vector<int>{2, 1, 2, 2, 3, 2};
        CHECK(lk::remove_all(list, is_two) == 4);
        CHECK(elements_are(list, {1, 3}));
    }

    SECTION("no match")
    {
        auto list = std::vector<int>{1, 3};
        CHECK(lk::remove_all(list, is_two) == 0);
        CHECK(elements_are(list, {1, 3}));
    }

    SECTION("everything matches")
    {
        auto list = std::vector<int>{2, 2, 2};
        CHECK(lk::remove_all(list, is_two) == 3);
        CHECK(list.empty());
    }

    SECTION("survivors keep their relative order")
    {
        auto list = std::vector<std::string>{"a1", "b1", "a2", "c1", "b2", "a3"};
        auto const removed = lk::remove_all(
            list, [](std::string const& s, char const& prefix) { return s[0] == prefix; }, 'b');
        CHECK(removed == 2);
        CHECK(elements_are(list, {"a1", "a2", "c1", "a3"}));
    }

    SECTION("list that can only remove its back")
    {
        auto list = back_only_list{{2, 7, 2, 8}};
        CHECK(lk::remove_all(list, is_two) == 2);
        CHECK(elements_are(list.items, {7, 8}));
    }
}

TEST("list - remove_all moves each survivor at most once")
{
    auto list = std::vector<tracked>{};
    for (auto v : {1, 2, 3, 0, 4, 0, 0, 5, 6})
        list.emplace_back(v);

    tracked::move_assign_count = 0;
    auto const removed = lk::remove_all(list, [](tracked const& t) { return t.value == 0; });

    CHECK(removed == 3);
    REQUIRE(list.size() == 6);
    for (auto i = 0; i < 6; ++i)
        CHECK(list[i].value == i + 1);

    // 1, 2, 3 are already in place, only 4, 5, 6 move
    CHECK(tracked::move_assign_count == 3);
}

TEST("list - remove_all keeps the list consistent when the predicate throws")
{
    auto const matches_x_throws_on_boom = [](std::string const& s)
    {
        if (s == "boom")
            throw std::runtime_error("predicate failed");
        return s == "x";
    };

    SECTION("after survivors were moved")
    {
        auto list = std::vector<std::string>{"a", "x", "b", "c", "boom", "d"};

        auto threw = false;
        try
        {
            lk::remove_all(list, matches_x_throws_on_boom);
        }
        catch (std::runtime_error const&)
        {
            threw = true;
        }

        CHECK(threw);
        // survivors found so far, then everything not yet scanned, no moved-from slots
        CHECK(elements_are(list, {"a", "b", "c", "boom", "d"}));
    }

    SECTION("before anything was removed")
    {
        auto list = std::vector<std::string>{"a", "boom", "x"};

        try
        {
            lk::remove_all(list, matches_x_throws_on_boom);
        }
        catch (std::runtime_error const&) // NOLINT(bugprone-empty-catch)
        {
        }

        CHECK(elements_are(list, {"a", "boom", "x"}));
    }

    SECTION("with state")
    {
        auto list = std::vector<std::string>{"x", "x", "boom", "x", "e"};
        auto calls = 0;

        try
        {
            lk::remove_all(
                list,
                [&](std::string const& s, int& counter)
                {
                    ++counter;
                    return matches_x_throws_on_boom(s);
                },
                calls);
        }
        catch (std::runtime_error const&) // NOLINT(bugprone-empty-catch)
        {
        }

        CHECK(calls == 3);
        CHECK(elements_are(list, {"boom", "x", "e"}));
    }

    SECTION("list that can only remove its back")
    {
        auto list = back_only_list{{1, 2, 3, -1, 2, 5}};

        try
        {
            lk::remove_all(list,
                           [](int const& x)
                           {
                               if (x < 0)
                                   throw std::runtime_error("negative");
                               return x == 2;
                           });
        }
        catch (std::runtime_error const&) // NOLINT(bugprone-empty-catch)
        {
        }

        CHECK(elements_are(list.items, {1, 3, -1, 2, 5}));
    }
}

TEST("list - remove_all on empty and absent lists")
{
    auto empty = std::vector<int>{};
    CHECK(lk::remove_all(empty, nullptr) == 0);
    CHECK(lk::remove_all(empty, lk::element_predicate<int>{}) == 0);

    std::vector<int>* absent = nullptr;
    CHECK(lk::remove_all(absent, is_two) == 0);
    CHECK(lk::remove_all(
              absent, [](int const&, int const&) { return true; }, 0)
          == 0);

    auto list = std::vector<int>{2, 3};
    CHECK(lk::remove_all(&list, is_two) == 1);
    CHECK(elements_are(list, {3}));
}

TEST("list - remove_all rejects an absent predicate before mutating")
{
    auto list = std::vector<int>{1, 2, 3};

    CHECK(throws_missing_predicate([&] { lk::remove_all(list, nullptr); }));
    CHECK(throws_missing_predicate(
        [&]
        {
            auto state = 0;
            lk::remove_all(list, lk::function_ref<bool(int const&, int&)>{}, state);
        }));

    CHECK(elements_are(list, {1, 2, 3}));
}

// =========================================================================================================
// to_unique_set
// =========================================================================================================

namespace
{
struct case_insensitive_hash
{
    size_t operator()(std::string const& s) const
    {
        auto h = size_t(0);
        for (auto c : s)
            h = h * 31 + size_t(std::tolower(static_cast<unsigned char>(c)));
        return h;
    }
};

struct case_insensitive_equal
{
    bool operator()(std::string const& a, std::string const& b) const
    {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i)
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        return true;
    }
};
} // namespace

TEST("list - to_unique_set")
{
    SECTION("contains exactly the distinct elements")
    {
        auto const list = std::vector<int>{3, 1, 3, 2, 1, 3};
        auto const set = lk::to_unique_set(list);

        CHECK(set.size() == 3);
        CHECK(set.contains(1));
        CHECK(set.contains(2));
        CHECK(set.contains(3));
    }

    SECTION("empty and absent lists give an empty set")
    {
        auto const empty = std::vector<int>{};
        CHECK(lk::to_unique_set(empty).empty());

        std::vector<int> const* absent = nullptr;
        CHECK(lk::to_unique_set(absent).empty());
    }

    SECTION("custom equality")
    {
        auto const list = std::vector<std::string>{"Apple", "apple", "APPLE", "pear"};
        auto const set = lk::to_unique_set(list, case_insensitive_hash{}, case_insensitive_equal{});

        CHECK(set.size() == 2);
        CHECK(set.contains("aPPle"));
        CHECK(set.contains("PEAR"));
    }

    SECTION("reserves room for every input element")
    {
        auto list = std::vector<int>(500, 7);
        for (auto i = 0; i < 10; ++i)
            list.push_back(i);

        auto const set = lk::to_unique_set(list);

        CHECK(set.size() == 11);
        CHECK(float(set.bucket_count()) * set.max_load_factor() >= float(list.size()));
    }

    SECTION("set and list are independent")
    {
        auto list = std::vector<std::string>{"x", "y"};
        auto set = lk::to_unique_set(list);

        set.insert("z");
        set.erase("x");
        CHECK(elements_are(list, {"x", "y"}));

        list[1] = "changed";
        CHECK(set.contains("y"));
        CHECK(!set.contains("changed"));
    }

    SECTION("works on a span")
    {
        int data[] = {7, 7, 8};
        auto const set = lk::to_unique_set(lk::span<int const>(data));
        CHECK(set.size() == 2);
    }
}
