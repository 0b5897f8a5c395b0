#pragma once

#include <listkit/assert.hh>
#include <listkit/fwd.hh>
#include <listkit/span.hh>

#include <array>
#include <bit>
#include <limits>
#include <random>

// =========================================================================================================
// Random sources for shuffling and sampling
// =========================================================================================================
//
// Generators (both model std::uniform_random_bit_generator with full 64 bit output):
//   fast_rng                    - xoshiro256**, seedable, NOT thread-safe per instance
//   thread_rng()                - the calling thread's fast_rng, seeded once from OS entropy
//   secure_rng                  - stateless view of the OS CSPRNG, safe to use from any thread
//
// Bounded integers (unbiased):
//   uniform_below(rng, bound)   - integer in [0, bound), bound > 0
//   uniform_up_to(rng, n)       - integer in [0, n], n >= 0
//
// All list operations that need randomness take the generator by reference,
// the overloads without a generator use thread_rng() (fast) or secure_rng (secure).
//

namespace lk
{
namespace impl
{
// https://prng.di.unimi.it/splitmix64.c
// used to expand a single seed word into a full xoshiro state
[[nodiscard]] constexpr u64 splitmix64(u64& x)
{
    u64 z = (x += 0x9e3779b97f4a7c15ull);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31);
}
} // namespace impl
} // namespace lk

/// xoshiro256** (https://prng.di.unimi.it), a small and fast non-cryptographic generator.
/// Deterministic for a given seed on every platform.
/// One instance must not be used from several threads at once, use lk::thread_rng() for that.
struct lk::fast_rng
{
    using result_type = u64;
    static constexpr isize state_size = 4;
    using state_t = std::array<u64, state_size>;

    // factories
public:
    /// expands `seed` via splitmix64, every seed (including 0) yields a valid state
    [[nodiscard]] static constexpr fast_rng create_from_seed(u64 seed)
    {
        state_t s;
        for (auto& w : s)
            w = impl::splitmix64(seed);
        return fast_rng(s);
    }

    /// uses the given state verbatim
    /// Precondition: not all words are zero
    [[nodiscard]] static constexpr fast_rng create_from_state(state_t const& s)
    {
        LK_ASSERT(s[0] != 0 || s[1] != 0 || s[2] != 0 || s[3] != 0, "xoshiro state must not be all zero");
        return fast_rng(s);
    }

    /// seeds from lk::secure_rng
    [[nodiscard]] static fast_rng create_from_entropy();

    // generation
public:
    [[nodiscard]] static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
    [[nodiscard]] static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    constexpr result_type operator()()
    {
        auto& s = _state;
        u64 const result = std::rotl(s[1] * 5, 7) * 9;
        u64 const t = s[1] << 17;
        s[2] ^= s[0];
        s[3] ^= s[1];
        s[1] ^= s[2];
        s[0] ^= s[3];
        s[2] ^= t;
        s[3] = std::rotl(s[3], 45);
        return result;
    }

    [[nodiscard]] constexpr state_t const& state() const { return _state; }

private:
    constexpr explicit fast_rng(state_t const& s) : _state(s) {}

    state_t _state;
};

/// Cryptographically secure generator backed by the operating system:
///   Linux: getrandom(2), Apple/BSD: arc4random_buf(3), Windows: BCryptGenRandom.
/// Has no state, so any number of instances and threads can use it concurrently.
/// An unrecoverable OS failure throws std::system_error.
struct lk::secure_rng
{
    using result_type = u64;

    [[nodiscard]] static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
    [[nodiscard]] static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    result_type operator()() const;

    /// fills `out` completely with random bytes
    static void fill_bytes(lk::span<lk::byte> out);
};

namespace lk
{
/// the calling thread's fast generator
/// created and seeded from OS entropy on first use in each thread
[[nodiscard]] fast_rng& thread_rng();

/// Returns an integer uniformly distributed in [0, bound).
/// Rejection sampling over the full 64 bit range, so there is no modulo bias.
/// Precondition: bound > 0
template <class RngT>
[[nodiscard]] isize uniform_below(RngT&& rng, isize bound)
{
    using rng_t = std::remove_cvref_t<RngT>;
    static_assert(std::uniform_random_bit_generator<rng_t>, "rng must be a uniform random bit generator");
    static_assert(rng_t::min() == 0 && rng_t::max() == std::numeric_limits<u64>::max(),
                  "rng must produce the full 64 bit range (e.g. lk::fast_rng, lk::secure_rng, std::mt19937_64)");
    LK_ASSERT(bound > 0, "uniform_below: bound must be positive");

    auto const ubound = u64(bound);

    // 2^64 mod bound: values below this would make the low residues more likely
    auto const threshold = (0 - ubound) % ubound;

    while (true)
    {
        u64 const r = rng();
        if (r >= threshold)
            return isize(r % ubound);
    }
}

/// Returns an integer uniformly distributed in [0, n] (inclusive).
/// Precondition: n >= 0
template <class RngT>
[[nodiscard]] isize uniform_up_to(RngT&& rng, isize n)
{
    LK_ASSERT(n >= 0, "uniform_up_to: n must be non-negative");
    return lk::uniform_below(rng, n + 1);
}
} // namespace lk
