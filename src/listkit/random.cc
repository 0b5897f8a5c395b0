#include "random.hh"

#include <listkit/macros.hh>

#include <cerrno>
#include <system_error>

#if defined(LK_OS_WINDOWS)
#include <Windows.h>
#include <bcrypt.h>

#pragma comment(lib, "bcrypt.lib")
#elif defined(LK_OS_LINUX)
#include <sys/random.h>
#elif defined(LK_OS_APPLE) || defined(LK_OS_BSD)
#include <cstdlib>
#endif

void lk::secure_rng::fill_bytes(lk::span<lk::byte> out)
{
    auto* p = out.data();
    isize remaining = out.size();

#if defined(LK_OS_WINDOWS)
    while (remaining > 0)
    {
        // BCryptGenRandom takes a ULONG count
        auto const chunk = ULONG(remaining < isize(0x7fffffff) ? remaining : isize(0x7fffffff));
        NTSTATUS const status = ::BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(p), chunk, BCRYPT_USE_SYSTEM_PREFERRED_RNG);
        if (status < 0)
            throw std::system_error(int(status), std::system_category(), "BCryptGenRandom failed");
        p += chunk;
        remaining -= chunk;
    }
#elif defined(LK_OS_LINUX)
    // getrandom may return short reads for large requests and can be interrupted by signals
    while (remaining > 0)
    {
        auto const n = ::getrandom(p, size_t(remaining), 0);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "getrandom failed");
        }
        p += n;
        remaining -= isize(n);
    }
#elif defined(LK_OS_APPLE) || defined(LK_OS_BSD)
    // cannot fail
    ::arc4random_buf(p, size_t(remaining));
#else
#error "no secure random source for this platform"
#endif
}

lk::secure_rng::result_type lk::secure_rng::operator()() const
{
    lk::byte bytes[sizeof(result_type)];
    fill_bytes(lk::span<lk::byte>(bytes));
    return std::bit_cast<result_type>(bytes);
}

lk::fast_rng lk::fast_rng::create_from_entropy()
{
    auto const gen = lk::secure_rng{};

    state_t s;
    do
    {
        for (auto& w : s)
            w = gen();
    } while (s[0] == 0 && s[1] == 0 && s[2] == 0 && s[3] == 0);

    return fast_rng(s);
}

lk::fast_rng& lk::thread_rng()
{
    thread_local fast_rng rng = fast_rng::create_from_entropy();
    return rng;
}
