/******************************************************************************
* Copyright (c) 2016, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <demtile/types/identity.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace demtile
{

namespace
{
    std::mutex mutex;

    std::mt19937_64& engine()
    {
        static std::mt19937_64 e(
                (static_cast<uint64_t>(std::random_device()()) << 32) ^
                std::random_device()());
        return e;
    }

    const char hexDigits[] = "0123456789abcdef";
}

std::string randomIdentity()
{
    uint64_t hi(0);
    uint64_t lo(0);

    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = engine()();
        lo = engine()();
    }

    // Version 4, variant 10xx.
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    std::string s("virtual-");
    for (int i(0); i < 32; ++i)
    {
        if (i == 8 || i == 12 || i == 16 || i == 20) s += '-';

        const uint64_t word(i < 16 ? hi : lo);
        const int shift(60 - 4 * (i % 16));
        s += hexDigits[(word >> shift) & 0xF];
    }

    return s;
}

IdentityGenerator sequentialIdentity(std::string prefix)
{
    auto counter(std::make_shared<std::atomic<uint64_t>>(0));
    return [prefix, counter]()
    {
        return prefix + std::to_string(counter->fetch_add(1));
    };
}

} // namespace demtile
