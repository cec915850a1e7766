/******************************************************************************
* Copyright (c) 2019, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#pragma once

#include <utility>

#include <demtile/util/optional.hpp>
#include <demtile/util/spin-lock.hpp>

namespace demtile
{

// A value computed at most once.  Concurrent first accesses are serialized so
// that exactly one computation is stored, and the stored object is never
// replaced until reset() is called, so references returned by get() remain
// valid across subsequent calls.
//
// Copies carry over a populated value but always receive a fresh lock.
template <typename T>
class Cached
{
public:
    Cached() = default;

    Cached(const Cached& other)
        : Cached()
    {
        SpinGuard lock(other.m_spin);
        m_value = other.m_value;
    }

    Cached& operator=(const Cached& other)
    {
        if (this == &other) return *this;

        optional<T> copy;
        {
            SpinGuard lock(other.m_spin);
            copy = other.m_value;
        }

        SpinGuard lock(m_spin);
        m_value = std::move(copy);
        return *this;
    }

    template <typename F>
    const T& get(F&& compute) const
    {
        SpinGuard lock(m_spin);
        if (!m_value) m_value = optional<T>(compute());
        return *m_value;
    }

    void set(T value)
    {
        SpinGuard lock(m_spin);
        m_value = optional<T>(std::move(value));
    }

    void reset()
    {
        SpinGuard lock(m_spin);
        m_value.reset();
    }

private:
    mutable SpinLock m_spin;
    mutable optional<T> m_value;
};

} // namespace demtile
