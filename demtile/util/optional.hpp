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

#include <demtile/util/unique.hpp>

namespace demtile
{

// Heap-backed stand-in for std::optional with a cloning copy constructor.
// The held object keeps its address for as long as the optional holds it.
template <typename T>
class optional
{
public:
    optional() = default;
    optional(const T& v) : m_value(makeUnique<T>(v)) { }
    optional(T&& v) : m_value(makeUnique<T>(std::move(v))) { }

    optional(const optional& other)
        : optional()
    {
        if (other) m_value = makeUnique<T>(*other);
    }

    optional(optional&& other) = default;

    optional& operator=(const optional& other)
    {
        if (!other) reset();
        else m_value = makeUnique<T>(*other);
        return *this;
    }

    optional& operator=(optional&& other) = default;

    bool has_value() const noexcept { return static_cast<bool>(m_value); }
    explicit operator bool() const noexcept { return has_value(); }

    T& operator*() { return *m_value; }
    const T& operator*() const { return *m_value; }

    void reset() { m_value.reset(); }

private:
    std::unique_ptr<T> m_value;
};

} // namespace demtile
