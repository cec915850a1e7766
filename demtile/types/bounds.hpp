/******************************************************************************
* Copyright (c) 2016, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#pragma once

#include <algorithm>
#include <ostream>
#include <string>

#include <json/json.h>

namespace demtile
{

// Geographic rectangle in degrees.  X is longitude and Y is latitude.
class BoundingBox
{
public:
    BoundingBox() = default;

    // Extrema are normalized, so each pair may be given in either order.
    BoundingBox(double minLon, double maxLon, double minLat, double maxLat)
        : m_minLon(std::min(minLon, maxLon))
        , m_maxLon(std::max(minLon, maxLon))
        , m_minLat(std::min(minLat, maxLat))
        , m_maxLat(std::max(minLat, maxLat))
    { }

    // Accepts [minLon, minLat, maxLon, maxLat].
    explicit BoundingBox(const Json::Value& json);

    double minLon() const { return m_minLon; }
    double maxLon() const { return m_maxLon; }
    double minLat() const { return m_minLat; }
    double maxLat() const { return m_maxLat; }

    double width()  const { return m_maxLon - m_minLon; }    // Length in X.
    double height() const { return m_maxLat - m_minLat; }    // Length in Y.
    double area()   const { return width() * height(); }

    double midLon() const { return m_minLon + width() / 2.0; }
    double midLat() const { return m_minLat + height() / 2.0; }

    bool empty() const { return width() == 0 && height() == 0; }

    // Returns true if this box shares any area (or edge) with another.
    bool intersects(const BoundingBox& other) const;

    // Returns true if the other box lies entirely within this one.
    bool contains(const BoundingBox& other) const;

    bool contains(double lon, double lat) const
    {
        return
            lon >= m_minLon && lon <= m_maxLon &&
            lat >= m_minLat && lat <= m_maxLat;
    }

    void grow(const BoundingBox& other);

    Json::Value toJson() const;
    std::string toString() const;

private:
    double m_minLon = 0;
    double m_maxLon = 0;
    double m_minLat = 0;
    double m_maxLat = 0;
};

std::ostream& operator<<(std::ostream& os, const BoundingBox& bbox);

inline bool operator==(const BoundingBox& lhs, const BoundingBox& rhs)
{
    return
        lhs.minLon() == rhs.minLon() && lhs.maxLon() == rhs.maxLon() &&
        lhs.minLat() == rhs.minLat() && lhs.maxLat() == rhs.maxLat();
}

inline bool operator!=(const BoundingBox& lhs, const BoundingBox& rhs)
{
    return !(lhs == rhs);
}

} // namespace demtile
