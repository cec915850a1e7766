/******************************************************************************
* Copyright (c) 2016, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <demtile/types/bounds.hpp>

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <demtile/util/json.hpp>

namespace demtile
{

BoundingBox::BoundingBox(const Json::Value& json)
{
    if (json.isNull()) return;

    if (!json.isArray() || json.size() != 4)
    {
        throw std::runtime_error(
                "Invalid JSON BoundingBox: " + toFastString(json));
    }

    for (Json::ArrayIndex i(0); i < json.size(); ++i)
    {
        if (!json[i].isNumeric())
        {
            throw std::runtime_error(
                    "Invalid JSON BoundingBox: " + toFastString(json));
        }
    }

    *this = BoundingBox(
            json[0].asDouble(),
            json[2].asDouble(),
            json[1].asDouble(),
            json[3].asDouble());
}

bool BoundingBox::intersects(const BoundingBox& other) const
{
    return
        m_minLon <= other.m_maxLon && other.m_minLon <= m_maxLon &&
        m_minLat <= other.m_maxLat && other.m_minLat <= m_maxLat;
}

bool BoundingBox::contains(const BoundingBox& other) const
{
    return
        other.m_minLon >= m_minLon && other.m_maxLon <= m_maxLon &&
        other.m_minLat >= m_minLat && other.m_maxLat <= m_maxLat;
}

void BoundingBox::grow(const BoundingBox& other)
{
    m_minLon = std::min(m_minLon, other.m_minLon);
    m_maxLon = std::max(m_maxLon, other.m_maxLon);
    m_minLat = std::min(m_minLat, other.m_minLat);
    m_maxLat = std::max(m_maxLat, other.m_maxLat);
}

Json::Value BoundingBox::toJson() const
{
    Json::Value json(Json::arrayValue);
    json.append(m_minLon);
    json.append(m_minLat);
    json.append(m_maxLon);
    json.append(m_maxLat);
    return json;
}

std::string BoundingBox::toString() const
{
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const BoundingBox& bbox)
{
    auto flags(os.flags());
    auto precision(os.precision());

    os << std::setprecision(6) << std::fixed;

    os << "Lon: [" << bbox.minLon() << ", " << bbox.maxLon() << "], " <<
        "Lat: [" << bbox.minLat() << ", " << bbox.maxLat() << "]";

    os << std::setprecision(precision);
    os.flags(flags);

    return os;
}

} // namespace demtile
