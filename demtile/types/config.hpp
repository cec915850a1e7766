/******************************************************************************
* Copyright (c) 2018, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#pragma once

#include <string>

#include <json/json.h>

#include <demtile/types/exceptions.hpp>
#include <demtile/util/json.hpp>

namespace demtile
{

class Config
{
public:
    Config() : m_json(Json::objectValue) { }
    explicit Config(const Json::Value& json)
        : m_json(json.isNull() ? Json::Value(Json::objectValue) : json)
    {
        if (!m_json.isObject())
        {
            throw ConfigurationError(
                    "Invalid configuration: " + toFastString(m_json));
        }
    }

    // Directory which tile file names are relative to.
    std::string dataDirectory() const
    {
        return m_json.get("dataDirectory", "").asString();
    }

    bool verbose() const { return m_json.get("verbose", false).asBool(); }

    // If true, loading metadata of any version other than the current one
    // fails outright.  Otherwise such entries are dropped and reported.
    bool strictVersion() const
    {
        return m_json.get("strictVersion", true).asBool();
    }

    // Absolute (or data directory rooted) path of a tile.
    std::string resolve(const std::string& filename) const
    {
        const std::string dir(dataDirectory());
        if (dir.empty()) return filename;
        if (dir.back() == '/' || dir.back() == '\\') return dir + filename;
        return dir + '/' + filename;
    }

    const Json::Value& json() const { return m_json; }

private:
    Json::Value m_json;
};

} // namespace demtile
