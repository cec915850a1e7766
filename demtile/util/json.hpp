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

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <json/json.h>

namespace demtile
{

inline Json::Value parse(const std::string& input)
{
    Json::Value json;

    if (input.empty()) return json;

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;

    if (!reader->parse(
                input.data(),
                input.data() + input.size(),
                &json,
                &errors))
    {
        throw std::runtime_error("Error during parsing: " + errors);
    }

    return json;
}

inline std::string toFastString(const Json::Value& json)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, json);
}

// Typed member extraction which throws on a present-but-mistyped value rather
// than letting jsoncpp coerce it silently.
inline double getDouble(const Json::Value& json, const std::string& key)
{
    const Json::Value& v(json[key]);
    if (v.isNull()) return 0;
    if (!v.isNumeric())
    {
        throw std::runtime_error("Expected number for '" + key + "'");
    }
    return v.asDouble();
}

inline int getInt(const Json::Value& json, const std::string& key)
{
    const Json::Value& v(json[key]);
    if (v.isNull()) return 0;
    if (!v.isInt())
    {
        throw std::runtime_error("Expected integer for '" + key + "'");
    }
    return v.asInt();
}

inline std::string getString(const Json::Value& json, const std::string& key)
{
    const Json::Value& v(json[key]);
    if (v.isNull()) return "";
    if (!v.isString())
    {
        throw std::runtime_error("Expected string for '" + key + "'");
    }
    return v.asString();
}

} // namespace demtile
