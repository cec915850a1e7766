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

#include <cstddef>
#include <functional>
#include <string>

namespace demtile
{

// Final path component of a path, treating both '/' and '\' as separators so
// that metadata written on Windows resolves the same way on POSIX hosts.
inline std::string getBasename(const std::string& path)
{
    const std::size_t pos(path.find_last_of("/\\"));
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

// Identity of a tile within a metadata set.
//
// Only the base name of the tile's path participates: "a/N45E005.hgt" and
// "b/N45E005.hgt" are the same tile.  Comparison and hashing are byte-wise,
// hence case sensitive on every host, including ones whose filesystem is not.
// Callers indexing several directories must keep base names unique across
// them or risk one tile shadowing another.
//
// Equality checks the hash first and then the base name, so two different
// names whose hashes collide are distinct keys.  Equal hashes alone do not
// make two tiles the same.
class TileKey
{
public:
    TileKey() = default;
    explicit TileKey(const std::string& path)
        : m_name(getBasename(path))
        , m_hash(std::hash<std::string>()(m_name))
    { }

    const std::string& name() const { return m_name; }
    std::size_t hash() const { return m_hash; }

    bool empty() const { return m_name.empty(); }

private:
    std::string m_name;
    std::size_t m_hash = std::hash<std::string>()(std::string());
};

inline bool operator==(const TileKey& a, const TileKey& b)
{
    return a.hash() == b.hash() && a.name() == b.name();
}

inline bool operator!=(const TileKey& a, const TileKey& b)
{
    return !(a == b);
}

} // namespace demtile

namespace std
{
    template<> struct hash<demtile::TileKey>
    {
        std::size_t operator()(const demtile::TileKey& key) const
        {
            return key.hash();
        }
    };
}
