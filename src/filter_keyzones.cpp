/*─────────────────────────────────────────────────────────────
  File: src/filter_keyzones.cpp
  KeyZones: global zone keys from matching corner points

  A zone is identified by its corners. Every corner point seen so far
  is stored once (vertices_) together with the global keys of the
  zones it is a corner of. A new zone matches global key K when every
  one of its corners is a stored vertex listing K.

  Point lookup:
    - points are quantized to a uniform grid of cell size tol
      (cell_key), as the face hashing of a connectivity search does
    - a lookup scans the 3x3x3 block of cells around the point and
      accepts the first vertex within tol (squared distance)
─────────────────────────────────────────────────────────────*/
#include "meshstep/errors.hpp"
#include "meshstep/filters.hpp"

#include <cmath>
#include <functional>

namespace meshstep {

namespace {

double distance_sq(const Point& a, const Point& b)
{
    const double dx = a[0] - b[0];
    const double dy = a[1] - b[1];
    const double dz = a[2] - b[2];
    return dx * dx + dy * dy + dz * dz;
}

std::int64_t quantize_coord(double v, double cell)
{
    return static_cast<std::int64_t>(std::floor(v / cell));
}

std::string key_name(int key)
{
    return "zone-" + std::to_string(key);
}

} // anonymous namespace

std::size_t KeyZones::CellKeyHash::operator()(const CellKey& key) const
{
    std::size_t h = std::hash<std::int64_t>{}(key.ix);
    h ^= std::hash<std::int64_t>{}(key.iy) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= std::hash<std::int64_t>{}(key.iz) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

KeyZones::KeyZones(std::unique_ptr<Source> source, Logger& log, double tol)
    : Passthrough(std::move(source), log), tol_(tol)
{
    if (!(tol_ > 0.0))
        throw std::invalid_argument("KeyZones tolerance must be positive");
}

SourceProperties KeyZones::properties() const
{
    SourceProperties p = src_->properties();
    p.globally_keyed = true;
    return p;
}

KeyZones::CellKey KeyZones::cell_key(const Point& p) const
{
    return CellKey{ quantize_coord(p[0], tol_), quantize_coord(p[1], tol_),
                    quantize_coord(p[2], tol_) };
}

int KeyZones::find_vertex(const Point& p) const
{
    const CellKey base = cell_key(p);
    const double tol_sq = tol_ * tol_;

    for (int dz = -1; dz <= 1; ++dz)
        for (int dy = -1; dy <= 1; ++dy)
            for (int dx = -1; dx <= 1; ++dx) {
                auto it = grid_.find(CellKey{ base.ix + dx, base.iy + dy, base.iz + dz });
                if (it == grid_.end())
                    continue;
                for (int v : it->second)
                    if (distance_sq(vertices_[static_cast<std::size_t>(v)], p) <= tol_sq)
                        return v;
            }
    return -1;
}

int KeyZones::add_vertex(const Point& p) const
{
    const int v = find_vertex(p);
    if (v >= 0)
        return v;
    vertices_.push_back(p);
    vertex_keys_.emplace_back();
    const int idx = static_cast<int>(vertices_.size()) - 1;
    grid_[cell_key(p)].push_back(idx);
    return idx;
}

/*=====================================================================
  KeyZones::global_key

  Intersects the key sets of the zone's corners. One key left: the
  zone was seen before. None: a new key is registered under every
  corner.
=====================================================================*/
int KeyZones::global_key(const Zone& zone) const
{
    std::set<int> keys;
    bool first = true;
    for (const Point& pt : zone.coords) {
        const int v = find_vertex(pt);
        if (v < 0) {
            keys.clear();
            break;
        }
        const std::set<int>& here = vertex_keys_[static_cast<std::size_t>(v)];
        if (first) {
            keys = here;
            first = false;
        }
        else {
            std::set<int> both;
            for (int k : keys)
                if (here.count(k))
                    both.insert(k);
            keys.swap(both);
        }
        if (keys.empty())
            break;
    }

    if (keys.size() > 1)
        throw ContractViolation("zone '" + zone.key + "' matches " + std::to_string(keys.size()) +
                                " earlier zones");

    if (!keys.empty()) {
        const int key = *keys.begin();
        if (shapes_[static_cast<std::size_t>(key)] != zone.shape)
            throw ContractViolation("zone '" + zone.key + "' matches " + key_name(key) +
                                    " but is a " + shape_to_string(zone.shape) + ", not a " +
                                    shape_to_string(shapes_[static_cast<std::size_t>(key)]));
        return key;
    }

    const int key = static_cast<int>(shapes_.size());
    shapes_.push_back(zone.shape);
    for (const Point& pt : zone.coords)
        vertex_keys_[static_cast<std::size_t>(add_vertex(pt))].insert(key);
    log_.debug("Local zone '" + zone.key + "' associated with new global zone " + key_name(key));
    return key;
}

std::vector<Zone> KeyZones::zones() const
{
    std::vector<Zone> out;
    std::map<std::string, Zone> inner;
    for (const Zone& zone : src_->zones()) {
        Zone keyed = zone;
        keyed.key = key_name(global_key(zone));
        if (!inner.emplace(keyed.key, zone).second)
            throw ContractViolation("zones '" + inner.at(keyed.key).key + "' and '" + zone.key +
                                    "' have the same corners");
        out.push_back(std::move(keyed));
    }
    inner_.swap(inner);
    return out;
}

const Zone& KeyZones::inner_zone(const Zone& zone) const
{
    auto it = inner_.find(zone.key);
    if (it == inner_.end())
        throw ContractViolation("zone '" + zone.key + "' was not enumerated by KeyZones");
    return it->second;
}

Topology KeyZones::topology(const Step& step, const Basis& basis, const Zone& zone)
{
    return src_->topology(step, basis, inner_zone(zone));
}

FieldData KeyZones::field_data(const Step& step, const Field& field, const Zone& zone)
{
    return src_->field_data(step, field, inner_zone(zone));
}

} // namespace meshstep
