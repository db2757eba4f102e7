/*─────────────────────────────────────────────────────────────
  File: src/payload.cpp

  Topology and FieldData construction, validation and serialization.

  Both payload types validate their invariants on construction and
  throw std::invalid_argument when a Source hands in inconsistent
  sizes; the driver reports such failures as FetchFailure because
  they surface inside Source::topology / Source::field_data.

  as_node() output uses flow style for numeric arrays so the canonical
  envelope stays compact and line-stable.
─────────────────────────────────────────────────────────────*/
#include "meshstep/payload.hpp"

#include <stdexcept>
#include <string>

namespace meshstep {

namespace {

/* Flow-style sequence: "[1, 2, 3]" */
template <typename T>
YAML::Node flow_seq(const std::vector<T>& v)
{
    YAML::Node n(YAML::NodeType::Sequence);
    for (const T& x : v)
        n.push_back(x);
    n.SetStyle(YAML::EmitterStyle::Flow);
    return n;
}

} // anonymous namespace

/*=====================================================================
  Topology
=====================================================================*/
Topology Topology::structured(const std::array<long long, 3>& vtxSize, int pardim)
{
    Topology t;
    t.shape_ = shape_from_pardim(pardim);
    t.structured_ = true;
    t.nodes_ = 1;
    for (int d = 0; d < 3; ++d) {
        if (d < pardim) {
            if (vtxSize[d] < 2)
                throw std::invalid_argument(
                    "Structured topology needs at least 2 vertices along axis " +
                    std::to_string(d));
            t.vtxSize_[d] = vtxSize[d];
        } else {
            t.vtxSize_[d] = 1;                 // collapsed axis
        }
        t.nodes_ *= t.vtxSize_[d];
    }
    return t;
}

Topology Topology::unstructured(Shape shape, long long num_nodes,
                                std::vector<long long> cells)
{
    const auto npc = static_cast<std::size_t>(nodes_per_cell(shape));
    if (cells.size() % npc != 0)
        throw std::invalid_argument(
            "Connectivity length " + std::to_string(cells.size()) +
            " is not a multiple of " + std::to_string(npc));
    for (long long node : cells) {
        if (node < 0 || node >= num_nodes)
            throw std::invalid_argument("Connectivity refers to node " +
                                        std::to_string(node) + " of " +
                                        std::to_string(num_nodes));
    }

    Topology t;
    t.shape_ = shape;
    t.structured_ = false;
    t.nodes_ = num_nodes;
    t.cells_ = std::move(cells);
    return t;
}

long long Topology::num_nodes() const
{
    return nodes_;
}

/*
  Structured: product of (N-1) over the parametric axes.
*/
long long Topology::num_cells() const
{
    if (!structured_)
        return static_cast<long long>(cells_.size()) / nodes_per_cell(shape_);
    long long n = 1;
    for (int d = 0; d < pardim(); ++d)
        n *= vtxSize_[d] - 1;
    return n;
}

YAML::Node Topology::as_node() const
{
    YAML::Node n;
    n["shape"] = shape_to_string(shape_);
    n["pardim"] = pardim();
    n["structured"] = structured_;
    n["num_nodes"] = nodes_;
    n["num_cells"] = num_cells();

    if (structured_) {
        std::vector<long long> dims(vtxSize_.begin(), vtxSize_.begin() + pardim());
        n["shape-dims"] = flow_seq(dims);
    } else {
        YAML::Node cells(YAML::NodeType::Sequence);
        const auto npc = static_cast<std::size_t>(nodes_per_cell(shape_));
        for (std::size_t c = 0; c < cells_.size(); c += npc) {
            std::vector<long long> cell(cells_.begin() + c, cells_.begin() + c + npc);
            cells.push_back(flow_seq(cell));
        }
        n["cells"] = cells;
    }
    return n;
}

/*=====================================================================
  FieldData
=====================================================================*/
FieldData::FieldData(int ncomps, std::vector<double> values)
    : ncomps_(ncomps), values_(std::move(values))
{
    if (ncomps_ < 1)
        throw std::invalid_argument("FieldData needs at least one component");
    if (values_.size() % static_cast<std::size_t>(ncomps_) != 0)
        throw std::invalid_argument(
            "FieldData length " + std::to_string(values_.size()) +
            " is not a multiple of " + std::to_string(ncomps_) + " components");
}

std::vector<double> FieldData::component(int comp) const
{
    if (comp < 0 || comp >= ncomps_)
        throw std::out_of_range("Component " + std::to_string(comp) + " out of range");
    std::vector<double> out(num_points());
    for (std::size_t p = 0; p < out.size(); ++p)
        out[p] = value(p, comp);
    return out;
}

FieldData FieldData::slice(const std::vector<int>& comps) const
{
    if (comps.empty())
        throw std::invalid_argument("Slice needs at least one component");
    for (int c : comps) {
        if (c < 0 || c >= ncomps_)
            throw std::out_of_range("Component " + std::to_string(c) + " out of range");
    }

    const std::size_t np = num_points();
    std::vector<double> out;
    out.reserve(np * comps.size());
    for (std::size_t p = 0; p < np; ++p)
        for (int c : comps)
            out.push_back(value(p, c));
    return FieldData(static_cast<int>(comps.size()), std::move(out));
}

FieldData FieldData::concat(const std::vector<FieldData>& parts)
{
    if (parts.empty())
        throw std::invalid_argument("Nothing to concatenate");

    const std::size_t np = parts.front().num_points();
    int total = 0;
    for (const auto& part : parts) {
        if (part.num_points() != np)
            throw std::invalid_argument("Cannot concatenate fields with different point counts");
        total += part.num_comps();
    }

    std::vector<double> out;
    out.reserve(np * static_cast<std::size_t>(total));
    for (std::size_t p = 0; p < np; ++p)
        for (const auto& part : parts)
            for (int c = 0; c < part.num_comps(); ++c)
                out.push_back(part.value(p, c));
    return FieldData(total, std::move(out));
}

FieldData FieldData::from_components(const std::vector<std::vector<double>>& comps)
{
    if (comps.empty())
        throw std::invalid_argument("Need at least one component array");

    const std::size_t np = comps.front().size();
    for (const auto& c : comps) {
        if (c.size() != np)
            throw std::invalid_argument("Component arrays differ in length");
    }

    std::vector<double> out;
    out.reserve(np * comps.size());
    for (std::size_t p = 0; p < np; ++p)
        for (const auto& c : comps)
            out.push_back(c[p]);
    return FieldData(static_cast<int>(comps.size()), std::move(out));
}

YAML::Node FieldData::as_node() const
{
    YAML::Node n;
    n["num_comps"] = ncomps_;
    n["num_points"] = static_cast<unsigned long long>(num_points());
    n["values"] = flow_seq(values_);
    return n;
}

} // namespace meshstep
