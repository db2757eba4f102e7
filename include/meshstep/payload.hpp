/*
  File: include/meshstep/payload.hpp

  Per-zone payloads returned by the on-demand fetch calls of a Source.

  This header defines:
    - meshstep::Topology : shape/connectivity of one zone under one basis
    - meshstep::FieldData: values of one field on one zone

  Usage:
    - Source::topology(...) / Source::field_data(...) return them
    - writer.hpp stores them in basis/field update records
    - debug_writer.cpp serializes them through as_node()
    - cgns_writer.cpp reads vtxSize / cells / values directly
    - filters.cpp slices and concatenates FieldData (Decompose)

  Layout conventions:
    - Structured topologies order nodes with the first parametric axis
      fastest (i, then j, then k), the Plot3D / CGNS convention.
    - Unstructured connectivity is 0-based, nodes_per_cell() entries
      per cell, cell after cell.
    - FieldData values are point-major: value(p, c) = values[p*ncomps + c].
*/
#pragma once

#include "meshstep/common.hpp"

#include <array>
#include <cstddef>
#include <initializer_list>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace meshstep {

/*-------------------------------------------------------------
  Topology
-------------------------------------------------------------*/
class Topology
{
public:
    Topology() = default;

    /*
      structured(vtxSize, pardim):
        - vtxSize[0..pardim-1] are vertex counts per parametric axis,
          each >= 2; unused trailing entries are forced to 1.
        - Throws std::invalid_argument on bad input.
    */
    static Topology structured(const std::array<long long, 3>& vtxSize, int pardim);

    /*
      unstructured(shape, num_nodes, cells):
        - cells.size() must be a multiple of nodes_per_cell(shape)
        - every entry must lie in [0, num_nodes)
    */
    static Topology unstructured(Shape shape, long long num_nodes,
                                 std::vector<long long> cells);

    Shape shape()        const { return shape_; }
    int   pardim()       const { return shape_pardim(shape_); }
    bool  is_structured() const { return structured_; }

    long long num_nodes() const;
    long long num_cells() const;

    /// Vertex counts (Ni, Nj, Nk); only valid for structured topologies
    const std::array<long long, 3>& vtxSize() const { return vtxSize_; }

    /// 0-based connectivity; empty for structured topologies
    const std::vector<long long>& cells() const { return cells_; }

    static int nodes_per_cell(Shape s) { return 1 << shape_pardim(s); }

    /*
      as_node():
        Nested mapping used by the canonical envelope:
          { shape, pardim, structured, num_nodes, num_cells,
            shape-dims: [..] }           (structured)
          { ..., cells: [[..], ..] }     (unstructured)
    */
    YAML::Node as_node() const;

private:
    Shape                    shape_      = Shape::Hexahedron;
    bool                     structured_ = true;
    std::array<long long, 3> vtxSize_{ {1, 1, 1} };
    long long                nodes_      = 0;
    std::vector<long long>   cells_;
};

/*-------------------------------------------------------------
  FieldData
-------------------------------------------------------------*/
class FieldData
{
public:
    FieldData() = default;

    /*
      FieldData(ncomps, values):
        - values.size() must be a multiple of ncomps (ncomps >= 1)
    */
    FieldData(int ncomps, std::vector<double> values);

    int         num_comps()  const { return ncomps_; }
    std::size_t num_points() const { return ncomps_ ? values_.size() / ncomps_ : 0; }
    const std::vector<double>& values() const { return values_; }

    double value(std::size_t point, int comp) const
    {
        return values_[point * static_cast<std::size_t>(ncomps_) + comp];
    }

    /* All values of one component, in point order. */
    std::vector<double> component(int comp) const;

    /* Keep only the listed components, in the listed order. */
    FieldData slice(const std::vector<int>& comps) const;

    /* Join fields with equal point counts component-wise. */
    static FieldData concat(const std::vector<FieldData>& parts);

    /* Build from separate per-component arrays ([x1..xN], [y1..yN], ...). */
    static FieldData from_components(const std::vector<std::vector<double>>& comps);

    YAML::Node as_node() const;

private:
    int                 ncomps_ = 1;
    std::vector<double> values_;
};

} // namespace meshstep
