/*
  File: include/meshstep/filters.hpp

  Source filters: Sources that wrap another Source and change what it
  exposes.

  This header defines:
    - Passthrough  : forwards every call to the wrapped Source
    - GroupedSteps : base of the step filters; one outer step stands for
                     a group of inner steps
    - StepSlice    : every stride-th inner step of [start, stop)
    - LastTime     : only the last inner step
    - FieldFilter  : keeps the listed fields (geometries always kept)
    - BasisFilter  : keeps the listed bases
    - Decompose    : adds one scalar field per vector component
    - ForceUnstructured : structured topologies become explicit cells
    - KeyZones     : global zone keys from matching corner points
    - Strict       : verifies the Source contract while passing through

  Ownership:
    Every filter owns the Source it wraps (std::unique_ptr), so a chain
    built in convert_main.cpp is released from the outermost filter in.

  Implementations:
    - filter_steps.cpp     : GroupedSteps, StepSlice, LastTime
    - filter_select.cpp    : FieldFilter, BasisFilter
    - filter_decompose.cpp : Decompose
    - filter_unstructured.cpp : ForceUnstructured
    - filter_keyzones.cpp  : KeyZones
    - filter_strict.cpp    : Strict
*/
#pragma once

#include "meshstep/logger.hpp"
#include "meshstep/source.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meshstep {

/*======================================================================
  Passthrough
======================================================================*/
class Passthrough : public Source
{
public:
    Passthrough(std::unique_ptr<Source> source, Logger& log)
        : src_(std::move(source)), log_(log)
    {
        if (!src_)
            throw std::invalid_argument("filter constructed without a source");
    }

    SourceProperties properties() const override { return src_->properties(); }

    std::vector<Basis> bases() const override { return src_->bases(); }
    Basis basis_of(const Field& field) const override { return src_->basis_of(field); }
    std::vector<Field> geometries(const Basis& basis) const override { return src_->geometries(basis); }
    std::vector<Field> fields(const Basis& basis) const override { return src_->fields(basis); }
    std::vector<Zone> zones() const override { return src_->zones(); }

    Sequence<Step> steps() override { return src_->steps(); }

    bool topology_updates(const Step& step, const Basis& basis) override
    {
        return src_->topology_updates(step, basis);
    }
    bool field_updates(const Step& step, const Field& field) override
    {
        return src_->field_updates(step, field);
    }

    Topology topology(const Step& step, const Basis& basis, const Zone& zone) override
    {
        return src_->topology(step, basis, zone);
    }
    FieldData field_data(const Step& step, const Field& field, const Zone& zone) override
    {
        return src_->field_data(step, field, zone);
    }

    void use_geometry(const Field& geometry) override { src_->use_geometry(geometry); }

    Source& inner() { return *src_; }

protected:
    std::unique_ptr<Source> src_;
    Logger&                 log_;
};

/*======================================================================
  GroupedSteps
======================================================================*/
/*
  An outer step stands for the inner steps pulled since the previous
  outer step, the last of which it represents:
    - value            : value of the last inner step
    - *_updates        : OR over every inner step of the group; each
                         inner query is made, none short-circuited
    - topology / data  : fetched at the last inner step
*/
class GroupedSteps : public Passthrough
{
public:
    using Passthrough::Passthrough;

    bool topology_updates(const Step& step, const Basis& basis) override;
    bool field_updates(const Step& step, const Field& field) override;

    Topology topology(const Step& step, const Basis& basis, const Zone& zone) override;
    FieldData field_data(const Step& step, const Field& field, const Zone& zone) override;

protected:
    /* Records the group of the outer step about to be yielded. */
    Step emit_group(int index, std::vector<Step> group);

private:
    const std::vector<Step>& group(const Step& step) const;

    int               group_index_ = -1;
    std::vector<Step> group_;
};

class StepSlice : public GroupedSteps
{
public:
    /*
      Python-slice semantics over inner ordinals:
        start  : first kept ordinal (default 0)
        stop   : one past the last candidate ordinal (default: no end)
        stride : distance between kept ordinals (default 1, >= 1)
      Throws std::invalid_argument on negative values or stride < 1.
    */
    StepSlice(std::unique_ptr<Source> source, Logger& log,
              std::optional<int> start, std::optional<int> stop, std::optional<int> stride);

    Sequence<Step> steps() override;

private:
    int                start_  = 0;
    std::optional<int> stop_;
    int                stride_ = 1;
};

class LastTime : public GroupedSteps
{
public:
    LastTime(std::unique_ptr<Source> source, Logger& log);

    SourceProperties properties() const override;
    Sequence<Step> steps() override;
};

/*======================================================================
  FieldFilter / BasisFilter
======================================================================*/
/*
  Names are matched after casefold(); an empty set removes every
  non-geometry field. Listed names that match nothing are reported at
  WARN when the filter is attached.
*/
class FieldFilter : public Passthrough
{
public:
    FieldFilter(std::unique_ptr<Source> source, Logger& log, std::set<std::string> allowed);

    std::vector<Field> fields(const Basis& basis) const override;

private:
    std::set<std::string> allowed_;
};

class BasisFilter : public Passthrough
{
public:
    BasisFilter(std::unique_ptr<Source> source, Logger& log, std::set<std::string> allowed);

    SourceProperties properties() const override;
    std::vector<Basis> bases() const override;

private:
    bool keeps(const Basis& basis) const;

    std::set<std::string> allowed_;
};

/*======================================================================
  Decompose
======================================================================*/
/*
  After each splittable vector field NAME, adds scalar fields NAME_x,
  NAME_y, NAME_z (one per component, at most three). A component field
  has the data of its parent sliced to one component and changes
  whenever the parent does.

  The parent's answer to field_updates is asked once per step and
  reused for its components, since a Source may track changes
  statefully.
*/
class Decompose : public Passthrough
{
public:
    using Passthrough::Passthrough;

    std::vector<Field> fields(const Basis& basis) const override;
    Basis basis_of(const Field& field) const override;

    bool field_updates(const Step& step, const Field& field) override;
    FieldData field_data(const Step& step, const Field& field, const Zone& zone) override;

private:
    struct Component
    {
        std::string parent;
        int         comp = 0;
    };

    /* Parent field and component if `name` is one of the added fields. */
    std::optional<Component> component_of(const std::string& name) const;
    Field parent_field(const Component& c) const;

    mutable std::map<std::string, Component> components_;
    std::map<std::string, std::pair<int, bool>> answers_;   ///< parent -> (step index, answer)
};

/*======================================================================
  ForceUnstructured
======================================================================*/
/*
  Returns every structured topology as an unstructured one with the
  same nodes: cells enumerated first axis fastest, corners in tensor
  order. Needs a source with discrete topology (ContractViolation
  otherwise).
*/
class ForceUnstructured : public Passthrough
{
public:
    ForceUnstructured(std::unique_ptr<Source> source, Logger& log);

    Topology topology(const Step& step, const Basis& basis, const Zone& zone) override;
};

/* Explicit cells of a structured topology; unstructured input is returned as is. */
Topology to_unstructured(const Topology& topo);

/*======================================================================
  KeyZones
======================================================================*/
/*
  Replaces the zone keys of a source that is not globally keyed with
  keys "zone-N" that stay stable across passes: a zone whose corner
  points all match (within `tol`) the corners of a zone seen before
  gets that zone's key, any other zone gets the next free N.

  Corner points are looked up in a uniform hash grid of cell size
  `tol`; a match is searched in the 27 neighbouring cells.

  Throws ContractViolation when a matched zone changes shape or when
  two zones of one enumeration map to the same key.
*/
class KeyZones : public Passthrough
{
public:
    KeyZones(std::unique_ptr<Source> source, Logger& log, double tol = 1e-8);

    SourceProperties properties() const override;
    std::vector<Zone> zones() const override;

    Topology topology(const Step& step, const Basis& basis, const Zone& zone) override;
    FieldData field_data(const Step& step, const Field& field, const Zone& zone) override;

private:
    struct CellKey
    {
        std::int64_t ix = 0;
        std::int64_t iy = 0;
        std::int64_t iz = 0;

        bool operator==(const CellKey& o) const
        {
            return ix == o.ix && iy == o.iy && iz == o.iz;
        }
    };

    struct CellKeyHash
    {
        std::size_t operator()(const CellKey& key) const;
    };

    CellKey cell_key(const Point& p) const;
    int  find_vertex(const Point& p) const;     ///< -1 if no vertex within tol
    int  add_vertex(const Point& p) const;
    int  global_key(const Zone& zone) const;
    const Zone& inner_zone(const Zone& zone) const;

    double tol_;

    mutable std::vector<Point>              vertices_;
    mutable std::vector<std::set<int>>      vertex_keys_;   ///< vertex -> global keys
    mutable std::unordered_map<CellKey, std::vector<int>, CellKeyHash> grid_;
    mutable std::vector<Shape>              shapes_;        ///< global key -> shape
    mutable std::map<std::string, Zone>     inner_;         ///< outer key -> inner zone
};

/*======================================================================
  Strict
======================================================================*/
/*
  Checks, and throws ContractViolation on the first breach:
    - declared descriptors: every basis, field and zone named in a call
      was enumerated by the wrapped Source; zone keys are unique; a field
      belongs to exactly one basis; basis_of agrees with the enumeration
    - steps: strictly increasing indices; queries name the current step
    - fetches: topology / field_data only after the update query for that
      (step, basis/field) answered true, or on its first encounter
*/
class Strict : public Passthrough
{
public:
    Strict(std::unique_ptr<Source> source, Logger& log);

    Basis basis_of(const Field& field) const override;
    std::vector<Field> geometries(const Basis& basis) const override;
    std::vector<Field> fields(const Basis& basis) const override;
    std::vector<Zone> zones() const override;

    Sequence<Step> steps() override;

    bool topology_updates(const Step& step, const Basis& basis) override;
    bool field_updates(const Step& step, const Field& field) override;

    Topology topology(const Step& step, const Basis& basis, const Zone& zone) override;
    FieldData field_data(const Step& step, const Field& field, const Zone& zone) override;

    void use_geometry(const Field& geometry) override;

private:
    void check_basis(const Basis& basis) const;
    void check_field(const Field& field) const;
    void check_zone(const Zone& zone) const;
    void check_step(const Step& step) const;

    std::set<std::string>              bases_;
    std::map<std::string, std::string> field_basis_;   ///< field -> owning basis
    std::set<std::string>              geometries_;
    std::set<std::string>              zones_;

    bool                 stepping_ = false;
    int                  current_  = 0;
    std::map<std::string, bool> topo_answer_;    ///< basis -> answer at current step
    std::map<std::string, bool> field_answer_;   ///< field -> answer at current step
    std::map<std::string, int>  topo_first_;     ///< basis -> step of its first fetch
    std::map<std::string, int>  field_first_;    ///< field -> step of its first fetch
};

} // namespace meshstep
