/*
  File: include/meshstep/source.hpp

  The Source contract: what a data provider must offer so that any
  Writer can consume it step by step.

  This header defines:
    - meshstep::SourceBase<B, F, S, Z> : abstract provider over descriptor
                                         types Basis / Field / Step / Zone
    - meshstep::Source                 : the instantiation over the
                                         descriptors in common.hpp, which
                                         every concrete reader and filter
                                         in this project implements

  Implementations:
    - plot3d_source.cpp : Plot3DSource (grid + function files)
    - filters.hpp       : Passthrough and the filters derived from it
    - tests/            : scripted in-memory sources

  Required descriptor members (checked at compile time by the driver):
    B::name, F::name, Z::key, S::index, S::value

  Protocol, per step:
    1) topology_updates(step, basis) / field_updates(step, field)
         true iff the data differs from what was reported for the
         preceding step; must be true the first time a basis or field
         is consumed
    2) topology(step, basis, zone) / field_data(step, field, zone)
         only called after (1) answered true for that (step, basis/field),
         once per zone in zones() order

  Change tracking used to answer (1) is private mutable state of the
  Source instance; a fresh pass needs a fresh Source.
*/
#pragma once

#include "meshstep/common.hpp"
#include "meshstep/payload.hpp"
#include "meshstep/sequence.hpp"

#include <vector>

namespace meshstep {

template <typename B, typename F, typename S, typename Z>
class SourceBase
{
public:
    using basis_type = B;
    using field_type = F;
    using step_type  = S;
    using zone_type  = Z;

    virtual ~SourceBase() = default;

    /* Queried once per pass. */
    virtual SourceProperties properties() const = 0;

    /* Stable for the life of the Source. */
    virtual std::vector<B> bases() const = 0;
    virtual B basis_of(const F& field) const = 0;
    virtual std::vector<F> geometries(const B& basis) const = 0;
    virtual std::vector<F> fields(const B& basis) const = 0;
    virtual std::vector<Z> zones() const = 0;

    /* Lazy, finite, forward-only, single-pass. */
    virtual Sequence<S> steps() = 0;

    virtual bool topology_updates(const S& step, const B& basis) = 0;
    virtual bool field_updates(const S& step, const F& field) = 0;

    virtual Topology  topology(const S& step, const B& basis, const Z& zone) = 0;
    virtual FieldData field_data(const S& step, const F& field, const Z& zone) = 0;

    /* Tells the Source which geometry the consumer will use. */
    virtual void use_geometry(const F& /*geometry*/) {}
};

using Source = SourceBase<Basis, Field, Step, Zone>;

} // namespace meshstep
