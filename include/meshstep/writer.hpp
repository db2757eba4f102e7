/*
  File: include/meshstep/writer.hpp

  The Writer contract and the conversion driver.

  This header defines:
    - BasisUpdate / FieldUpdate : one change-detection answer, plus the
                                  fetched payload when the answer was "changed"
    - StepRecord                : everything emitted for one step
    - StreamHeader              : static description written once per pass
    - WriterBase<B, F, S, Z>    : abstract sink that also drives the pass
    - OutputGuard               : scoped ownership of the output resource
    - Writer                    : WriterBase over the descriptors in common.hpp

  Concrete writers:
    - debug_writer.cpp : canonical envelope (YAML)
    - cgns_writer.cpp  : time-accurate CGNS file

  Pass structure (WriterBase::consume):

    configure() must have been called          -> ContractViolation otherwise
    open_output()                              (OutputGuard constructor)
    write_header(properties, bases, zones)
    for step in source.steps():
        geometry basis updates, geometry field updates
        other fields of the geometry basis
        for every other basis: basis updates, then its fields
        write_step(record)
    finalize_output()                          (exactly once, also on error)

  Update records:
    - update query false : one marker {basis|field, updates=false}, no fetch
    - update query true  : one record per zone with the fetched payload
  The first time a basis or field is seen after open_output() it is
  always fetched, whatever the Source answers.
*/
#pragma once

#include "meshstep/common.hpp"
#include "meshstep/errors.hpp"
#include "meshstep/logger.hpp"
#include "meshstep/payload.hpp"
#include "meshstep/sequence.hpp"
#include "meshstep/settings.hpp"
#include "meshstep/source.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace meshstep {

/*-------------------------------------------------------------
  Records
-------------------------------------------------------------*/
template <typename B, typename Z>
struct BasisUpdate
{
    std::optional<Z>        zone;      ///< unset for the "no update" marker
    B                       basis;
    bool                    updates = false;
    std::optional<Topology> topology;
};

template <typename F, typename Z>
struct FieldUpdate
{
    std::optional<Z>         zone;
    F                        field;
    bool                     updates = false;
    std::optional<FieldData> data;
};

template <typename B, typename F, typename S, typename Z>
struct StepRecord
{
    S                               step;
    std::vector<BasisUpdate<B, Z>>  topologies;
    std::vector<FieldUpdate<F, Z>>  data;
};

template <typename B, typename F>
struct BasisEntry
{
    B              basis;
    std::vector<F> geometries;
    std::vector<F> fields;
};

template <typename B, typename F, typename Z>
struct StreamHeader
{
    SourceProperties              properties;
    std::vector<BasisEntry<B, F>> bases;
    std::vector<Z>                zones;
    F                             geometry;
    std::optional<B>              geometry_basis;   ///< unset when there are no bases
};

/*-------------------------------------------------------------
  WriterBase
-------------------------------------------------------------*/
template <typename B, typename F, typename S, typename Z>
class WriterBase
{
public:
    using SourceType       = SourceBase<B, F, S, Z>;
    using BasisUpdateType  = BasisUpdate<B, Z>;
    using FieldUpdateType  = FieldUpdate<F, Z>;
    using StepRecordType   = StepRecord<B, F, S, Z>;
    using HeaderType       = StreamHeader<B, F, Z>;

    explicit WriterBase(Logger& log) : log_(log) {}
    virtual ~WriterBase() = default;

    WriterBase(const WriterBase&) = delete;
    WriterBase& operator=(const WriterBase&) = delete;

    virtual WriterProperties properties() const = 0;

    /*
      configure(settings):
        - Hands the settings to apply_settings(), which throws
          std::invalid_argument for values this writer cannot honor.
        - Must precede consume().
    */
    void configure(const WriterSettings& settings)
    {
        apply_settings(settings);
        configured_ = true;
    }

    bool configured() const { return configured_; }
    bool is_open() const { return open_; }

    /*
      open_output / finalize_output:
        Scoped acquisition of the output resource. consume() wraps them
        in an OutputGuard; custom drivers built on consume_basis /
        consume_field call them directly.
    */
    void open_output()
    {
        if (open_)
            throw ContractViolation("output is already open");
        seen_bases_.clear();
        seen_fields_.clear();
        open();
        open_ = true;
    }

    void finalize_output()
    {
        if (!open_)
            throw ContractViolation("output is not open");
        open_ = false;
        finalize();
    }

    /*=================================================================
      consume_basis

      Lazy sequence of basis-update records for one (step, basis).
      Nothing is asked of the Source until the sequence is iterated.
    =================================================================*/
    Sequence<BasisUpdateType> consume_basis(const S& step, const B& basis, SourceType& source)
    {
        struct Cursor
        {
            bool           asked = false;
            bool           updates = false;
            std::vector<Z> zones;
            std::size_t    next = 0;
        };
        auto cur = std::make_shared<Cursor>();

        return Sequence<BasisUpdateType>(
            [this, cur, step, basis, &source](BasisUpdateType& out) {
                if (!cur->asked) {
                    cur->asked = true;
                    cur->updates = source.topology_updates(step, basis);
                    if (seen_bases_.insert(basis.name).second && !cur->updates) {
                        log_.debug("Basis '" + basis.name +
                                   "' reported unchanged on first encounter, fetching anyway");
                        cur->updates = true;
                    }
                    if (!cur->updates) {
                        out = BasisUpdateType{};
                        out.basis = basis;
                        out.updates = false;
                        return true;
                    }
                    cur->zones = source.zones();
                }
                if (!cur->updates || cur->next >= cur->zones.size())
                    return false;

                const Z& zone = cur->zones[cur->next++];
                out = BasisUpdateType{};
                out.zone = zone;
                out.basis = basis;
                out.updates = true;
                out.topology = fetch_topology(source, step, basis, zone);
                return true;
            });
    }

    /*=================================================================
      consume_field

      Same protocol as consume_basis, scoped to one field.
    =================================================================*/
    Sequence<FieldUpdateType> consume_field(const S& step, const F& field, SourceType& source)
    {
        struct Cursor
        {
            bool           asked = false;
            bool           updates = false;
            std::vector<Z> zones;
            std::size_t    next = 0;
        };
        auto cur = std::make_shared<Cursor>();

        return Sequence<FieldUpdateType>(
            [this, cur, step, field, &source](FieldUpdateType& out) {
                if (!cur->asked) {
                    cur->asked = true;
                    cur->updates = source.field_updates(step, field);
                    if (seen_fields_.insert(field.name).second && !cur->updates) {
                        log_.debug("Field '" + field.name +
                                   "' reported unchanged on first encounter, fetching anyway");
                        cur->updates = true;
                    }
                    if (!cur->updates) {
                        out = FieldUpdateType{};
                        out.field = field;
                        out.updates = false;
                        return true;
                    }
                    cur->zones = source.zones();
                }
                if (!cur->updates || cur->next >= cur->zones.size())
                    return false;

                const Z& zone = cur->zones[cur->next++];
                out = FieldUpdateType{};
                out.zone = zone;
                out.field = field;
                out.updates = true;
                out.data = fetch_field(source, step, field, zone);
                return true;
            });
    }

    /*=================================================================
      consume

      One full pass over the Source. See the file header for ordering.
    =================================================================*/
    void consume(SourceType& source, const F& geometry);

protected:
    /* Validate and store settings; throw std::invalid_argument on values
       this writer cannot honor. */
    virtual void apply_settings(const WriterSettings& settings) = 0;

    virtual void open() = 0;
    virtual void write_header(const HeaderType& header) = 0;
    virtual void write_step(const StepRecordType& record) = 0;

    /* Serialize whatever was consumed and release the output. Called
       exactly once per open(), also when the pass failed. */
    virtual void finalize() = 0;

    Logger& log_;

private:
    template <typename W> friend class OutputGuard;

    HeaderType make_header(SourceType& source, const F& geometry) const;
    void check_properties(const HeaderType& header) const;

    Topology fetch_topology(SourceType& source, const S& step, const B& basis, const Z& zone)
    {
        try {
            return source.topology(step, basis, zone);
        }
        catch (const ContractViolation&) {
            throw;
        }
        catch (const FetchFailure&) {
            throw;
        }
        catch (const std::exception& ex) {
            throw FetchFailure("topology of basis '" + basis.name + "' on zone '" +
                               zone.key + "' at step " + std::to_string(step.index) +
                               ": " + ex.what());
        }
    }

    FieldData fetch_field(SourceType& source, const S& step, const F& field, const Z& zone)
    {
        try {
            return source.field_data(step, field, zone);
        }
        catch (const ContractViolation&) {
            throw;
        }
        catch (const FetchFailure&) {
            throw;
        }
        catch (const std::exception& ex) {
            throw FetchFailure("field '" + field.name + "' on zone '" + zone.key +
                               "' at step " + std::to_string(step.index) + ": " + ex.what());
        }
    }

    bool                  configured_ = false;
    bool                  open_       = false;
    std::set<std::string> seen_bases_;
    std::set<std::string> seen_fields_;
};

/*-------------------------------------------------------------
  OutputGuard

  Opens the writer's output on construction. finalize() runs the
  writer's finalization on the normal path; if the guard is destroyed
  without it (an exception is unwinding), the destructor finalizes
  instead. A failure inside that second path is logged, so the
  original error is the one that reaches the caller.
-------------------------------------------------------------*/
template <typename W>
class OutputGuard
{
public:
    explicit OutputGuard(W& writer) : writer_(writer) { writer_.open_output(); }

    ~OutputGuard()
    {
        if (done_)
            return;
        try {
            writer_.finalize_output();
        }
        catch (const std::exception& ex) {
            writer_.log_.error(std::string("Finalizing output after a failed pass also failed: ") +
                               ex.what());
        }
    }

    void finalize()
    {
        done_ = true;
        writer_.finalize_output();
    }

    OutputGuard(const OutputGuard&) = delete;
    OutputGuard& operator=(const OutputGuard&) = delete;

private:
    W&   writer_;
    bool done_ = false;
};

/*=====================================================================
  WriterBase::make_header

  Enumerate bases (with geometries and fields) and zones once, and
  check that the chosen geometry is one the Source declares.
=====================================================================*/
template <typename B, typename F, typename S, typename Z>
typename WriterBase<B, F, S, Z>::HeaderType
WriterBase<B, F, S, Z>::make_header(SourceType& source, const F& geometry) const
{
    HeaderType header;
    header.properties = source.properties();
    header.geometry = geometry;

    for (const B& basis : source.bases()) {
        BasisEntry<B, F> entry;
        entry.basis = basis;
        entry.geometries = source.geometries(basis);
        entry.fields = source.fields(basis);
        header.bases.push_back(std::move(entry));
    }

    /* A source without bases has nothing the geometry could belong to;
       the pass then only carries steps. */
    if (!header.bases.empty()) {
        const B geom_basis = source.basis_of(geometry);
        const BasisEntry<B, F>* owner = nullptr;
        for (const auto& entry : header.bases)
            if (entry.basis.name == geom_basis.name)
                owner = &entry;

        if (!owner)
            throw ContractViolation("basis '" + geom_basis.name + "' of geometry '" +
                                    geometry.name + "' is not among the source's bases");

        bool declared = false;
        for (const F& g : owner->geometries)
            declared = declared || g.name == geometry.name;
        if (!declared)
            throw ContractViolation("'" + geometry.name + "' is not a geometry of basis '" +
                                    geom_basis.name + "'");
        header.geometry_basis = geom_basis;
    }

    std::set<std::string> keys;
    for (const Z& zone : source.zones()) {
        if (!keys.insert(zone.key).second)
            throw ContractViolation("zone key '" + zone.key + "' is not unique");
        header.zones.push_back(zone);
    }
    return header;
}

template <typename B, typename F, typename S, typename Z>
void WriterBase<B, F, S, Z>::check_properties(const HeaderType& header) const
{
    const WriterProperties wp = properties();
    const SourceProperties& sp = header.properties;

    if (wp.require_single_basis && header.bases.size() > 1)
        throw ContractViolation("writer accepts a single basis, source has " +
                                std::to_string(header.bases.size()));
    if (wp.require_single_zone && header.zones.size() > 1)
        throw ContractViolation("writer accepts a single zone, source has " +
                                std::to_string(header.zones.size()));
    if (wp.require_discrete_topology && !sp.discrete_topology)
        throw ContractViolation("writer requires discrete topology");
    if (wp.require_instantaneous && !sp.instantaneous)
        throw ContractViolation("writer requires an instantaneous source");
}

/*=====================================================================
  WriterBase::consume
=====================================================================*/
template <typename B, typename F, typename S, typename Z>
void WriterBase<B, F, S, Z>::consume(SourceType& source, const F& geometry)
{
    if (!configured_)
        throw ContractViolation("writer driven without a prior configure()");

    OutputGuard<WriterBase> guard(*this);

    const HeaderType header = make_header(source, geometry);
    check_properties(header);

    const SourceProperties& sp = header.properties;
    log_.info("Source   : instantaneous=" + std::string(sp.instantaneous ? "yes" : "no") +
              " globally_keyed=" + std::string(sp.globally_keyed ? "yes" : "no") +
              " steps=" + step_interpretation_to_string(sp.step_interpretation));
    log_.info("Header   : " + std::to_string(header.bases.size()) + " basis/bases, " +
              std::to_string(header.zones.size()) + " zone(s), geometry '" +
              geometry.name + "'");

    write_header(header);
    if (header.geometry_basis)
        source.use_geometry(geometry);

    bool have_last = false;
    int  last_index = 0;
    int  nsteps = 0;

    for (const S& step : source.steps()) {
        if (have_last && step.index <= last_index)
            throw ContractViolation("step index " + std::to_string(step.index) +
                                    " follows " + std::to_string(last_index));
        have_last = true;
        last_index = step.index;

        StepRecordType record;
        record.step = step;

        if (header.geometry_basis) {
            const B& geom_basis = *header.geometry_basis;

            /* Geometry basis and geometry field first */
            for (const auto& u : consume_basis(step, geom_basis, source))
                record.topologies.push_back(u);
            for (const auto& u : consume_field(step, geometry, source))
                record.data.push_back(u);

            for (const auto& entry : header.bases) {
                if (entry.basis.name != geom_basis.name)
                    continue;
                for (const F& field : entry.fields) {
                    if (field.name == geometry.name)
                        continue;
                    for (const auto& u : consume_field(step, field, source))
                        record.data.push_back(u);
                }
            }

            /* Remaining bases in source order */
            for (const auto& entry : header.bases) {
                if (entry.basis.name == geom_basis.name)
                    continue;
                for (const auto& u : consume_basis(step, entry.basis, source))
                    record.topologies.push_back(u);
                for (const F& field : entry.fields)
                    for (const auto& u : consume_field(step, field, source))
                        record.data.push_back(u);
            }
        }

        log_.info("Step " + std::to_string(step.index) +
                  (step.value ? " (value " + std::to_string(*step.value) + ")" : std::string()) +
                  ": " + std::to_string(record.topologies.size()) + " topology record(s), " +
                  std::to_string(record.data.size()) + " field record(s)");

        write_step(record);
        ++nsteps;
    }

    guard.finalize();
    log_.info("Consumed " + std::to_string(nsteps) + " step(s)");
}

using Writer = WriterBase<Basis, Field, Step, Zone>;

} // namespace meshstep
