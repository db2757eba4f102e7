/*
  File: tests/test_sources.hpp

  In-memory fixtures for the unit tests.

    - quiet_log()      : Logger without a file, ERR and above only
    - ScriptedSource   : Source whose layout and update answers are set
                         by the test; records every step-level call
    - CountingWriter   : DebugWriter that counts finalize() calls
    - round_trip_source / two_basis_source : ready-made layouts
*/
#pragma once

#include "meshstep/debug_writer.hpp"
#include "meshstep/errors.hpp"
#include "meshstep/logger.hpp"
#include "meshstep/source.hpp"

#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace meshstep {
namespace testing {

inline Logger& quiet_log()
{
    static Logger log("");
    log.set_level(Logger::Level::ERR);
    return log;
}

struct ScriptedBasis
{
    Basis              basis;
    std::vector<Field> geometries;
    std::vector<Field> fields;
};

/*
  Update answers default to true; list (step index, name) pairs in
  topo_answers / field_answers to script anything else. Every payload
  is a 2^pardim-node structured block whose values encode the step, so
  envelopes from different steps differ.
*/
class ScriptedSource : public Source
{
public:
    SourceProperties           props;
    std::vector<ScriptedBasis> layout;
    std::vector<Zone>          zone_list;
    std::vector<Step>          step_list;

    std::map<std::pair<int, std::string>, bool> topo_answers;
    std::map<std::pair<int, std::string>, bool> field_answers;
    std::set<std::pair<int, std::string>>       failing_fetches;

    mutable std::vector<std::string> calls;

    SourceProperties properties() const override { return props; }

    std::vector<Basis> bases() const override
    {
        std::vector<Basis> out;
        for (const auto& b : layout)
            out.push_back(b.basis);
        return out;
    }

    Basis basis_of(const Field& field) const override
    {
        for (const auto& b : layout) {
            for (const auto& g : b.geometries)
                if (g.name == field.name) return b.basis;
            for (const auto& f : b.fields)
                if (f.name == field.name) return b.basis;
        }
        throw ContractViolation("scripted source has no field '" + field.name + "'");
    }

    std::vector<Field> geometries(const Basis& basis) const override { return entry(basis).geometries; }
    std::vector<Field> fields(const Basis& basis) const override { return entry(basis).fields; }
    std::vector<Zone> zones() const override { return zone_list; }

    Sequence<Step> steps() override
    {
        calls.push_back("steps");
        return Sequence<Step>::from_vector(step_list);
    }

    bool topology_updates(const Step& step, const Basis& basis) override
    {
        calls.push_back("topology_updates " + std::to_string(step.index) + " " + basis.name);
        auto it = topo_answers.find({ step.index, basis.name });
        return it == topo_answers.end() || it->second;
    }

    bool field_updates(const Step& step, const Field& field) override
    {
        calls.push_back("field_updates " + std::to_string(step.index) + " " + field.name);
        auto it = field_answers.find({ step.index, field.name });
        return it == field_answers.end() || it->second;
    }

    Topology topology(const Step& step, const Basis& basis, const Zone& zone) override
    {
        calls.push_back("topology " + std::to_string(step.index) + " " + basis.name + " " + zone.key);
        return Topology::structured({ 2, 2, 2 }, basis.pardim);
    }

    FieldData field_data(const Step& step, const Field& field, const Zone& zone) override
    {
        calls.push_back("field_data " + std::to_string(step.index) + " " + field.name + " " +
                        zone.key);
        if (failing_fetches.count({ step.index, field.name }))
            throw std::runtime_error("scripted read error");

        const int pardim = basis_of(field).pardim;
        const std::size_t npoints = field.cellwise ? 1 : (std::size_t(1) << pardim);
        std::vector<double> values;
        for (std::size_t p = 0; p < npoints; ++p)
            for (int c = 0; c < field.num_comps(); ++c)
                values.push_back(100.0 * step.index + 10.0 * p + c);
        return FieldData(field.num_comps(), values);
    }

    void use_geometry(const Field& geometry) override
    {
        calls.push_back("use_geometry " + geometry.name);
    }

    Field field(const std::string& name) const
    {
        for (const auto& b : layout) {
            for (const auto& g : b.geometries)
                if (g.name == name) return g;
            for (const auto& f : b.fields)
                if (f.name == name) return f;
        }
        throw std::invalid_argument("no field " + name);
    }

    /* Calls whose text starts with `prefix`, in order. */
    std::vector<std::string> calls_starting(const std::string& prefix) const
    {
        std::vector<std::string> out;
        for (const auto& c : calls)
            if (c.compare(0, prefix.size(), prefix) == 0)
                out.push_back(c);
        return out;
    }

private:
    const ScriptedBasis& entry(const Basis& basis) const
    {
        for (const auto& b : layout)
            if (b.basis.name == basis.name)
                return b;
        throw ContractViolation("scripted source has no basis '" + basis.name + "'");
    }
};

class CountingWriter : public DebugWriter
{
public:
    explicit CountingWriter(Logger& log) : DebugWriter("", log) {}

    int finalize_calls = 0;

protected:
    void finalize() override
    {
        ++finalize_calls;
        DebugWriter::finalize();
    }
};

inline Field make_geometry(const std::string& name)
{
    Field f;
    f.name = name;
    f.type = FieldType::geometry(3);
    f.splittable = false;
    return f;
}

inline Field make_scalar(const std::string& name, bool cellwise = false)
{
    Field f;
    f.name = name;
    f.type = FieldType::scalar();
    f.cellwise = cellwise;
    return f;
}

inline Field make_vector(const std::string& name, int ncomps)
{
    Field f;
    f.name = name;
    f.type = FieldType::vector(ncomps);
    return f;
}

/* Unit cube corners, shifted by `dx` along x. */
inline Zone make_zone(const std::string& key, double dx = 0.0)
{
    Zone z;
    z.key = key;
    z.shape = Shape::Hexahedron;
    for (int k = 0; k < 2; ++k)
        for (int j = 0; j < 2; ++j)
            for (int i = 0; i < 2; ++i)
                z.coords.push_back(Point{ dx + i, double(j), double(k) });
    return z;
}

inline Step make_step(int index, double value)
{
    Step s;
    s.index = index;
    s.value = value;
    return s;
}

/*
  One basis "mesh" (geometry X, nodal scalar "pressure"), one zone "z0",
  steps (0, 0.0) and (1, 1.0). The topology and X are unchanged at
  step 1; pressure changes at both steps.
*/
inline std::unique_ptr<ScriptedSource> round_trip_source()
{
    auto src = std::make_unique<ScriptedSource>();
    src->props.instantaneous = false;
    src->props.globally_keyed = true;
    src->props.step_interpretation = StepInterpretation::Time;

    ScriptedBasis mesh;
    mesh.basis.name = "mesh";
    mesh.basis.pardim = 3;
    mesh.geometries = { make_geometry("X") };
    mesh.fields = { make_scalar("pressure") };
    src->layout = { mesh };

    src->zone_list = { make_zone("z0") };
    src->step_list = { make_step(0, 0.0), make_step(1, 1.0) };
    src->topo_answers[{ 1, "mesh" }] = false;
    src->field_answers[{ 1, "X" }] = false;
    return src;
}

/*
  Two bases: "aux" (geometry Y, field "temp") listed before "mesh"
  (geometry X, fields "pressure" and 3-component "velocity"); zones
  "z0" and "z1"; three steps.
*/
inline std::unique_ptr<ScriptedSource> two_basis_source()
{
    auto src = std::make_unique<ScriptedSource>();

    ScriptedBasis aux;
    aux.basis.name = "aux";
    aux.basis.pardim = 3;
    aux.geometries = { make_geometry("Y") };
    aux.fields = { make_scalar("temp") };

    ScriptedBasis mesh;
    mesh.basis.name = "mesh";
    mesh.basis.pardim = 3;
    mesh.geometries = { make_geometry("X") };
    mesh.fields = { make_scalar("pressure"), make_vector("velocity", 3) };

    src->layout = { aux, mesh };
    src->zone_list = { make_zone("z0"), make_zone("z1") };
    src->step_list = { make_step(0, 0.0), make_step(1, 0.5), make_step(2, 1.0) };
    return src;
}

} // namespace testing
} // namespace meshstep
