/*─────────────────────────────────────────────────────────────
  File: src/envelope.cpp
  Descriptor and record conversion to the canonical envelope
─────────────────────────────────────────────────────────────*/
#include "meshstep/envelope.hpp"

namespace meshstep {
namespace envelope {

YAML::Node properties_node(const SourceProperties& p)
{
    YAML::Node n;
    n["instantaneous"] = p.instantaneous;
    n["globally-keyed"] = p.globally_keyed;
    n["discrete-topology"] = p.discrete_topology;
    n["single-basis"] = p.single_basis;
    n["single-zoned"] = p.single_zoned;
    n["step-interpretation"] = step_interpretation_to_string(p.step_interpretation);
    return n;
}

YAML::Node field_node(const Field& f)
{
    YAML::Node n;
    n["name"] = f.name;
    n["kind"] = field_kind_to_string(f.type.kind);
    n["num_comps"] = f.num_comps();
    n["cellwise"] = f.cellwise;
    n["splittable"] = f.splittable;
    if (f.is_geometry())
        n["coords"] = f.coords().to_string();
    else
        n["interpretation"] = interpretation_to_string(f.type.interpretation);
    n["eigenmode"] = f.is_eigenmode();
    n["displacement"] = f.is_displacement();
    return n;
}

YAML::Node basis_node(const BasisEntry<Basis, Field>& entry)
{
    YAML::Node fields(YAML::NodeType::Sequence);
    for (const Field& g : entry.geometries)
        fields.push_back(field_node(g));
    for (const Field& f : entry.fields)
        fields.push_back(field_node(f));

    YAML::Node n;
    n["name"] = entry.basis.name;
    n["pardim"] = entry.basis.pardim;
    n["fields"] = fields;
    return n;
}

YAML::Node zone_node(const Zone& z)
{
    YAML::Node coords(YAML::NodeType::Sequence);
    for (const Point& p : z.coords) {
        YAML::Node pt(YAML::NodeType::Sequence);
        for (double x : p)
            pt.push_back(x);
        pt.SetStyle(YAML::EmitterStyle::Flow);
        coords.push_back(pt);
    }

    YAML::Node n;
    n["shape"] = shape_to_string(z.shape);
    n["coords"] = coords;
    n["key"] = z.key;
    return n;
}

YAML::Node basis_record_node(const BasisRecord& r)
{
    YAML::Node n;
    if (!r.updates) {
        n["basis"] = r.basis.name;
        n["update"] = false;
        return n;
    }
    n["zone"] = r.zone ? r.zone->key : std::string();
    n["basis"] = r.basis.name;
    n["updates"] = true;
    if (r.topology)
        n["topology"] = r.topology->as_node();
    return n;
}

YAML::Node field_record_node(const FieldRecord& r)
{
    YAML::Node n;
    if (!r.updates) {
        n["field"] = r.field.name;
        n["update"] = false;
        return n;
    }
    n["zone"] = r.zone ? r.zone->key : std::string();
    n["field"] = r.field.name;
    n["updates"] = true;
    if (r.data)
        n["data"] = r.data->as_node();
    return n;
}

YAML::Node step_node(const StepRecordT& r)
{
    YAML::Node topologies(YAML::NodeType::Sequence);
    for (const auto& t : r.topologies)
        topologies.push_back(basis_record_node(t));

    YAML::Node data(YAML::NodeType::Sequence);
    for (const auto& d : r.data)
        data.push_back(field_record_node(d));

    YAML::Node n;
    n["index"] = r.step.index;
    if (r.step.value)
        n["value"] = *r.step.value;
    else
        n["value"] = YAML::Null;
    n["topologies"] = topologies;
    n["data"] = data;
    return n;
}

YAML::Node header_node(const Header& h)
{
    YAML::Node bases(YAML::NodeType::Sequence);
    for (const auto& entry : h.bases)
        bases.push_back(basis_node(entry));

    YAML::Node zones(YAML::NodeType::Sequence);
    for (const Zone& z : h.zones)
        zones.push_back(zone_node(z));

    YAML::Node root;
    root["source-properties"] = properties_node(h.properties);
    root["bases"] = bases;
    root["zones"] = zones;
    root["steps"] = YAML::Node(YAML::NodeType::Sequence);
    return root;
}

std::string emit(const YAML::Node& root)
{
    YAML::Emitter out;
    out << root;
    if (!out.good())
        throw SerializationFailure(std::string("YAML emitter: ") + out.GetLastError());
    return std::string(out.c_str()) + "\n";
}

} // namespace envelope
} // namespace meshstep
