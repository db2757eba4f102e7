#include "catch2/catch.hpp"

#include "meshstep/common.hpp"
#include "meshstep/envelope.hpp"
#include "meshstep/errors.hpp"
#include "meshstep/payload.hpp"
#include "meshstep/sequence.hpp"

#include <stdexcept>
#include <vector>

using namespace meshstep;

TEST_CASE("structured topology", "[payload]")
{
    const Topology t = Topology::structured({ 3, 4, 5 }, 3);
    CHECK(t.is_structured());
    CHECK(t.shape() == Shape::Hexahedron);
    CHECK(t.num_nodes() == 60);
    CHECK(t.num_cells() == 2 * 3 * 4);

    const Topology q = Topology::structured({ 3, 4, 1 }, 2);
    CHECK(q.shape() == Shape::Quadrilateral);
    CHECK(q.num_nodes() == 12);
    CHECK(q.num_cells() == 6);
    CHECK(q.vtxSize()[2] == 1);

    const YAML::Node n = q.as_node();
    CHECK(n["shape"].as<std::string>() == "Quadrilateral");
    REQUIRE(n["shape-dims"].size() == 2);
    CHECK(n["shape-dims"][1].as<long long>() == 4);

    CHECK_THROWS_AS(Topology::structured({ 1, 4, 4 }, 3), std::invalid_argument);
    CHECK_THROWS_AS(Topology::structured({ 2, 2, 2 }, 4), std::invalid_argument);
}

TEST_CASE("unstructured topology", "[payload]")
{
    const Topology t = Topology::unstructured(Shape::Quadrilateral, 6,
                                              { 0, 1, 3, 4, 1, 2, 4, 5 });
    CHECK_FALSE(t.is_structured());
    CHECK(t.num_cells() == 2);
    CHECK(t.as_node()["cells"].size() == 2);

    CHECK_THROWS_AS(Topology::unstructured(Shape::Quadrilateral, 6, { 0, 1, 2 }),
                    std::invalid_argument);
    CHECK_THROWS_AS(Topology::unstructured(Shape::Line, 2, { 0, 2 }), std::invalid_argument);
}

TEST_CASE("field data layout", "[payload]")
{
    const FieldData d(3, { 1, 2, 3, 4, 5, 6 });
    CHECK(d.num_points() == 2);
    CHECK(d.value(1, 0) == 4);
    CHECK(d.component(2) == std::vector<double>{ 3, 6 });

    const FieldData yz = d.slice({ 1, 2 });
    CHECK(yz.num_comps() == 2);
    CHECK(yz.values() == std::vector<double>{ 2, 3, 5, 6 });

    const FieldData xyz = FieldData::from_components({ { 1, 4 }, { 2, 5 }, { 3, 6 } });
    CHECK(xyz.values() == d.values());

    const FieldData joined = FieldData::concat({ d.slice({ 0 }), yz });
    CHECK(joined.values() == d.values());

    CHECK_THROWS_AS(FieldData(2, { 1, 2, 3 }), std::invalid_argument);
    CHECK_THROWS_AS(d.component(3), std::out_of_range);
    CHECK_THROWS_AS(FieldData::from_components({ { 1 }, { 2, 3 } }), std::invalid_argument);

    const YAML::Node n = d.as_node();
    CHECK(n["num_comps"].as<int>() == 3);
    CHECK(n["values"].size() == 6);
}

TEST_CASE("sequences are single-pass", "[sequence]")
{
    auto seq = Sequence<int>::from_vector({ 1, 2, 3 });
    std::vector<int> seen;
    for (int v : seq)
        seen.push_back(v);
    CHECK(seen == std::vector<int>{ 1, 2, 3 });
    CHECK_THROWS_AS(seq.begin(), ContractViolation);

    int pulls = 0;
    Sequence<int> lazy([&pulls](int& out) {
        if (pulls == 2)
            return false;
        out = ++pulls;
        return true;
    });
    CHECK(pulls == 0);
    auto it = lazy.begin();
    CHECK(pulls == 1);
    CHECK(*it == 1);
    ++it;
    CHECK(*it == 2);
    ++it;
    CHECK(it == lazy.end());

    CHECK(collect(Sequence<int>()).empty());
}

TEST_CASE("descriptor helpers", "[common]")
{
    CHECK(shape_from_pardim(2) == Shape::Quadrilateral);
    CHECK(shape_from_string("HEXAHEDRON") == Shape::Hexahedron);
    CHECK_THROWS_AS(shape_from_string("Tetrahedron"), std::invalid_argument);
    CHECK(step_interpretation_from_string("eigenvalue") == StepInterpretation::Eigenvalue);

    CHECK(split_list(" a, b,,c ") == std::vector<std::string>{ "a", "b", "c" });
    CHECK(casefold("PreSSure") == "pressure");

    Field f;
    f.name = "u";
    f.type = FieldType::vector(3, Interpretation::Displacement);
    CHECK(f.is_displacement());
    CHECK_FALSE(f.is_eigenmode());
    CHECK(f.type.slice().kind == FieldKind::Scalar);
    CHECK_THROWS_AS(f.coords(), std::logic_error);
    CHECK_THROWS_AS(FieldType::scalar(Interpretation::Flow), std::invalid_argument);

    Field g;
    g.name = "Geodetic";
    g.type = FieldType::geometry(3, CoordinateSystem{ "Geodetic", { "WGS84" } });
    CHECK(g.fits_system_name("geodetic"));
    CHECK(g.coords().to_string() == "Geodetic(WGS84)");
}

TEST_CASE("envelope records", "[envelope]")
{
    Basis mesh;
    mesh.name = "mesh";

    BasisRecord marker;
    marker.basis = mesh;
    const YAML::Node m = envelope::basis_record_node(marker);
    CHECK(m["basis"].as<std::string>() == "mesh");
    CHECK(m["update"].as<bool>() == false);
    CHECK(m.size() == 2);

    Zone z;
    z.key = "z0";
    z.shape = Shape::Line;
    z.coords = { Point{ 0, 0, 0 }, Point{ 1, 0, 0 } };

    BasisRecord update;
    update.zone = z;
    update.basis = mesh;
    update.updates = true;
    update.topology = Topology::structured({ 5, 1, 1 }, 1);
    const YAML::Node u = envelope::basis_record_node(update);
    CHECK(u["zone"].as<std::string>() == "z0");
    CHECK(u["updates"].as<bool>());
    CHECK(u["topology"]["num_nodes"].as<int>() == 5);

    const YAML::Node zn = envelope::zone_node(z);
    CHECK(zn["shape"].as<std::string>() == "Line");
    CHECK(zn["coords"][1][0].as<double>() == 1.0);

    StepRecordT step;
    step.step.index = 4;
    const YAML::Node sn = envelope::step_node(step);
    CHECK(sn["value"].IsNull());
    CHECK(sn["topologies"].IsSequence());

    /* Key order is insertion order */
    const std::string text = envelope::emit(zn);
    CHECK(text.find("shape") < text.find("coords"));
    CHECK(text.find("coords") < text.find("key"));
    CHECK(text.back() == '\n');
}
