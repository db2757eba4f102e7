#include "catch2/catch.hpp"

#include "test_sources.hpp"

#include "meshstep/cgns_file.hpp"
#include "meshstep/cgns_writer.hpp"
#include "meshstep/filters.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace meshstep;
using namespace meshstep::testing;

namespace {

std::string scratch_file(const std::string& name)
{
    return (std::filesystem::temp_directory_path() / ("meshstep_" + name)).string();
}

/*
  Two zones, three steps:
    X        : changes at step 1
    pressure : changes at step 2
    temp     : never changes after step 0
    flux     : cellwise, changes at step 1
*/
std::unique_ptr<ScriptedSource> evolving_source()
{
    auto src = std::make_unique<ScriptedSource>();
    src->props.instantaneous = false;
    src->props.globally_keyed = true;
    src->props.discrete_topology = true;
    src->props.step_interpretation = StepInterpretation::Time;

    ScriptedBasis mesh;
    mesh.basis.name = "mesh";
    mesh.basis.pardim = 3;
    mesh.geometries = { make_geometry("X") };
    mesh.fields = { make_scalar("pressure"), make_scalar("temp"), make_scalar("flux", true) };
    src->layout = { mesh };

    src->zone_list = { make_zone("z0"), make_zone("z1", 1.0) };
    src->step_list = { make_step(0, 0.0), make_step(1, 0.5), make_step(2, 1.0) };
    for (int i = 1; i < 3; ++i) {
        src->topo_answers[{ i, "mesh" }] = false;
        src->field_answers[{ i, "temp" }] = false;
    }
    src->field_answers[{ 2, "X" }] = false;
    src->field_answers[{ 1, "pressure" }] = false;
    src->field_answers[{ 2, "flux" }] = false;
    return src;
}

/* Index of the array `name` under the current cg_goto position. */
int find_array(const std::string& name, std::vector<cgsize_t>& dims)
{
    int narrays = 0;
    REQUIRE(cg_narrays(&narrays) == CG_OK);
    for (int a = 1; a <= narrays; ++a) {
        char aname[33] = {};
        DataType_t type = DataTypeNull;
        int rank = 0;
        cgsize_t d[12] = {};
        REQUIRE(cg_array_info(a, aname, &type, &rank, d) == CG_OK);
        if (name == aname) {
            dims.assign(d, d + rank);
            return a;
        }
    }
    FAIL("no array " << name);
    return 0;
}

std::vector<double> read_doubles(const std::string& name)
{
    std::vector<cgsize_t> dims;
    const int a = find_array(name, dims);
    cgsize_t count = 1;
    for (cgsize_t d : dims)
        count *= d;
    std::vector<double> out(static_cast<std::size_t>(count));
    REQUIRE(cg_array_read_as(a, RealDouble, out.data()) == CG_OK);
    return out;
}

/* Pointer array of zone Z: (32, nsteps) characters, space padded. */
std::vector<std::string> read_pointers(int fn, int Z, const std::string& name)
{
    REQUIRE(cg_goto(fn, 1, "Zone_t", Z, "ZoneIterativeData_t", 1, "end") == CG_OK);
    std::vector<cgsize_t> dims;
    const int a = find_array(name, dims);
    REQUIRE(dims.size() == 2);
    REQUIRE(dims[0] == 32);

    std::string buf(static_cast<std::size_t>(dims[0] * dims[1]), ' ');
    REQUIRE(cg_array_read(a, &buf[0]) == CG_OK);

    std::vector<std::string> out;
    for (cgsize_t i = 0; i < dims[1]; ++i) {
        std::string entry = buf.substr(static_cast<std::size_t>(i * 32), 32);
        entry.erase(entry.find_last_not_of(' ') + 1);
        out.push_back(entry);
    }
    return out;
}

/* FlowSolution_t index of `name` in zone Z, 0 if absent. */
int find_solution(int fn, int Z, const std::string& name, GridLocation_t& loc)
{
    int nsols = 0;
    REQUIRE(cg_nsols(fn, 1, Z, &nsols) == CG_OK);
    for (int S = 1; S <= nsols; ++S) {
        char sname[33] = {};
        REQUIRE(cg_sol_info(fn, 1, Z, S, sname, &loc) == CG_OK);
        if (name == sname)
            return S;
    }
    return 0;
}

} // anonymous namespace

TEST_CASE("cgns output of a time-dependent source", "[cgns]")
{
    const std::string path = scratch_file("round_trip.cgns");
    {
        auto src = round_trip_source();
        CgnsWriter writer(path, quiet_log());
        WriterSettings settings;
        settings.precision = Precision::Single;
        writer.configure(settings);
        writer.consume(*src, src->field("X"));
        CHECK_FALSE(writer.is_open());
    }

    CgnsFile file;
    file.open(path, CG_MODE_READ);
    const int fn = file.file_id();

    int nbases = 0;
    REQUIRE(cg_nbases(fn, &nbases) == CG_OK);
    CHECK(nbases == 1);

    int nzones = 0;
    REQUIRE(cg_nzones(fn, 1, &nzones) == CG_OK);
    REQUIRE(nzones == 1);

    char zname[33] = {};
    cgsize_t size[9] = {};
    REQUIRE(cg_zone_read(fn, 1, 1, zname, size) == CG_OK);
    CHECK(std::string(zname) == "z0");
    CHECK(size[0] == 2);
    CHECK(size[3] == 1);

    /* Geometry unchanged at step 1: one grid; pressure changed: two solutions */
    int ngrids = 0, nsols = 0;
    REQUIRE(cg_ngrids(fn, 1, 1, &ngrids) == CG_OK);
    REQUIRE(cg_nsols(fn, 1, 1, &nsols) == CG_OK);
    CHECK(ngrids == 1);
    CHECK(nsols == 2);

    DataType_t type = DataTypeNull;
    char fname[33] = {};
    REQUIRE(cg_field_info(fn, 1, 1, 2, 1, &type, fname) == CG_OK);
    CHECK(std::string(fname) == "pressure");
    CHECK(type == RealSingle);

    char biter[33] = {};
    int nsteps = 0;
    REQUIRE(cg_biter_read(fn, 1, biter, &nsteps) == CG_OK);
    CHECK(nsteps == 2);

    file.close();
    std::remove(path.c_str());
}

TEST_CASE("cgns writer refuses what it cannot store", "[cgns]")
{
    const std::string path = scratch_file("rejected.cgns");

    SECTION("more than one basis")
    {
        auto src = two_basis_source();
        CgnsWriter writer(path, quiet_log());
        writer.configure(WriterSettings{});
        CHECK_THROWS_AS(writer.consume(*src, src->field("X")), ContractViolation);
        CHECK_FALSE(writer.is_open());
    }

    SECTION("eigenmode field")
    {
        auto src = round_trip_source();
        src->layout[0].fields[0].type = FieldType::scalar(Interpretation::Eigenmode);
        CgnsWriter writer(path, quiet_log());
        writer.configure(WriterSettings{});
        CHECK_THROWS_AS(writer.consume(*src, src->field("X")), SerializationFailure);
        CHECK_FALSE(writer.is_open());
    }

    SECTION("zone key too long for a CGNS name")
    {
        auto src = round_trip_source();
        src->zone_list[0].key = std::string(40, 'z');
        CgnsWriter writer(path, quiet_log());
        writer.configure(WriterSettings{});
        CHECK_THROWS_AS(writer.consume(*src, src->field("X")), SerializationFailure);
    }

    std::remove(path.c_str());
}

TEST_CASE("cgns pointers name the node valid at each step", "[cgns]")
{
    const std::string path = scratch_file("evolving.cgns");
    {
        auto src = evolving_source();
        CgnsWriter writer(path, quiet_log());
        writer.configure(WriterSettings{});
        writer.consume(*src, src->field("X"));
    }

    CgnsFile file;
    file.open(path, CG_MODE_READ);
    const int fn = file.file_id();

    int nzones = 0;
    REQUIRE(cg_nzones(fn, 1, &nzones) == CG_OK);
    REQUIRE(nzones == 2);

    for (int Z = 1; Z <= 2; ++Z) {
        CAPTURE(Z);
        CHECK(read_pointers(fn, Z, "GridCoordinatesPointers") ==
              std::vector<std::string>{ "GridCoordinates", "GridCoordinates1", "GridCoordinates1" });
        CHECK(read_pointers(fn, Z, "FlowSolutionPointers") ==
              std::vector<std::string>{ "FlowSolution0", "FlowSolution0", "FlowSolution2" });
        CHECK(read_pointers(fn, Z, "FlowCellSolutionPointers") ==
              std::vector<std::string>{ "FlowCellSolution0", "FlowCellSolution1",
                                        "FlowCellSolution1" });

        int ngrids = 0, nsols = 0;
        REQUIRE(cg_ngrids(fn, 1, Z, &ngrids) == CG_OK);
        REQUIRE(cg_nsols(fn, 1, Z, &nsols) == CG_OK);
        CHECK(ngrids == 2);
        CHECK(nsols == 4);
    }

    /* Geometry written again at step 1: point 1 of X is 100 + 10 */
    REQUIRE(cg_goto(fn, 1, "Zone_t", 1, "GridCoordinates_t", 2, "end") == CG_OK);
    const std::vector<double> x1 = read_doubles("CoordinateX");
    REQUIRE(x1.size() == 8);
    CHECK(x1[1] == 110.0);
    CHECK(read_doubles("CoordinateY")[1] == 111.0);

    /* Step 2 solution carries the unchanged temp of step 0 forward */
    GridLocation_t loc = GridLocationNull;
    const int s2 = find_solution(fn, 1, "FlowSolution2", loc);
    REQUIRE(s2 != 0);
    CHECK(loc == Vertex);
    int nfields = 0;
    REQUIRE(cg_nfields(fn, 1, 1, s2, &nfields) == CG_OK);
    CHECK(nfields == 2);

    cgsize_t rmin[3] = { 1, 1, 1 };
    cgsize_t rmax[3] = { 2, 2, 2 };
    std::vector<double> values(8);
    REQUIRE(cg_field_read(fn, 1, 1, s2, "pressure", RealDouble, rmin, rmax, values.data()) == CG_OK);
    CHECK(values[1] == 210.0);
    REQUIRE(cg_field_read(fn, 1, 1, s2, "temp", RealDouble, rmin, rmax, values.data()) == CG_OK);
    CHECK(values[1] == 10.0);

    const int c1 = find_solution(fn, 1, "FlowCellSolution1", loc);
    REQUIRE(c1 != 0);
    CHECK(loc == CellCenter);
    double flux = 0.0;
    REQUIRE(cg_field_read(fn, 1, 1, c1, "flux", RealDouble, rmin, rmin, &flux) == CG_OK);
    CHECK(flux == 100.0);

    REQUIRE(cg_goto(fn, 1, "BaseIterativeData_t", 1, "end") == CG_OK);
    CHECK(read_doubles("TimeValues") == std::vector<double>{ 0.0, 0.5, 1.0 });

    file.close();
    std::remove(path.c_str());
}

TEST_CASE("cgns output of unstructured zones", "[cgns][unstructured]")
{
    const std::string path = scratch_file("unstructured.cgns");
    {
        auto src = round_trip_source();
        src->props.discrete_topology = true;
        const Field x = src->field("X");
        ForceUnstructured cells(std::move(src), quiet_log());
        CgnsWriter writer(path, quiet_log());
        writer.configure(WriterSettings{});
        writer.consume(cells, x);
    }

    CgnsFile file;
    file.open(path, CG_MODE_READ);
    const int fn = file.file_id();

    ZoneType_t ztype = ZoneTypeNull;
    REQUIRE(cg_zone_type(fn, 1, 1, &ztype) == CG_OK);
    CHECK(ztype == Unstructured);

    char zname[33] = {};
    cgsize_t size[3] = {};
    REQUIRE(cg_zone_read(fn, 1, 1, zname, size) == CG_OK);
    CHECK(size[0] == 8);
    CHECK(size[1] == 1);

    int nsections = 0;
    REQUIRE(cg_nsections(fn, 1, 1, &nsections) == CG_OK);
    REQUIRE(nsections == 1);

    char sname[33] = {};
    ElementType_t etype = ElementTypeNull;
    cgsize_t start = 0, end = 0;
    int nbndry = 0, parent_flag = 0;
    REQUIRE(cg_section_read(fn, 1, 1, 1, sname, &etype, &start, &end, &nbndry, &parent_flag) == CG_OK);
    CHECK(etype == HEXA_8);
    CHECK(end - start + 1 == 1);

    /* tensor corners 0..7 in CGNS hexahedron order, 1-based */
    std::vector<cgsize_t> conn(8);
    REQUIRE(cg_elements_read(fn, 1, 1, 1, conn.data(), nullptr) == CG_OK);
    CHECK(conn == std::vector<cgsize_t>{ 1, 2, 4, 3, 5, 6, 8, 7 });

    file.close();
    std::remove(path.c_str());
}
