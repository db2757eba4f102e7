#include "catch2/catch.hpp"

#include "test_sources.hpp"

#include "meshstep/plot3d_io.hpp"
#include "meshstep/plot3d_source.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace meshstep;
using namespace meshstep::testing;

namespace fs = std::filesystem;

namespace {

/* x = i, y = j, z = k (+ offset in x per block) */
Plot3DBlock make_block(int idx, long long ni, long long nj, long long nk, double offset = 0.0)
{
    Plot3DBlock b;
    b.idx = idx;
    b.name = "block-" + std::to_string(idx);
    b.vtxSize = { ni, nj, nk };
    for (long long k = 0; k < nk; ++k)
        for (long long j = 0; j < nj; ++j)
            for (long long i = 0; i < ni; ++i) {
                b.x.push_back(offset + i);
                b.y.push_back(double(j));
                b.z.push_back(double(k));
            }
    return b;
}

/* nvars planes; variable v at point p is base + 10*v + p */
Plot3DFunction make_function(const Plot3DBlock& b, int nvars, double base)
{
    Plot3DFunction f;
    f.vtxSize = b.vtxSize;
    f.nvars = nvars;
    for (int v = 0; v < nvars; ++v)
        for (long long p = 0; p < b.num_points(); ++p)
            f.values.push_back(base + 10.0 * v + p);
    return f;
}

/* Scratch directory removed at scope exit. */
struct ScratchDir
{
    fs::path path;

    explicit ScratchDir(const std::string& name)
        : path(fs::temp_directory_path() / ("meshstep_" + name))
    {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~ScratchDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};

YAML::Node convert(Source& src)
{
    DebugWriter writer("", quiet_log());
    writer.configure(WriterSettings{});
    writer.consume(src, src.geometries(src.bases().front()).front());
    return writer.envelope();
}

} // anonymous namespace

TEST_CASE("plot3d grid and function files", "[plot3d]")
{
    ScratchDir dir("io");
    const std::vector<Plot3DBlock> blocks = { make_block(1, 3, 2, 2), make_block(2, 2, 2, 2, 5.0) };
    write_plot3d_grid(dir.file("grid.x"), blocks);

    const auto grid = read_plot3d_grid(dir.file("grid.x"));
    REQUIRE(grid.size() == 2);
    CHECK(grid[0].name == "block-1");
    CHECK(grid[0].num_points() == 12);
    CHECK(grid[1].x.front() == 5.0);
    CHECK(grid[0].y == blocks[0].y);

    write_plot3d_function(dir.file("f.q"), { make_function(blocks[0], 2, 0.0),
                                             make_function(blocks[1], 2, 0.0) });
    const auto layout = read_plot3d_function_layout(dir.file("f.q"));
    REQUIRE(layout.size() == 2);
    CHECK(layout[1].nvars == 2);
    CHECK(layout[1].values.empty());

    const auto funcs = read_plot3d_function(dir.file("f.q"));
    CHECK(funcs[0].variable(1).front() == 10.0);
    CHECK(funcs[0].variable(1).size() == 12);
    CHECK_THROWS_AS(funcs[0].variable(2), std::out_of_range);
}

TEST_CASE("plot3d readers reject malformed files", "[plot3d]")
{
    ScratchDir dir("bad");
    CHECK_THROWS_AS(read_plot3d_grid(dir.file("missing.x")), std::runtime_error);

    {
        std::ofstream out(dir.file("short.x"), std::ios::binary);
        const std::uint32_t marker = 4;
        const std::int32_t count = 1;
        const std::uint32_t wrong = 8;
        out.write(reinterpret_cast<const char*>(&marker), sizeof(marker));
        out.write(reinterpret_cast<const char*>(&count), sizeof(count));
        out.write(reinterpret_cast<const char*>(&wrong), sizeof(wrong));
    }
    CHECK_THROWS_AS(read_plot3d_grid(dir.file("short.x")), std::runtime_error);
}

TEST_CASE("plot3d source without function files", "[plot3d][source]")
{
    ScratchDir dir("static");
    write_plot3d_grid(dir.file("grid.xyz"), { make_block(1, 3, 2, 2) });

    Plot3DSource src(dir.file("grid.xyz"), {}, quiet_log());
    CHECK(src.properties().instantaneous);
    CHECK(src.properties().single_zoned);
    REQUIRE(src.bases().size() == 1);
    CHECK(src.bases()[0].name == "mesh");
    CHECK(src.bases()[0].pardim == 3);
    CHECK(src.fields(src.bases()[0]).empty());

    const auto zones = src.zones();
    REQUIRE(zones.size() == 1);
    CHECK(zones[0].key == "block-1");
    CHECK(zones[0].shape == Shape::Hexahedron);
    REQUIRE(zones[0].coords.size() == 8);
    CHECK(zones[0].coords[1] == Point{ 2, 0, 0 });
    CHECK(zones[0].coords[7] == Point{ 2, 1, 1 });

    const YAML::Node steps = convert(src)["steps"];
    REQUIRE(steps.size() == 1);
    CHECK(steps[0]["value"].IsNull());
    CHECK(steps[0]["topologies"][0]["topology"]["num_nodes"].as<int>() == 12);

    const YAML::Node geom = steps[0]["data"][0];
    CHECK(geom["field"].as<std::string>() == "Geometry");
    CHECK(geom["data"]["num_comps"].as<int>() == 3);
    /* point 1 = (1, 0, 0), interleaved */
    CHECK(geom["data"]["values"][3].as<double>() == 1.0);
}

TEST_CASE("plot3d source over function files", "[plot3d][source]")
{
    ScratchDir dir("steps");
    const std::vector<Plot3DBlock> blocks = { make_block(1, 2, 2, 1), make_block(2, 3, 2, 1) };
    write_plot3d_grid(dir.file("grid.x"), blocks);
    write_plot3d_function(dir.file("f0.q"), { make_function(blocks[0], 2, 0.0),
                                              make_function(blocks[1], 2, 0.0) });
    write_plot3d_function(dir.file("f1.q"), { make_function(blocks[0], 2, 100.0),
                                              make_function(blocks[1], 2, 100.0) });

    Plot3DSource src(dir.file("grid.x"), { dir.file("f0.q"), dir.file("f1.q"), dir.file("f1.q") },
                     quiet_log());

    CHECK_FALSE(src.properties().instantaneous);
    CHECK_FALSE(src.properties().single_zoned);
    CHECK(src.bases()[0].pardim == 2);
    CHECK(src.zones()[1].shape == Shape::Quadrilateral);
    CHECK(src.zones()[1].coords.size() == 4);

    const Basis mesh = src.bases()[0];
    const auto fields = src.fields(mesh);
    REQUIRE(fields.size() == 2);
    CHECK(fields[1].name == "var2");
    CHECK(src.basis_of(fields[1]).name == "mesh");

    const YAML::Node steps = convert(src)["steps"];
    REQUIRE(steps.size() == 3);

    /* Step 0: topology + Geometry + var1 + var2, two zones each */
    CHECK(steps[0]["topologies"].size() == 2);
    CHECK(steps[0]["data"].size() == 6);

    /* Step 1: new file; topology and Geometry unchanged */
    const YAML::Node s1 = steps[1];
    CHECK(s1["topologies"][0]["update"].as<bool>() == false);
    CHECK(s1["data"][0]["update"].as<bool>() == false);
    CHECK(s1["data"][1]["field"].as<std::string>() == "var1");
    CHECK(s1["data"][1]["data"]["values"][0].as<double>() == 100.0);
    CHECK(s1["data"][3]["zone"].as<std::string>() == "block-1");
    CHECK(s1["data"][3]["data"]["values"][1].as<double>() == 111.0);

    /* Step 2: same file as step 1; nothing changed */
    const YAML::Node s2 = steps[2];
    REQUIRE(s2["data"].size() == 3);
    for (const auto& d : s2["data"])
        CHECK(d["update"].as<bool>() == false);
}

TEST_CASE("plot3d function files must match the grid", "[plot3d][source]")
{
    ScratchDir dir("mismatch");
    const Plot3DBlock block = make_block(1, 3, 3, 3);
    const Plot3DBlock other = make_block(1, 2, 3, 3);
    write_plot3d_grid(dir.file("grid.x"), { block });
    write_plot3d_function(dir.file("good.q"), { make_function(block, 1, 0.0) });
    write_plot3d_function(dir.file("bad.q"), { make_function(other, 1, 0.0) });

    SECTION("at construction")
    {
        CHECK_THROWS_AS(Plot3DSource(dir.file("grid.x"), { dir.file("bad.q") }, quiet_log()),
                        std::runtime_error);
    }

    SECTION("when the file changes before it is read")
    {
        Plot3DSource src(dir.file("grid.x"), { dir.file("good.q") }, quiet_log());
        write_plot3d_function(dir.file("good.q"), { make_function(other, 1, 0.0) });
        CHECK_THROWS_AS(convert(src), FetchFailure);
    }

    SECTION("when the file disappears before it is read")
    {
        Plot3DSource src(dir.file("grid.x"), { dir.file("good.q") }, quiet_log());
        fs::remove(dir.file("good.q"));
        CHECK_THROWS_AS(convert(src), FetchFailure);
    }
}
