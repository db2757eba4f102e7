#include "catch2/catch.hpp"

#include "test_sources.hpp"

#include "meshstep/cgns_writer.hpp"
#include "meshstep/debug_writer.hpp"
#include "meshstep/settings.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace meshstep;
using namespace meshstep::testing;

TEST_CASE("writer settings from YAML", "[settings]")
{
    SECTION("defaults")
    {
        const WriterSettings s = parse_writer_settings(YAML::Load(""));
        CHECK_FALSE(s.mode);
        CHECK(s.endianness == Endianness::Native);
        CHECK(s.precision == Precision::Double);
    }

    SECTION("every key, case-insensitive values")
    {
        const WriterSettings s =
            parse_writer_settings(YAML::Load("mode: ASCII\nendianness: big\nprecision: Single\n"));
        REQUIRE(s.mode);
        CHECK(*s.mode == OutputMode::Ascii);
        CHECK(s.endianness == Endianness::Big);
        CHECK(s.precision == Precision::Single);
    }

    SECTION("unknown key is rejected")
    {
        CHECK_THROWS_AS(parse_writer_settings(YAML::Load("decimation: 2\n")),
                        std::invalid_argument);
    }

    SECTION("unknown value is rejected")
    {
        CHECK_THROWS_AS(parse_writer_settings(YAML::Load("precision: quad\n")),
                        std::invalid_argument);
        CHECK_THROWS_AS(parse_writer_settings(YAML::Load("mode: [binary]\n")),
                        std::invalid_argument);
    }

    SECTION("document must be a mapping")
    {
        CHECK_THROWS_AS(parse_writer_settings(YAML::Load("- mode\n")), std::invalid_argument);
    }
}

TEST_CASE("writer settings from a file", "[settings]")
{
    const std::string path = "meshstep_test_settings.yaml";
    {
        std::ofstream out(path);
        out << "precision: single\n";
    }
    CHECK(load_writer_settings(path).precision == Precision::Single);
    std::remove(path.c_str());

    CHECK_THROWS_AS(load_writer_settings("no_such_settings.yaml"), std::runtime_error);
}

TEST_CASE("writers reject settings they cannot honor", "[settings]")
{
    WriterSettings binary;
    binary.mode = OutputMode::Binary;
    WriterSettings little;
    little.endianness = Endianness::Little;
    WriterSettings single;
    single.precision = Precision::Single;

    SECTION("debug writer")
    {
        DebugWriter w("", quiet_log());
        CHECK_THROWS_AS(w.configure(binary), std::invalid_argument);
        CHECK_THROWS_AS(w.configure(little), std::invalid_argument);
        CHECK_THROWS_AS(w.configure(single), std::invalid_argument);
        CHECK_FALSE(w.configured());

        WriterSettings ascii;
        ascii.mode = OutputMode::Ascii;
        w.configure(ascii);
        CHECK(w.configured());
    }

    SECTION("cgns writer")
    {
        CgnsWriter w("unused.cgns", quiet_log());
        WriterSettings ascii;
        ascii.mode = OutputMode::Ascii;
        CHECK_THROWS_AS(w.configure(ascii), std::invalid_argument);
        CHECK_THROWS_AS(w.configure(little), std::invalid_argument);

        w.configure(single);
        CHECK(w.configured());
        CHECK(w.properties().require_single_basis);
    }
}
