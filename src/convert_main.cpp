/*─────────────────────────────────────────────────────────────
  File: src/convert_main.cpp

  Command-line entry point for converting time-dependent field data.

  This file:
  - Parses CLI arguments and validates combinations
  - Picks the Source from the inputs and the Writer from the output
  - Attaches the source filters the flags ask for
  - Chooses the geometry and runs one conversion pass

  Reading, filtering and writing are delegated to other modules; this
  file contains no format logic.

  Exit codes:
    0 : success
    1 : usage error
    2 : runtime failure (I/O, contract violation, serialization)
    3 : no writer for the output format, or no source for the inputs
─────────────────────────────────────────────────────────────*/
#include "meshstep/cgns_writer.hpp"
#include "meshstep/cli.hpp"
#include "meshstep/debug_writer.hpp"
#include "meshstep/filters.hpp"
#include "meshstep/logger.hpp"
#include "meshstep/plot3d_source.hpp"
#include "meshstep/settings.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace meshstep;

namespace {

/*-------------------------------------------------------------
  Print CLI usage.
-------------------------------------------------------------*/
void usage()
{
    std::cerr << "Usage: meshstep_convert INPUT... [-o OUT] [--fmt debug|cgns] "
                 "[--config settings.yaml]\n"
                 "                        [--times START:STOP[:STEP] | --time N | --last]\n"
                 "                        [--filter NAMES | --no-fields] [--basis NAMES] "
                 "[--decompose]\n"
                 "                        [--unstructured] [--key-zones]\n"
                 "                        [--verify-strict] [--debug|--info|--warning|--error]\n"
                 "\n"
                 "  INPUT   Plot3D grid (.x, .xyz) followed by Plot3D function files,\n"
                 "          one per step\n"
                 "  OUT     .yaml/.yml (debug envelope) or .cgns\n"
                 "\n"
                 "  --unstructured  write structured zones as explicit cells\n"
                 "  --key-zones     key zones by their corner points (automatic when\n"
                 "                  the source is not globally keyed)\n";
}

/* Value of a flag that takes one argument; nullopt if missing. */
std::optional<std::string> flag_value(int argc, char** argv, int& i)
{
    if (i + 1 >= argc)
        return std::nullopt;
    return std::string(argv[++i]);
}

} // anonymous namespace


/*=====================================================================
  Program entry point.

  Control flow overview:

  1) Parse CLI arguments
  2) Resolve output format and path
  3) Initialize logging
  4) Build and configure the Writer
  5) Build the Source and attach filters
  6) Choose the geometry and consume
=====================================================================*/
int main(int argc, char** argv)
{
    if (argc < 2) {
        usage();
        return 1;
    }

    /*---------------------------------------------------------
      CLI flags with defaults.
    ---------------------------------------------------------*/
    std::vector<std::string> inputs;
    std::string outPath;
    std::string fmtName;
    std::string configPath;
    std::optional<cli::StepSliceArgs> times;
    std::optional<int> timeIndex;
    bool last = false;
    bool noFields = false;
    bool decompose = false;
    bool verifyStrict = false;
    bool unstructured = false;
    bool keyZones = false;
    std::set<std::string> fieldNames;
    std::set<std::string> basisNames;
    Logger::Level level = Logger::Level::INFO;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string flag = argv[i];
            std::optional<std::string> value;

            if (flag.empty() || flag[0] != '-') {
                inputs.push_back(flag);
            }
            else if (flag == "-o" || flag == "--output") {
                if (!(value = flag_value(argc, argv, i))) { usage(); return 1; }
                outPath = *value;
            }
            else if (flag == "--fmt") {
                if (!(value = flag_value(argc, argv, i))) { usage(); return 1; }
                fmtName = *value;
            }
            else if (flag == "--config") {
                if (!(value = flag_value(argc, argv, i))) { usage(); return 1; }
                configPath = *value;
            }
            else if (flag == "--times") {
                if (!(value = flag_value(argc, argv, i))) { usage(); return 1; }
                times = cli::parse_step_slice(*value);
            }
            else if (flag == "--time") {
                if (!(value = flag_value(argc, argv, i))) { usage(); return 1; }
                timeIndex = cli::parse_index(*value);
            }
            else if (flag == "--filter") {
                if (!(value = flag_value(argc, argv, i))) { usage(); return 1; }
                cli::add_names(*value, fieldNames);
            }
            else if (flag == "--basis") {
                if (!(value = flag_value(argc, argv, i))) { usage(); return 1; }
                cli::add_names(*value, basisNames);
            }
            else if (flag == "--last") last = true;
            else if (flag == "--no-fields") noFields = true;
            else if (flag == "--decompose") decompose = true;
            else if (flag == "--verify-strict") verifyStrict = true;
            else if (flag == "--unstructured") unstructured = true;
            else if (flag == "--key-zones") keyZones = true;
            else if (auto l = cli::level_from_flag(flag)) level = *l;
            else {
                usage();
                return 1;
            }
        }
    }
    catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }

    /*---------------------------------------------------------
      Flag validation
    ---------------------------------------------------------*/
    if (inputs.empty()) {
        usage();
        return 1;
    }
    if ((times ? 1 : 0) + (timeIndex ? 1 : 0) + (last ? 1 : 0) > 1) {
        std::cerr << "Error: --times, --time and --last are mutually exclusive\n";
        return 1;
    }
    if (noFields && !fieldNames.empty()) {
        std::cerr << "Error: --filter and --no-fields are mutually exclusive\n";
        return 1;
    }

    /*---------------------------------------------------------
      Output format: --fmt wins, then the output suffix; without
      an output path the first input's stem is reused.
    ---------------------------------------------------------*/
    std::optional<cli::OutputFormat> fmt;
    if (!fmtName.empty()) {
        fmt = cli::format_from_name(fmtName);
        if (!fmt) {
            std::cerr << "Error: no writer for format '" << fmtName << "'\n";
            return 3;
        }
    }
    else if (!outPath.empty()) {
        fmt = cli::format_from_path(outPath);
        if (!fmt) {
            std::cerr << "Error: cannot infer an output format from '" << outPath
                      << "'; use --fmt\n";
            return 3;
        }
    }
    else {
        fmt = cli::OutputFormat::Debug;
    }
    if (outPath.empty())
        outPath = std::filesystem::path(inputs.front()).filename()
                      .replace_extension(cli::default_suffix(*fmt)).string();

    /*---------------------------------------------------------
      Logger initialization.
      The log file is written next to the output file.
    ---------------------------------------------------------*/
    std::filesystem::path logPath = std::filesystem::path(outPath).parent_path() /
                                    "meshstep_convert.log";
    Logger log(logPath.string());
    log.set_level(level);
    log.info("meshstep_convert started");
    for (const auto& in : inputs)
        log.info("Input    : " + in);
    log.info("Output   : " + outPath + " (" +
             std::string(*fmt == cli::OutputFormat::Cgns ? "cgns" : "debug") + ")");

    /*---------------------------------------------------------
      Inputs: the first Plot3D grid, then function files.
    ---------------------------------------------------------*/
    std::string gridPath;
    std::vector<std::string> functionPaths;
    for (const auto& in : inputs) {
        if (gridPath.empty() && cli::is_plot3d_mesh(in))
            gridPath = in;
        else
            functionPaths.push_back(in);
    }
    if (gridPath.empty()) {
        log.error("No source can read the inputs (expected a Plot3D grid, .x or .xyz)");
        return 3;
    }

    try {
        /*=====================================================
          Writer
        =====================================================*/
        WriterSettings settings;
        if (!configPath.empty()) {
            settings = load_writer_settings(configPath);
            log.info("Settings : " + configPath);
        }

        std::unique_ptr<Writer> writer;
        if (*fmt == cli::OutputFormat::Cgns)
            writer = std::make_unique<CgnsWriter>(outPath, log);
        else
            writer = std::make_unique<DebugWriter>(outPath, log);
        writer->configure(settings);
        const WriterProperties wprops = writer->properties();

        /*=====================================================
          Source and filters
        =====================================================*/
        std::unique_ptr<Source> source =
            std::make_unique<Plot3DSource>(gridPath, functionPaths, log);

        if (keyZones) {
            log.debug("Attaching KeyZones (--key-zones)");
            source = std::make_unique<KeyZones>(std::move(source), log);
        }
        else if (!source->properties().globally_keyed) {
            log.debug("Attaching KeyZones (source is not globally keyed)");
            source = std::make_unique<KeyZones>(std::move(source), log);
        }

        if (!basisNames.empty()) {
            log.debug("Attaching BasisFilter (--basis)");
            source = std::make_unique<BasisFilter>(std::move(source), log, basisNames);
        }

        if (decompose) {
            log.debug("Attaching Decompose (--decompose)");
            source = std::make_unique<Decompose>(std::move(source), log);
        }

        if (unstructured) {
            log.debug("Attaching ForceUnstructured (--unstructured)");
            source = std::make_unique<ForceUnstructured>(std::move(source), log);
        }

        if (times) {
            log.debug("Attaching StepSlice (--times)");
            source = std::make_unique<StepSlice>(std::move(source), log,
                                                 times->start, times->stop, times->stride);
        }
        else if (timeIndex) {
            log.debug("Attaching StepSlice (--time)");
            source = std::make_unique<StepSlice>(std::move(source), log,
                                                 *timeIndex, *timeIndex + 1, std::nullopt);
        }
        else if (last) {
            log.debug("Attaching LastTime (--last)");
            source = std::make_unique<LastTime>(std::move(source), log);
        }

        if (noFields) {
            log.debug("Attaching FieldFilter (--no-fields)");
            source = std::make_unique<FieldFilter>(std::move(source), log, std::set<std::string>{});
        }
        else if (!fieldNames.empty()) {
            log.debug("Attaching FieldFilter (--filter)");
            source = std::make_unique<FieldFilter>(std::move(source), log, fieldNames);
        }

        if (verifyStrict) {
            log.debug("Attaching Strict (--verify-strict)");
            source = std::make_unique<Strict>(std::move(source), log);
        }

        const std::vector<Basis> bases = source->bases();
        if (wprops.require_single_basis && bases.size() > 1) {
            log.error("The output format needs a single basis; select one with --basis");
            return 3;
        }
        if (wprops.require_instantaneous && !source->properties().instantaneous) {
            log.error("The output format needs a single step; use --time or --last");
            return 3;
        }

        for (const auto& basis : bases)
            for (const auto& field : source->fields(basis))
                log.debug("Discovered field '" + field.name + "' with " +
                          std::to_string(field.num_comps()) + " component(s)");

        /*=====================================================
          Geometry: the first one the source declares
        =====================================================*/
        Field geometry;
        if (!bases.empty()) {
            std::vector<Field> geometries;
            for (const auto& basis : bases)
                for (const auto& g : source->geometries(basis))
                    geometries.push_back(g);
            if (geometries.empty()) {
                log.error("The source declares no geometry");
                return 3;
            }
            geometry = geometries.front();
            log.info("Using '" + geometry.name + "' as geometry (" +
                     geometry.coords().to_string() + ")");
        }

        writer->consume(*source, geometry);

        log.info("Finished OK.  Exiting.");
        return 0;
    }
    catch (const std::exception& ex) {
        log.error(ex.what());
        std::cout << "Fatal: " << ex.what() << '\n';
        return 2;
    }
}
