//─────────────────────────────────────────────────────────────
// File: src/source_dump.cpp
// Source inspection utility
//─────────────────────────────────────────────────────────────
//
// This file implements a small command-line program that opens a
// Plot3D grid (and optional function files, one per step) as a Source
// and prints a human-readable summary of:
//
//   - The source properties (instantaneous, single-basis, ...)
//   - Bases with their geometries and fields
//   - Zones with their shape, corner count and size
//   - Steps, with the bases and fields that change at each one
//
// The intent is diagnostic: check what meshstep_convert would see
// before writing anything. Only the update queries are made; no field
// data is fetched apart from the topology sizes in the zone table.
//─────────────────────────────────────────────────────────────
#include "meshstep/cli.hpp"
#include "meshstep/logger.hpp"
#include "meshstep/plot3d_source.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace meshstep;

static const char* yes_no(bool b) { return b ? "yes" : "no"; }

/*=====================================================================
  dump_properties
=====================================================================*/
static void dump_properties(const SourceProperties& p)
{
    std::cout << "Properties:\n"
              << "  instantaneous      : " << yes_no(p.instantaneous) << '\n'
              << "  globally keyed     : " << yes_no(p.globally_keyed) << '\n'
              << "  discrete topology  : " << yes_no(p.discrete_topology) << '\n'
              << "  single basis       : " << yes_no(p.single_basis) << '\n'
              << "  single zoned       : " << yes_no(p.single_zoned) << '\n'
              << "  step interpretation: "
              << step_interpretation_to_string(p.step_interpretation) << '\n';
}

/*=====================================================================
  dump_fields

  One table per basis. Geometries are listed first, as the writers
  consume them.
=====================================================================*/
static void dump_fields(const Source& src, const Basis& basis)
{
    std::cout << "Basis \"" << basis.name << "\" (pardim " << basis.pardim << "):\n";
    std::cout << "  Name             Kind      Comps  Location  Notes\n"
                 "  ---------------- --------- -----  --------  -----\n";

    auto row = [](const Field& f) {
        std::string notes;
        if (f.is_geometry())     notes = f.coords().to_string();
        else if (f.is_eigenmode())    notes = "eigenmode";
        else if (f.is_displacement()) notes = "displacement";

        std::cout << "  " << std::left << std::setw(16) << f.name << ' '
                  << std::setw(9) << field_kind_to_string(f.type.kind) << ' '
                  << std::right << std::setw(5) << f.num_comps() << "  "
                  << std::left << std::setw(8) << (f.cellwise ? "cell" : "node") << "  "
                  << notes << '\n';
    };

    for (const auto& g : src.geometries(basis)) row(g);
    for (const auto& f : src.fields(basis))     row(f);
}

/*=====================================================================
  dump_zones

  Ni/Nj/Nk come from the first step's topology of the first basis.
=====================================================================*/
static void dump_zones(Source& src, const Step& first, const std::vector<Basis>& bases)
{
    std::cout << "Zones:\n";
    std::cout << "  Key          Shape          Corners   Ni   Nj   Nk\n"
                 "  ------------ -------------- ------- ---- ---- ----\n";

    for (const auto& z : src.zones()) {
        std::cout << "  " << std::left << std::setw(12) << z.key << ' '
                  << std::setw(14) << shape_to_string(z.shape) << ' '
                  << std::right << std::setw(7) << z.coords.size();
        if (!bases.empty()) {
            const Topology t = src.topology(first, bases.front(), z);
            const auto& n = t.vtxSize();
            std::cout << ' ' << std::setw(4) << n[0] << ' ' << std::setw(4) << n[1]
                      << ' ' << std::setw(4) << n[2];
        }
        std::cout << '\n';
    }
}


/*=====================================================================
  main

  Usage:
      meshstep_dump GRID [FUNCTION...] [--debug|--info|--warning|--error]

  Flow:
    1) Open the Source
    2) Print properties and the basis/field tables
    3) Walk the steps, asking the update queries for every basis and
       field; print the zone table at the first step
    4) Print one line per step

  Exit codes:
    0 : success
    1 : CLI usage error
    2 : runtime error (exception)
    3 : the first input is not a Plot3D grid
=====================================================================*/
int main(int argc, char** argv)
{
    std::vector<std::string> inputs;
    Logger::Level level = Logger::Level::INFO;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (!arg.empty() && arg[0] == '-') {
            auto l = cli::level_from_flag(arg);
            if (!l) { std::cerr << "Usage: meshstep_dump GRID [FUNCTION...]\n"; return 1; }
            level = *l;
        }
        else {
            inputs.push_back(arg);
        }
    }
    if (inputs.empty()) { std::cerr << "Usage: meshstep_dump GRID [FUNCTION...]\n"; return 1; }
    if (!cli::is_plot3d_mesh(inputs.front())) {
        std::cerr << "Not a Plot3D grid (.x, .xyz): " << inputs.front() << '\n';
        return 3;
    }

    Logger log("meshstep_dump.log");
    log.set_level(level);
    log.info("Opening " + inputs.front());

    try {
        const std::vector<std::string> functions(inputs.begin() + 1, inputs.end());
        Plot3DSource src(inputs.front(), functions, log);

        dump_properties(src.properties());

        const std::vector<Basis> bases = src.bases();
        for (const auto& b : bases)
            dump_fields(src, b);

        std::vector<std::string> lines;
        bool first = true;
        for (const Step& step : src.steps()) {
            std::vector<std::string> changed;
            bool topoFirst = false;
            for (const auto& b : bases) {
                const bool topo = src.topology_updates(step, b);
                if (topo) changed.push_back(b.name + "(topology)");
                if (first && topo && b == bases.front()) topoFirst = true;
                for (const auto& g : src.geometries(b))
                    if (src.field_updates(step, g)) changed.push_back(g.name);
                for (const auto& f : src.fields(b))
                    if (src.field_updates(step, f)) changed.push_back(f.name);
            }

            if (first && topoFirst)
                dump_zones(src, step, bases);
            first = false;

            std::ostringstream line;
            line << "  " << std::right << std::setw(5) << step.index << ' ' << std::setw(15);
            if (step.value) line << *step.value;
            else            line << "-";
            line << ' ';
            for (std::size_t i = 0; i < changed.size(); ++i)
                line << (i ? ", " : "") << changed[i];
            lines.push_back(line.str());
        }

        // The zone table is printed while walking the steps; the step
        // table follows it.
        std::cout << "Steps:\n";
        std::cout << "  Index           Value Changed\n"
                     "  ----- --------------- -------\n";
        for (const auto& l : lines)
            std::cout << l << '\n';

        log.info("Finished dump.");
        return 0;
    }
    catch (const std::exception& ex) {
        log.error(ex.what());
        std::cerr << ex.what() << '\n';
        return 2;
    }
}
