/*
  File: include/meshstep/cli.hpp

  Helpers shared by the command-line tools (convert_main.cpp,
  source_dump.cpp). Kept in the library so that they are unit tested.

  Parsing errors throw std::invalid_argument; main() turns them into
  usage errors (exit code 1).
*/
#pragma once

#include "meshstep/logger.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace meshstep {
namespace cli {

/* Output formats with a writer in this project. */
enum class OutputFormat { Debug, Cgns };

/*
  Plot3D grids are identified by extension: ".x" or ".xyz"
  (case-insensitive). Everything else given next to a grid is taken as
  a function file.
*/
bool is_plot3d_mesh(const std::string& path);

/*
  "debug" / "cgns", or nullopt for a name without a writer.
*/
std::optional<OutputFormat> format_from_name(const std::string& name);

/*
  From the output suffix: .yaml / .yml -> Debug, .cgns -> Cgns.
*/
std::optional<OutputFormat> format_from_path(const std::string& path);

std::string default_suffix(OutputFormat fmt);

/*
  --times argument, START:STOP[:STEP] with every part optional
  ("2:", ":10", "::3", "1:9:2").
*/
struct StepSliceArgs
{
    std::optional<int> start;
    std::optional<int> stop;
    std::optional<int> stride;
};

StepSliceArgs parse_step_slice(const std::string& text);

/* Non-negative integer, e.g. for --time. */
int parse_index(const std::string& text);

/*
  Comma-separated names, trimmed and case-folded, merged into `into`
  (the flags may be given more than once).
*/
void add_names(const std::string& text, std::set<std::string>& into);

/* --debug / --info / --warning / --error, or nullopt. */
std::optional<Logger::Level> level_from_flag(const std::string& flag);

} // namespace cli
} // namespace meshstep
