/*─────────────────────────────────────────────────────────────
  File: src/cli.cpp
  Command-line helpers
─────────────────────────────────────────────────────────────*/
#include "meshstep/cli.hpp"
#include "meshstep/common.hpp"

#include <filesystem>
#include <stdexcept>

namespace meshstep {
namespace cli {

namespace {

std::string extension(const std::string& path)
{
    return casefold(std::filesystem::path(path).extension().string());
}

std::optional<int> slice_part(const std::string& part, const std::string& text)
{
    const std::string t = trim(part);
    if (t.empty())
        return std::nullopt;
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(t, &used);
    }
    catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid step slice '" + text + "'");
    }
    if (used != t.size())
        throw std::invalid_argument("Invalid step slice '" + text + "'");
    return value;
}

/* Split on ':' keeping empty parts ("::3" has three). */
std::vector<std::string> slice_parts(const std::string& text)
{
    std::vector<std::string> parts(1);
    for (char c : text) {
        if (c == ':')
            parts.emplace_back();
        else
            parts.back().push_back(c);
    }
    return parts;
}

} // anonymous namespace

/*=====================================================================
  is_plot3d_mesh

  Lightweight mesh-type sniffing based on filename extension. The
  reader still validates the file when it parses it.
=====================================================================*/
bool is_plot3d_mesh(const std::string& path)
{
    const std::string ext = extension(path);
    return ext == ".x" || ext == ".xyz";
}

std::optional<OutputFormat> format_from_name(const std::string& name)
{
    const std::string n = casefold(trim(name));
    if (n == "debug") return OutputFormat::Debug;
    if (n == "cgns")  return OutputFormat::Cgns;
    return std::nullopt;
}

std::optional<OutputFormat> format_from_path(const std::string& path)
{
    const std::string ext = extension(path);
    if (ext == ".yaml" || ext == ".yml") return OutputFormat::Debug;
    if (ext == ".cgns")                  return OutputFormat::Cgns;
    return std::nullopt;
}

std::string default_suffix(OutputFormat fmt)
{
    return fmt == OutputFormat::Cgns ? ".cgns" : ".yaml";
}

StepSliceArgs parse_step_slice(const std::string& text)
{
    const std::vector<std::string> parts = slice_parts(text);
    if (parts.size() < 2 || parts.size() > 3)
        throw std::invalid_argument("Step slice must be START:STOP[:STEP], got '" + text + "'");

    StepSliceArgs args;
    args.start = slice_part(parts[0], text);
    args.stop = slice_part(parts[1], text);
    if (parts.size() == 3)
        args.stride = slice_part(parts[2], text);

    if ((args.start && *args.start < 0) || (args.stop && *args.stop < 0))
        throw std::invalid_argument("Step slice bounds must be non-negative: '" + text + "'");
    if (args.stride && *args.stride < 1)
        throw std::invalid_argument("Step slice stride must be at least 1: '" + text + "'");
    return args;
}

int parse_index(const std::string& text)
{
    const std::optional<int> v = slice_part(text, text);
    if (!v || *v < 0)
        throw std::invalid_argument("Expected a non-negative step index, got '" + text + "'");
    return *v;
}

void add_names(const std::string& text, std::set<std::string>& into)
{
    for (const auto& name : split_list(text, ','))
        if (!trim(name).empty())
            into.insert(casefold(trim(name)));
}

std::optional<Logger::Level> level_from_flag(const std::string& flag)
{
    if (flag == "--debug")   return Logger::Level::DEBUG;
    if (flag == "--info")    return Logger::Level::INFO;
    if (flag == "--warning") return Logger::Level::WARN;
    if (flag == "--error")   return Logger::Level::ERR;
    return std::nullopt;
}

} // namespace cli
} // namespace meshstep
