/*─────────────────────────────────────────────────────────────
  File: src/settings.cpp
  Writer settings parsing and validation

  Converts a YAML settings document into a WriterSettings value.

  Input format:

      mode:       ascii
      endianness: little
      precision:  single

  Notes:
    - The option set is closed: a key outside {mode, endianness,
      precision} is an error, not a warning.
    - Values are matched case-insensitively.
    - An empty document (or a YAML null) yields the defaults.
─────────────────────────────────────────────────────────────*/
#include "meshstep/settings.hpp"
#include "meshstep/common.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace meshstep {

std::string output_mode_to_string(OutputMode m)
{
    return m == OutputMode::Binary ? "binary" : "ascii";
}

std::string endianness_to_string(Endianness e)
{
    switch (e) {
        case Endianness::Native: return "native";
        case Endianness::Little: return "little";
        case Endianness::Big:    return "big";
    }
    return "??";
}

std::string precision_to_string(Precision p)
{
    return p == Precision::Single ? "single" : "double";
}

namespace {

std::string scalar_value(const YAML::Node& node, const std::string& key)
{
    if (!node.IsScalar())
        throw std::invalid_argument("Setting '" + key + "' must be a scalar");
    return casefold(trim(node.as<std::string>()));
}

OutputMode parse_mode(const std::string& v)
{
    if (v == "binary") return OutputMode::Binary;
    if (v == "ascii")  return OutputMode::Ascii;
    throw std::invalid_argument("Unknown output mode '" + v + "' (binary, ascii)");
}

Endianness parse_endianness(const std::string& v)
{
    if (v == "native") return Endianness::Native;
    if (v == "little") return Endianness::Little;
    if (v == "big")    return Endianness::Big;
    throw std::invalid_argument("Unknown endianness '" + v + "' (native, little, big)");
}

Precision parse_precision(const std::string& v)
{
    if (v == "single") return Precision::Single;
    if (v == "double") return Precision::Double;
    throw std::invalid_argument("Unknown precision '" + v + "' (single, double)");
}

} // anonymous namespace

/*-------------------------------------------------------------
  parse_writer_settings

  Walk every key of the mapping; anything outside the recognized set
  throws std::invalid_argument naming the offending key.
-------------------------------------------------------------*/
WriterSettings parse_writer_settings(const YAML::Node& doc)
{
    WriterSettings settings;
    if (!doc || doc.IsNull())
        return settings;
    if (!doc.IsMap())
        throw std::invalid_argument("Writer settings must be a mapping");

    for (const auto& kv : doc) {
        const std::string key = kv.first.as<std::string>();
        const std::string value = scalar_value(kv.second, key);

        if (key == "mode")
            settings.mode = parse_mode(value);
        else if (key == "endianness")
            settings.endianness = parse_endianness(value);
        else if (key == "precision")
            settings.precision = parse_precision(value);
        else
            throw std::invalid_argument("Unrecognized writer setting '" + key + "'");
    }
    return settings;
}

WriterSettings load_writer_settings(const std::string& path)
{
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& ex) {
        throw std::runtime_error("Could not read writer settings " + path + ": " + ex.what());
    }
    return parse_writer_settings(doc);
}

} // namespace meshstep
