/*
  File: include/meshstep/settings.hpp

  Writer configuration and capability declarations.

  This header defines:
    - WriterSettings   : the closed option set accepted by Writer::configure()
    - WriterProperties : what shapes of data a Writer accepts
    - parse_writer_settings / load_writer_settings : YAML front end

  Settings document (YAML), every key optional:

      mode:       binary | ascii
      endianness: native | little | big
      precision:  single | double

  Unknown keys and unknown values throw std::invalid_argument at
  configuration time. Whether a Writer can honor a given value is
  decided by the Writer itself inside configure().
*/
#pragma once

#include <optional>
#include <string>

namespace YAML {
class Node;
}

namespace meshstep {

enum class OutputMode { Binary, Ascii };
enum class Endianness { Native, Little, Big };
enum class Precision  { Single, Double };

std::string output_mode_to_string(OutputMode m);
std::string endianness_to_string(Endianness e);
std::string precision_to_string(Precision p);

struct WriterSettings
{
    std::optional<OutputMode> mode;       ///< unset: the writer's default
    Endianness                endianness = Endianness::Native;
    Precision                 precision  = Precision::Double;
};

/*
  Capability flags checked by the driver before the first step:
    require_single_basis      : at most one basis may be enumerated
    require_single_zone       : at most one zone may be enumerated
    require_discrete_topology : SourceProperties::discrete_topology must hold
    require_instantaneous     : SourceProperties::instantaneous must hold
*/
struct WriterProperties
{
    bool require_single_basis      = false;
    bool require_single_zone       = false;
    bool require_discrete_topology = false;
    bool require_instantaneous     = false;
};

WriterSettings parse_writer_settings(const YAML::Node& doc);
WriterSettings load_writer_settings(const std::string& path);

} // namespace meshstep
