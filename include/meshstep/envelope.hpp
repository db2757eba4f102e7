/*
  File: include/meshstep/envelope.hpp

  Canonical envelope: the nested-mapping rendition of one conversion
  pass, built with yaml-cpp nodes.

      source-properties: {instantaneous, globally-keyed, discrete-topology,
                          single-basis, single-zoned, step-interpretation}
      bases:   [{name, fields: [geometries..., fields...]}]
      zones:   [{shape, coords, key}]
      steps:   [{index, value, topologies: [...], data: [...]}]

  Step records:
      {basis: NAME, update: false}                       no topology change
      {zone: KEY, basis: NAME, updates: true, topology}  one per zone
      {field: NAME, update: false}                       no field change
      {zone: KEY, field: NAME, updates: true, data}      one per zone

  Map keys are emitted in insertion order, so identical input always
  yields identical text.
*/
#pragma once

#include "meshstep/common.hpp"
#include "meshstep/writer.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

namespace meshstep {

using BasisRecord = BasisUpdate<Basis, Zone>;
using FieldRecord = FieldUpdate<Field, Zone>;
using StepRecordT = StepRecord<Basis, Field, Step, Zone>;
using Header      = StreamHeader<Basis, Field, Zone>;

namespace envelope {

YAML::Node properties_node(const SourceProperties& p);
YAML::Node field_node(const Field& f);
YAML::Node basis_node(const BasisEntry<Basis, Field>& entry);
YAML::Node zone_node(const Zone& z);

YAML::Node basis_record_node(const BasisRecord& r);
YAML::Node field_record_node(const FieldRecord& r);
YAML::Node step_node(const StepRecordT& r);

/* Root mapping for a header, with an empty `steps` sequence. */
YAML::Node header_node(const Header& h);

/* Block-style YAML text, terminated by a newline. */
std::string emit(const YAML::Node& root);

} // namespace envelope
} // namespace meshstep
