/*─────────────────────────────────────────────────────────────
  File: include/meshstep/errors.hpp

  Exception types raised by the conversion pipeline.

  All three derive from std::runtime_error so that tools can catch
  std::exception at the top level (see convert_main.cpp) and still
  distinguish the failure class where it matters:

    ContractViolation    : a Source or Writer broke the streaming
                           contract (undeclared basis/field/zone,
                           non-increasing step index, replayed
                           single-pass sequence, writer driven without
                           configure(), property mismatch)
    FetchFailure         : Source::topology / Source::field_data failed
                           (I/O or parse error); never retried
    SerializationFailure : a Writer could not encode a record

  Every one of them unwinds through the writer's output guard, so the
  output handle is finalized before the error reaches the caller.
─────────────────────────────────────────────────────────────*/
#pragma once

#include <stdexcept>
#include <string>

namespace meshstep {

class ContractViolation : public std::runtime_error
{
public:
    explicit ContractViolation(const std::string& msg)
        : std::runtime_error("contract violation: " + msg) {}
};

class FetchFailure : public std::runtime_error
{
public:
    explicit FetchFailure(const std::string& msg)
        : std::runtime_error("fetch failed: " + msg) {}
};

class SerializationFailure : public std::runtime_error
{
public:
    explicit SerializationFailure(const std::string& msg)
        : std::runtime_error("serialization failed: " + msg) {}
};

} // namespace meshstep
