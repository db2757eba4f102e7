/*
  File: include/meshstep/debug_writer.hpp

  DebugWriter: the diagnostic sink.

  Builds the canonical envelope (envelope.hpp) in memory while the pass
  runs and emits it as YAML when the output is finalized. Tests compare
  envelopes produced from different Sources; the CLI writes it to a
  .yaml file for inspection.

  Settings:
    mode       : ascii (default); binary is rejected
    endianness : native only
    precision  : double only

  Partial output:
    If the pass fails, the emitted document holds the header and every
    step completed before the failure.
*/
#pragma once

#include "meshstep/envelope.hpp"
#include "meshstep/writer.hpp"

#include <fstream>
#include <string>

#include <yaml-cpp/yaml.h>

namespace meshstep {

class DebugWriter : public Writer
{
public:
    /* An empty path keeps the envelope in memory only. */
    DebugWriter(std::string path, Logger& log);

    WriterProperties properties() const override { return WriterProperties{}; }

    const YAML::Node& envelope() const { return envelope_; }
    std::string text() const { return envelope::emit(envelope_); }

    int steps_written() const { return nsteps_; }

protected:
    void apply_settings(const WriterSettings& settings) override;
    void open() override;
    void write_header(const HeaderType& header) override;
    void write_step(const StepRecordType& record) override;
    void finalize() override;

private:
    std::string   path_;
    std::ofstream out_;
    YAML::Node    envelope_;
    int           nsteps_ = 0;
};

} // namespace meshstep
