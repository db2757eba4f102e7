/*─────────────────────────────────────────────────────────────
  File: src/debug_writer.cpp
  Canonical envelope writer
─────────────────────────────────────────────────────────────*/
#include "meshstep/debug_writer.hpp"

#include <stdexcept>
#include <utility>

namespace meshstep {

DebugWriter::DebugWriter(std::string path, Logger& log)
    : Writer(log), path_(std::move(path))
{}

void DebugWriter::apply_settings(const WriterSettings& settings)
{
    if (settings.mode && *settings.mode != OutputMode::Ascii)
        throw std::invalid_argument("Debug writer only supports mode 'ascii', got '" +
                                    output_mode_to_string(*settings.mode) + "'");
    if (settings.endianness != Endianness::Native)
        throw std::invalid_argument("Debug writer has no byte order, got endianness '" +
                                    endianness_to_string(settings.endianness) + "'");
    if (settings.precision != Precision::Double)
        throw std::invalid_argument("Debug writer only supports precision 'double', got '" +
                                    precision_to_string(settings.precision) + "'");
}

/*
  The file is created here rather than in finalize() so that an
  unwritable path fails before any Source call is made.
*/
void DebugWriter::open()
{
    envelope_ = YAML::Node();
    nsteps_ = 0;

    if (path_.empty())
        return;
    out_.open(path_, std::ios::out | std::ios::trunc);
    if (!out_)
        throw std::runtime_error("Cannot open output file: " + path_);
    log_.debug("Envelope output: " + path_);
}

void DebugWriter::write_header(const HeaderType& header)
{
    envelope_ = envelope::header_node(header);
}

void DebugWriter::write_step(const StepRecordType& record)
{
    envelope_["steps"].push_back(envelope::step_node(record));
    ++nsteps_;
}

void DebugWriter::finalize()
{
    if (!out_.is_open())
        return;

    out_ << envelope::emit(envelope_);
    out_.close();
    if (out_.fail())
        throw SerializationFailure("could not write " + path_);
    log_.info("Wrote " + path_ + " (" + std::to_string(nsteps_) + " step(s))");
}

} // namespace meshstep
