/*─────────────────────────────────────────────────────────────
  File: include/meshstep/logger.hpp

  Logger: small thread-safe logging utility.

  This class is used in:
    - convert_main.cpp (CLI orchestration + fatal error reporting)
    - source_dump.cpp (open/finish/error reporting)
    - writer.hpp (pass progress, secondary failures during finalize)
    - filters (attachment and contract warnings)
    - debug_writer.cpp / cgns_writer.cpp (output summary)

  Output behavior:
    - Writes a formatted line to stdout
    - Writes a plain (non-ANSI) line to a log file
    - Guards both outputs with a mutex to prevent interleaving
    - Drops messages below the configured minimum level
─────────────────────────────────────────────────────────────*/
#pragma once

#include <fstream>    // std::ofstream (file output stream)
#include <iostream>   // std::cout (console output stream)
#include <mutex>      // std::mutex, std::lock_guard (thread synchronization)
#include <string>     // std::string (message storage/formatting)

namespace meshstep {

class Logger
{
public:
    /*------------------------------------------------------------------
      Level: severity enum for log messages, in increasing order.

      Values:
        - DEBUG : filter attachment, per-record detail
        - INFO  : normal status/progress messages
        - WARN  : recoverable issues or noteworthy conditions
        - ERR   : errors; used in catch blocks and fatal paths
    ------------------------------------------------------------------*/
    enum class Level { DEBUG, INFO, WARN, ERR };

    /*------------------------------------------------------------------
      Construct a Logger that writes to a file path.

      Parameter:
        logfile_path : filesystem path (UTF-8 string); an empty path
                       disables the file output

      Effects:
        - Opens/truncates the log file (implementation uses std::ios::trunc)
        - After construction, write() is valid
    ------------------------------------------------------------------*/
    explicit Logger(const std::string& logfile_path);
    ~Logger(); // Destructor. Closes the file stream if open.

    /*------------------------------------------------------------------
      write: thread-safe logging to both stdout and the log file.

      Parameters:
        level : Logger::Level
        msg   : message text (already formatted by caller)

      Messages below min_level() are discarded on both outputs.
    ------------------------------------------------------------------*/
    void write(Level level, const std::string& msg);

    void debug(const std::string& m) { write(Level::DEBUG, m); }
    void info (const std::string& m) { write(Level::INFO , m); }
    void warn (const std::string& m) { write(Level::WARN , m); }
    void error(const std::string& m) { write(Level::ERR  , m); }

    void  set_level(Level l);
    Level min_level() const;

    /*------------------------------------------------------------------
      level_tag: maps severity to a label string.

      Returns a coloured tag when stdout is a TTY and a plain one
      otherwise. The pointer refers to a string literal.
    ------------------------------------------------------------------*/
    static const char* level_tag(Level);

private:
    std::ofstream      file_;
    mutable std::mutex mtx_;
    Level              min_ = Level::INFO;
};

} // namespace meshstep
