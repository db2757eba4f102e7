/*─────────────────────────────────────────────────────────────
  File: src/logger.cpp

  Minimal console + file logger.

  Features:
    - Writes to stdout (always) and optionally to a log file
    - Thread-safe: write() is protected by a mutex
    - Minimum level threshold (DEBUG < INFO < WARN < ERR)
    - ANSI color tags for interactive terminals only
        * DEBUG -> cyan background
        * INFO  -> green background
        * WARN  -> yellow background
        * ERROR -> red background
      When stdout is not a TTY (e.g., redirected to a file), the logger
      falls back to plain, uncolored tags so output remains readable.

  Notes:
    - Color detection uses isatty(fileno(stdout)) from unistd.h.
    - File logs always use plain tags (no escape codes).
─────────────────────────────────────────────────────────────*/
#include "meshstep/logger.hpp"
#include <cstdio>            // fileno
#include <unistd.h>          // isatty

namespace meshstep {

#define BG_CYN  "\033[106m"
#define BG_GRN  "\033[102m"
#define BG_YEL  "\033[103m"
#define BG_RED  "\033[101m"
#define RESET   "\033[0m"

/*=====================================================================
  bare_tag

  Plain (uncolored) tag, used for the file log and for non-TTY stdout.
=====================================================================*/
static const char* bare_tag(Logger::Level l)
{
    switch (l) {
        case Logger::Level::DEBUG: return "DEBUG";
        case Logger::Level::INFO : return "INFO";
        case Logger::Level::WARN : return "WARN";
        case Logger::Level::ERR  : return "ERROR";
    }
    return "UNKWN";
}

const char* Logger::level_tag(Level l)
{
    /* color only if writing to an interactive terminal         */
    if (!isatty(fileno(stdout))) return bare_tag(l);

    switch (l) {
        case Level::DEBUG: return BG_CYN "DEBUG" RESET;
        case Level::INFO : return BG_GRN "INFO" RESET;
        case Level::WARN : return BG_YEL "WARN" RESET;
        case Level::ERR  : return BG_RED "ERROR" RESET;
    }
    return "UNKWN";
}

/*=====================================================================
  Logger lifecycle

  An empty path means console-only logging (used by the tests).
=====================================================================*/
Logger::Logger(const std::string& p)
{
    if (!p.empty())
        file_.open(p, std::ios::trunc);
}

Logger::~Logger(){ if(file_.is_open()) file_.close(); }

void Logger::set_level(Level l)
{
    std::lock_guard<std::mutex> g(mtx_);
    min_ = l;
}

Logger::Level Logger::min_level() const
{
    std::lock_guard<std::mutex> g(mtx_);
    return min_;
}

/*=====================================================================
  Logger::write

  Formatting:
    "<TAG>  <message>\n"
=====================================================================*/
void Logger::write(Level lvl,const std::string& msg)
{
    std::lock_guard<std::mutex> g(mtx_);
    if (static_cast<int>(lvl) < static_cast<int>(min_))
        return;
    std::string line = std::string(level_tag(lvl)) + "  " + msg + '\n';
    std::cout << line << std::flush;         // colorised
    if (file_.is_open()) file_ << bare_tag(lvl) << "  " << msg << '\n';
}

} // namespace meshstep
