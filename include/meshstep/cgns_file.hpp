/*
  File: include/meshstep/cgns_file.hpp

  RAII owner of one CGNS file handle.

  This header defines:
    - meshstep::CgnsFile : opens a CGNS file with cg_open and guarantees
                           cg_close, also when the owner unwinds

  Usage:
    - cgns_writer.cpp : CG_MODE_WRITE handle for the whole pass
    - tests           : CG_MODE_READ handle to inspect what was written

  Sizes / types:
    - CGNS file and base identifiers are int, as in the C API.
    - The base index is 1-based; meshstep writes exactly one base.
*/
#pragma once

#include "meshstep/common.hpp"

#include <string>

extern "C" {
    #include <cgnslib.h>          // CGNS C API; provides cg_open/cg_close/...
}

namespace meshstep {

class CgnsFile
{
public:
    CgnsFile() = default;
    ~CgnsFile();    ///< ensures cg_close

    CgnsFile(const CgnsFile&) = delete;
    CgnsFile& operator=(const CgnsFile&) = delete;

    /*
      open(path, mode):
        - Closes any previously opened file first
        - mode is CG_MODE_READ, CG_MODE_WRITE or CG_MODE_MODIFY
        - Throws std::runtime_error (via CG_CALL) when cg_open fails
    */
    void open(const std::string& path, int mode);

    /*
      close():
        - cg_close if open; safe to call multiple times
        - Throws std::runtime_error when cg_close reports an error;
          the handle is considered closed either way
    */
    void close();

    /* Close without throwing; a failure is reported on stderr. */
    void release() noexcept;

    bool is_open() const { return isOpen_; }
    int  file_id() const { return cgfile_; }
    const std::string& path() const { return path_; }

private:
    int         cgfile_ = -1;
    bool        isOpen_ = false;
    std::string path_;
};

} // namespace meshstep
