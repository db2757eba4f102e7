/*─────────────────────────────────────────────────────────────
  File: src/cgns_file.cpp

  CGNS file handle lifetime.

  This file implements:
    - CgnsFile::open / CgnsFile::close
    - The destructor, which closes without throwing
─────────────────────────────────────────────────────────────*/
#include "meshstep/cgns_file.hpp"

#include <iostream>
#include <stdexcept>

namespace meshstep {

void CgnsFile::open(const std::string& path, int mode)
{
    if (isOpen_) close();

    CG_CALL(cg_open(path.c_str(), mode, &cgfile_), std::runtime_error,
            "CGNS: cannot open file " + path);
    isOpen_ = true;
    path_ = path;
}

void CgnsFile::close()
{
    if (!isOpen_) return;
    isOpen_ = false;
    CG_CALL(cg_close(cgfile_), std::runtime_error, "CGNS: cg_close failed for " + path_);
}

/*=====================================================================
  CgnsFile::release

  Used by the destructor and by error paths that already carry an
  exception; a failing cg_close is reported on stderr with the CGNS
  diagnostic.
=====================================================================*/
void CgnsFile::release() noexcept
{
    if (!isOpen_) return;
    isOpen_ = false;
    if (cg_close(cgfile_) != CG_OK)
        std::cerr << "CGNS: cg_close failed for " << path_ << ": " << cg_get_error() << '\n';
}

CgnsFile::~CgnsFile()
{
    release();
}

} // namespace meshstep
