/*
  File: include/meshstep/plot3d_io.hpp

  Plot3D (structured multi-block) grid and function file I/O.

  This header defines:
    - meshstep::Plot3DBlock    : one block of a grid file (vertex counts + x/y/z)
    - meshstep::Plot3DFunction : one block of a function file (nvars planes)
    - read_plot3d_grid / read_plot3d_function : full readers
    - read_plot3d_function_layout             : dimension records only
    - write_plot3d_grid / write_plot3d_function : the inverse, for fixtures
                                                  and test data

  Usage:
    - plot3d_source.cpp : reads the grid once at construction, function
                          layouts at construction, function values on
                          demand (one file per step)
    - tests/            : writes small grids and function files

  File format (Fortran unformatted, host byte order):
    Each record is [uint32 nbytes][payload][uint32 nbytes].

    Grid file:
      1) int32 block count
      2) int32 (ni, nj, nk) per block
      3) per block: double x(1..N), y(1..N), z(1..N), N = ni*nj*nk

    Function file:
      1) int32 block count
      2) int32 (ni, nj, nk, nvars) per block
      3) per block: double var1(1..N), ..., varM(1..N)

  Point ordering inside a block: i fastest, then j, then k.
*/
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace meshstep {

struct Plot3DBlock
{
    int                      idx = 0;     ///< 1-based block index
    std::string              name;        ///< "block-N"
    std::array<long long, 3> vtxSize{};   ///< (Ni, Nj, Nk)
    std::vector<double>      x;
    std::vector<double>      y;
    std::vector<double>      z;

    long long ni() const { return vtxSize[0]; }
    long long nj() const { return vtxSize[1]; }
    long long nk() const { return vtxSize[2]; }
    long long num_points() const { return vtxSize[0] * vtxSize[1] * vtxSize[2]; }
};

struct Plot3DFunction
{
    std::array<long long, 3> vtxSize{};
    int                      nvars = 0;
    std::vector<double>      values;      ///< nvars planes of num_points() values

    long long num_points() const { return vtxSize[0] * vtxSize[1] * vtxSize[2]; }

    /* Plane of one variable (0-based). */
    std::vector<double> variable(int v) const;
};

/*
  read_plot3d_grid(path)

  Throws std::runtime_error on open failure, record marker mismatch or
  unexpected record sizes.
*/
std::vector<Plot3DBlock> read_plot3d_grid(const std::string& path);

/* Same errors as read_plot3d_grid. */
std::vector<Plot3DFunction> read_plot3d_function(const std::string& path);

/* Records 1 and 2 only; values stay empty. */
std::vector<Plot3DFunction> read_plot3d_function_layout(const std::string& path);

void write_plot3d_grid(const std::string& path, const std::vector<Plot3DBlock>& blocks);
void write_plot3d_function(const std::string& path, const std::vector<Plot3DFunction>& blocks);

} // namespace meshstep
