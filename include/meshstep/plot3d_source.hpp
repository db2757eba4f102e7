/*
  File: include/meshstep/plot3d_source.hpp

  Plot3DSource: a Source over one Plot3D grid file and an optional list
  of Plot3D function files, one per step.

  What it exposes:
    - one basis "mesh"; its parametric dimension is 3, or lower when
      every block is flat (nk == 1, then nj == 1)
    - geometry field "Geometry" (3 components, Generic coordinates)
    - scalar nodal fields var1..varN, N taken from the function files
    - zones "block-1".."block-M" with their corner points as coords
    - steps 0..F-1 for F function files, or a single step 0 without any
      (the source is then instantaneous)

  Change detection:
    - topology and geometry change only on first consumption
    - a varK field changes when its step's function file differs from
      the file of the step last reported for it

  The grid is read once at construction; function files are read on
  demand, one at a time.
*/
#pragma once

#include "meshstep/logger.hpp"
#include "meshstep/plot3d_io.hpp"
#include "meshstep/source.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace meshstep {

class Plot3DSource : public Source
{
public:
    /*
      Throws std::runtime_error when the grid cannot be read, or when the
      function files disagree on their block layout or with the grid.
    */
    Plot3DSource(std::string grid_path, std::vector<std::string> function_paths, Logger& log);

    SourceProperties properties() const override;

    std::vector<Basis> bases() const override;
    Basis basis_of(const Field& field) const override;
    std::vector<Field> geometries(const Basis& basis) const override;
    std::vector<Field> fields(const Basis& basis) const override;
    std::vector<Zone> zones() const override;

    Sequence<Step> steps() override;

    bool topology_updates(const Step& step, const Basis& basis) override;
    bool field_updates(const Step& step, const Field& field) override;

    Topology  topology(const Step& step, const Basis& basis, const Zone& zone) override;
    FieldData field_data(const Step& step, const Field& field, const Zone& zone) override;

private:
    void check_basis(const Basis& basis) const;
    const Plot3DBlock& block(const Zone& zone) const;
    const std::string& function_path(const Step& step) const;
    const std::vector<Plot3DFunction>& function_blocks(const std::string& path);

    std::string              grid_path_;
    std::vector<std::string> function_paths_;
    Logger&                  log_;

    std::vector<Plot3DBlock> blocks_;
    int                      pardim_ = 3;
    int                      nvars_  = 0;
    Field                    geometry_;
    std::vector<Field>       fields_;

    bool                               topology_reported_ = false;
    bool                               geometry_reported_ = false;
    std::map<std::string, std::string> last_file_;   ///< field name -> last reported file

    std::string                 cached_path_;
    std::vector<Plot3DFunction> cached_blocks_;
};

} // namespace meshstep
