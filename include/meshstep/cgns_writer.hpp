/*
  File: include/meshstep/cgns_writer.hpp

  CgnsWriter: time-accurate CGNS output through the CGNS C API.

  File layout (one Base_t named "Base"):

    Base
    ├── SimulationType          TimeAccurate | NonTimeAccurate
    ├── BaseIterativeData       TimeValues, IterationValues (one per step)
    └── <zone key>              Zone_t, created from its first topology
        ├── GridCoordinates     first geometry
        ├── GridCoordinates<i>  geometry that changed at step i
        ├── Elements            unstructured zones only
        ├── FlowSolution<i>     nodal fields written at step i
        ├── FlowCellSolution<i> cellwise fields written at step i
        └── ZoneIterativeData   GridCoordinatesPointers,
                                FlowSolutionPointers,
                                FlowCellSolutionPointers

  A step where nothing changed for a zone (the "no update" markers)
  writes no new node; its pointer entries name the node written last.
  When some but not all fields of one location change, the new
  solution node carries the unchanged fields forward, so every pointer
  names a complete solution.

  Settings:
    mode       : binary (default); ascii is rejected
    endianness : native only (byte order is the CGNS library's)
    precision  : single -> RealSingle arrays, double -> RealDouble

  Properties:
    require_single_basis

  Rejected at serialization (SerializationFailure):
    - eigenmode fields
    - names longer than 32 characters
    - topologies whose dimension differs from the basis
    - a zone whose node count changes between steps
*/
#pragma once

#include "meshstep/cgns_file.hpp"
#include "meshstep/writer.hpp"

#include <map>
#include <string>
#include <vector>

namespace meshstep {

class CgnsWriter : public Writer
{
public:
    CgnsWriter(std::string path, Logger& log);

    WriterProperties properties() const override
    {
        WriterProperties p;
        p.require_single_basis = true;
        return p;
    }

protected:
    void apply_settings(const WriterSettings& settings) override;
    void open() override;
    void write_header(const HeaderType& header) override;
    void write_step(const StepRecordType& record) override;
    void finalize() override;

private:
    /* Per-zone bookkeeping, keyed by zone key. */
    struct ZoneState
    {
        std::string name;                 ///< Zone_t name
        int         idx = 0;              ///< 1-based Zone_t index, 0 until created
        Topology    topology;
        std::string grid;                 ///< last GridCoordinates_t written
        std::string node_sol;             ///< last Vertex FlowSolution_t written
        std::string cell_sol;             ///< last CellCenter FlowSolution_t written
        std::map<std::string, FieldData> node_cache;
        std::map<std::string, FieldData> cell_cache;
        std::vector<std::string> grid_ptrs;
        std::vector<std::string> node_ptrs;
        std::vector<std::string> cell_ptrs;
    };

    ZoneState& zone_state(const Zone& zone);
    void create_zone(ZoneState& zs, const Topology& topo);
    void write_geometry(ZoneState& zs, const FieldData& data, int step_index);
    void write_solution(ZoneState& zs, bool cellwise, int step_index);
    void write_grid_array(const std::string& name, const std::vector<double>& values,
                          const Topology& topo);
    void write_pointers(const std::string& name, const std::vector<std::string>& ptrs);
    void write_iterative_data();

    DataType_t data_type() const;

    std::string path_;
    CgnsFile    file_;
    Precision   precision_ = Precision::Double;

    int               cgbas_    = 0;
    int               cell_dim_ = 3;
    bool              have_cell_fields_ = false;
    std::string       geometry_;
    std::map<std::string, bool> cellwise_;  ///< declared non-geometry fields
    std::vector<std::string> field_order_;
    std::vector<std::string> zone_order_;
    std::map<std::string, ZoneState> zones_;
    std::vector<double> times_;
    std::vector<int>    iterations_;
};

} // namespace meshstep
