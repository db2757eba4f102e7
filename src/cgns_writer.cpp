/*─────────────────────────────────────────────────────────────
  File: src/cgns_writer.cpp

  Time-accurate CGNS output.

  This file implements:
    - CgnsWriter settings validation
    - Lazy Zone_t creation (structured or unstructured + Elements)
    - Geometry output: GridCoordinates, then one GridCoordinates_t per
      later change
    - Field output: one FlowSolution_t per (zone, step, location) that
      changed
    - BaseIterativeData / ZoneIterativeData on finalize, with pointer
      arrays naming the node valid at each step

  Data flow per step (write_step):
    1) Topology records  -> create zones / check node counts
    2) Geometry record   -> coordinates
    3) Field records     -> per-zone caches, marked dirty by location
    4) Dirty locations   -> new FlowSolution_t holding every cached field
    5) Pointer entries   -> appended for every created zone

  Scope and assumptions:
    - One basis, one Base_t.
    - Structured zones use the basis' parametric dimension as index
      dimension.
    - Unstructured connectivity arrives in tensor order (first
      parametric axis fastest) and is permuted to the CGNS element
      node order here.
─────────────────────────────────────────────────────────────*/
#include "meshstep/cgns_writer.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace meshstep {

namespace {

constexpr std::size_t kNameLength = 32;     ///< CGNS node name limit

const char* const kCoordNames[3] = { "CoordinateX", "CoordinateY", "CoordinateZ" };
const char* const kCompSuffix[3] = { "X", "Y", "Z" };

std::string checked_name(const std::string& name)
{
    if (name.empty() || name.size() > kNameLength)
        throw SerializationFailure("CGNS node name '" + name + "' must have 1 to 32 characters");
    std::string out = name;
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

/* Tensor-order corner index -> CGNS element node order. */
std::vector<int> cgns_node_order(Shape s)
{
    switch (s) {
        case Shape::Line:          return { 0, 1 };
        case Shape::Quadrilateral: return { 0, 1, 3, 2 };
        case Shape::Hexahedron:    return { 0, 1, 3, 2, 4, 5, 7, 6 };
    }
    return {};
}

ElementType_t cgns_element_type(Shape s)
{
    switch (s) {
        case Shape::Line:          return BAR_2;
        case Shape::Quadrilateral: return QUAD_4;
        case Shape::Hexahedron:    return HEXA_8;
    }
    return ElementTypeNull;
}

/*
  Component array names for a field:
    1 component  : NAME
    2-3          : NAMEX, NAMEY, NAMEZ
    more         : NAME_0, NAME_1, ...
*/
std::vector<std::string> component_names(const std::string& name, int ncomps)
{
    std::vector<std::string> out;
    for (int c = 0; c < ncomps; ++c) {
        if (ncomps == 1)
            out.push_back(name);
        else if (ncomps <= 3)
            out.push_back(name + kCompSuffix[c]);
        else
            out.push_back(name + "_" + std::to_string(c));
    }
    for (auto& n : out)
        n = checked_name(n);
    return out;
}

/* Values in the precision selected by the settings. */
struct ArrayBuffer
{
    std::vector<double> d;
    std::vector<float>  f;

    ArrayBuffer(const std::vector<double>& values, Precision p)
    {
        if (p == Precision::Single)
            f.assign(values.begin(), values.end());
        else
            d = values;
    }

    const void* data() const
    {
        return f.empty() ? static_cast<const void*>(d.data())
                         : static_cast<const void*>(f.data());
    }
};

} // anonymous namespace

CgnsWriter::CgnsWriter(std::string path, Logger& log)
    : Writer(log), path_(std::move(path))
{}

void CgnsWriter::apply_settings(const WriterSettings& settings)
{
    if (settings.mode && *settings.mode != OutputMode::Binary)
        throw std::invalid_argument("CGNS writer only supports mode 'binary', got '" +
                                    output_mode_to_string(*settings.mode) + "'");
    if (settings.endianness != Endianness::Native)
        throw std::invalid_argument("CGNS writer leaves byte order to the CGNS library, got "
                                    "endianness '" + endianness_to_string(settings.endianness) + "'");
    precision_ = settings.precision;
}

DataType_t CgnsWriter::data_type() const
{
    return precision_ == Precision::Single ? RealSingle : RealDouble;
}

void CgnsWriter::open()
{
    cgbas_ = 0;
    cell_dim_ = 3;
    have_cell_fields_ = false;
    geometry_.clear();
    cellwise_.clear();
    field_order_.clear();
    zone_order_.clear();
    zones_.clear();
    times_.clear();
    iterations_.clear();

    file_.open(path_, CG_MODE_WRITE);
    log_.debug("CGNS output: " + path_ + " (" + precision_to_string(precision_) + " precision)");
}

/*=====================================================================
  CgnsWriter::write_header

  Creates the Base_t and records the declared fields and zones. No
  Zone_t is created yet: its size is known only from its first
  topology.
=====================================================================*/
void CgnsWriter::write_header(const HeaderType& header)
{
    const int fn = file_.file_id();

    int phys_dim = 3;
    if (header.geometry_basis) {
        cell_dim_ = header.geometry_basis->pardim;
        phys_dim = std::max(cell_dim_, header.geometry.num_comps());
        geometry_ = header.geometry.name;
    }

    CG_CALL(cg_base_write(fn, "Base", cell_dim_, phys_dim, &cgbas_), SerializationFailure,
            "cg_base_write failed");
    CG_CALL(cg_simulation_type_write(fn, cgbas_,
                header.properties.instantaneous ? NonTimeAccurate : TimeAccurate),
            SerializationFailure, "cg_simulation_type_write failed");

    for (const auto& entry : header.bases) {
        for (const Field& f : entry.fields) {
            if (f.is_eigenmode())
                throw SerializationFailure("CGNS output cannot hold eigenmode field '" + f.name + "'");
            component_names(f.name, f.num_comps());
            cellwise_[f.name] = f.cellwise;
            field_order_.push_back(f.name);
            have_cell_fields_ = have_cell_fields_ || f.cellwise;
        }
    }

    std::set<std::string> names;
    for (const Zone& z : header.zones) {
        ZoneState zs;
        zs.name = checked_name(z.key);
        if (!names.insert(zs.name).second)
            throw SerializationFailure("zone keys map to the same CGNS name '" + zs.name + "'");
        zone_order_.push_back(z.key);
        zones_.emplace(z.key, std::move(zs));
    }
}

CgnsWriter::ZoneState& CgnsWriter::zone_state(const Zone& zone)
{
    auto it = zones_.find(zone.key);
    if (it == zones_.end())
        throw ContractViolation("zone '" + zone.key + "' was not declared by the source");
    return it->second;
}

/*=====================================================================
  CgnsWriter::create_zone
=====================================================================*/
void CgnsWriter::create_zone(ZoneState& zs, const Topology& topo)
{
    const int fn = file_.file_id();
    if (topo.pardim() != cell_dim_)
        throw SerializationFailure("zone '" + zs.name + "' has dimension " +
                                   std::to_string(topo.pardim()) + ", base has " +
                                   std::to_string(cell_dim_));

    if (topo.is_structured()) {
        cgsize_t size[9] = { 0 };
        const int pd = topo.pardim();
        for (int d = 0; d < pd; ++d) {
            size[d]          = static_cast<cgsize_t>(topo.vtxSize()[d]);
            size[pd + d]     = static_cast<cgsize_t>(topo.vtxSize()[d] - 1);
            size[2 * pd + d] = 0;
        }
        CG_CALL(cg_zone_write(fn, cgbas_, zs.name.c_str(), size, Structured, &zs.idx),
                SerializationFailure, "cg_zone_write failed for " + zs.name);
    }
    else {
        cgsize_t size[3] = { static_cast<cgsize_t>(topo.num_nodes()),
                             static_cast<cgsize_t>(topo.num_cells()), 0 };
        CG_CALL(cg_zone_write(fn, cgbas_, zs.name.c_str(), size, Unstructured, &zs.idx),
                SerializationFailure, "cg_zone_write failed for " + zs.name);

        const std::vector<int> order = cgns_node_order(topo.shape());
        const std::size_t npc = order.size();
        const std::vector<long long>& cells = topo.cells();

        std::vector<cgsize_t> conn(cells.size());
        for (std::size_t c = 0; c < cells.size(); c += npc)
            for (std::size_t k = 0; k < npc; ++k)
                conn[c + k] = static_cast<cgsize_t>(cells[c + order[k]] + 1);

        int S = 0;
        CG_CALL(cg_section_write(fn, cgbas_, zs.idx, "Elements", cgns_element_type(topo.shape()),
                                 1, static_cast<cgsize_t>(topo.num_cells()), 0,
                                 conn.data(), &S),
                SerializationFailure, "cg_section_write failed for " + zs.name);
    }

    zs.topology = topo;

    log_.debug("CGNS zone '" + zs.name + "': " + std::to_string(topo.num_nodes()) + " nodes, " +
               std::to_string(topo.num_cells()) + " cells" +
               (topo.is_structured() ? " (structured)" : " (unstructured)"));
}

void CgnsWriter::write_grid_array(const std::string& name, const std::vector<double>& values,
                                  const Topology& topo)
{
    cgsize_t dims[3] = { 0 };
    int rank = 1;
    if (topo.is_structured()) {
        rank = topo.pardim();
        for (int d = 0; d < rank; ++d)
            dims[d] = static_cast<cgsize_t>(topo.vtxSize()[d]);
    }
    else {
        dims[0] = static_cast<cgsize_t>(topo.num_nodes());
    }

    const ArrayBuffer buf(values, precision_);
    CG_CALL(cg_array_write(name.c_str(), data_type(), rank, dims, buf.data()),
            SerializationFailure, "cg_array_write failed for " + name);
}

/*=====================================================================
  CgnsWriter::write_geometry

  The first geometry of a zone goes through cg_coord_write into
  "GridCoordinates"; later ones into a new GridCoordinates_t node.
=====================================================================*/
void CgnsWriter::write_geometry(ZoneState& zs, const FieldData& data, int step_index)
{
    const int fn = file_.file_id();
    if (static_cast<long long>(data.num_points()) != zs.topology.num_nodes())
        throw SerializationFailure("geometry of zone '" + zs.name + "' has " +
                                   std::to_string(data.num_points()) + " points, topology has " +
                                   std::to_string(zs.topology.num_nodes()) + " nodes");

    const int ncoords = std::min(data.num_comps(), 3);

    if (zs.grid.empty()) {
        for (int c = 0; c < ncoords; ++c) {
            const ArrayBuffer buf(data.component(c), precision_);
            int C = 0;
            CG_CALL(cg_coord_write(fn, cgbas_, zs.idx, data_type(), kCoordNames[c], buf.data(), &C),
                    SerializationFailure, "cg_coord_write failed for " + zs.name);
        }
        zs.grid = "GridCoordinates";
        return;
    }

    const std::string gname = checked_name("GridCoordinates" + std::to_string(step_index));
    int G = 0;
    CG_CALL(cg_grid_write(fn, cgbas_, zs.idx, gname.c_str(), &G),
            SerializationFailure, "cg_grid_write failed for " + zs.name);
    CG_CALL(cg_goto(fn, cgbas_, "Zone_t", zs.idx, "GridCoordinates_t", G, "end"),
            SerializationFailure, "cg_goto failed (GridCoordinates_t)");
    for (int c = 0; c < ncoords; ++c)
        write_grid_array(kCoordNames[c], data.component(c), zs.topology);
    zs.grid = gname;
}

/*=====================================================================
  CgnsWriter::write_solution

  Writes one FlowSolution_t holding every cached field of the given
  location, so that the solution named by a pointer entry is complete.
=====================================================================*/
void CgnsWriter::write_solution(ZoneState& zs, bool cellwise, int step_index)
{
    const int fn = file_.file_id();
    const std::map<std::string, FieldData>& cache = cellwise ? zs.cell_cache : zs.node_cache;
    const long long expected = cellwise ? zs.topology.num_cells() : zs.topology.num_nodes();

    const std::string sname =
        checked_name((cellwise ? "FlowCellSolution" : "FlowSolution") + std::to_string(step_index));
    int S = 0;
    CG_CALL(cg_sol_write(fn, cgbas_, zs.idx, sname.c_str(), cellwise ? CellCenter : Vertex, &S),
            SerializationFailure, "cg_sol_write failed for " + zs.name);

    for (const std::string& fname : field_order_) {
        auto it = cache.find(fname);
        if (it == cache.end())
            continue;
        const FieldData& data = it->second;
        if (static_cast<long long>(data.num_points()) != expected)
            throw SerializationFailure("field '" + fname + "' on zone '" + zs.name + "' has " +
                                       std::to_string(data.num_points()) + " values, expected " +
                                       std::to_string(expected));

        const std::vector<std::string> names = component_names(fname, data.num_comps());
        for (int c = 0; c < data.num_comps(); ++c) {
            const ArrayBuffer buf(data.component(c), precision_);
            int F = 0;
            CG_CALL(cg_field_write(fn, cgbas_, zs.idx, S, data_type(), names[c].c_str(),
                                   buf.data(), &F),
                    SerializationFailure, "cg_field_write failed for " + names[c]);
        }
    }

    (cellwise ? zs.cell_sol : zs.node_sol) = sname;
}

/*=====================================================================
  CgnsWriter::write_step
=====================================================================*/
void CgnsWriter::write_step(const StepRecordType& record)
{
    const int idx = record.step.index;

    for (const auto& t : record.topologies) {
        if (!t.updates)
            continue;
        ZoneState& zs = zone_state(*t.zone);
        if (zs.idx == 0) {
            create_zone(zs, *t.topology);
            continue;
        }
        if (t.topology->num_nodes() != zs.topology.num_nodes() ||
            t.topology->num_cells() != zs.topology.num_cells() ||
            t.topology->cells() != zs.topology.cells())
            throw SerializationFailure("topology of zone '" + zs.name +
                                       "' changed at step " + std::to_string(idx) +
                                       "; CGNS zones have a fixed size");
    }

    std::set<std::string> node_dirty, cell_dirty;
    for (const auto& d : record.data) {
        if (!d.updates)
            continue;
        ZoneState& zs = zone_state(*d.zone);
        if (zs.idx == 0)
            throw SerializationFailure("field '" + d.field.name + "' arrived for zone '" +
                                       zs.name + "' before its topology");

        if (d.field.name == geometry_) {
            write_geometry(zs, *d.data, idx);
            continue;
        }

        auto decl = cellwise_.find(d.field.name);
        if (decl == cellwise_.end())
            throw ContractViolation("field '" + d.field.name + "' was not declared by the source");

        if (decl->second) {
            zs.cell_cache[d.field.name] = *d.data;
            cell_dirty.insert(d.zone->key);
        }
        else {
            zs.node_cache[d.field.name] = *d.data;
            node_dirty.insert(d.zone->key);
        }
    }

    for (const auto& key : node_dirty)
        write_solution(zones_.at(key), false, idx);
    for (const auto& key : cell_dirty)
        write_solution(zones_.at(key), true, idx);

    for (const auto& key : zone_order_) {
        ZoneState& zs = zones_.at(key);
        if (zs.idx == 0)
            continue;
        zs.grid_ptrs.push_back(zs.grid);
        zs.node_ptrs.push_back(zs.node_sol);
        zs.cell_ptrs.push_back(zs.cell_sol);
    }

    times_.push_back(record.step.value ? *record.step.value : static_cast<double>(idx));
    iterations_.push_back(idx);
}

/* Character array of shape (32, n), each name space padded. */
void CgnsWriter::write_pointers(const std::string& name, const std::vector<std::string>& ptrs)
{
    std::string buf(kNameLength * ptrs.size(), ' ');
    for (std::size_t i = 0; i < ptrs.size(); ++i)
        buf.replace(i * kNameLength, ptrs[i].size(), ptrs[i]);

    cgsize_t dims[2] = { static_cast<cgsize_t>(kNameLength), static_cast<cgsize_t>(ptrs.size()) };
    CG_CALL(cg_array_write(name.c_str(), Character, 2, dims, buf.data()),
            SerializationFailure, "cg_array_write failed for " + name);
}

/*=====================================================================
  CgnsWriter::write_iterative_data

  BaseIterativeData and ZoneIterativeData for the completed steps.
=====================================================================*/
void CgnsWriter::write_iterative_data()
{
    const int fn = file_.file_id();
    if (cgbas_ == 0 || times_.empty())
        return;

    const int nsteps = static_cast<int>(times_.size());
    CG_CALL(cg_biter_write(fn, cgbas_, "BaseIterativeData", nsteps),
            SerializationFailure, "cg_biter_write failed");
    CG_CALL(cg_goto(fn, cgbas_, "BaseIterativeData_t", 1, "end"),
            SerializationFailure, "cg_goto failed (BaseIterativeData_t)");

    bool have_node_fields = false;
    for (const auto& kv : cellwise_)
        have_node_fields = have_node_fields || !kv.second;

    cgsize_t dim = nsteps;
    CG_CALL(cg_array_write("TimeValues", RealDouble, 1, &dim, times_.data()),
            SerializationFailure, "cg_array_write failed for TimeValues");
    CG_CALL(cg_array_write("IterationValues", Integer, 1, &dim, iterations_.data()),
            SerializationFailure, "cg_array_write failed for IterationValues");

    for (const auto& key : zone_order_) {
        const ZoneState& zs = zones_.at(key);
        if (zs.idx == 0)
            continue;

        CG_CALL(cg_ziter_write(fn, cgbas_, zs.idx, "ZoneIterativeData"),
                SerializationFailure, "cg_ziter_write failed for " + zs.name);
        CG_CALL(cg_goto(fn, cgbas_, "Zone_t", zs.idx, "ZoneIterativeData_t", 1, "end"),
                SerializationFailure, "cg_goto failed (ZoneIterativeData_t)");

        write_pointers("GridCoordinatesPointers", zs.grid_ptrs);
        if (have_node_fields)
            write_pointers("FlowSolutionPointers", zs.node_ptrs);
        if (have_cell_fields_)
            write_pointers("FlowCellSolutionPointers", zs.cell_ptrs);
    }
}

/*=====================================================================
  CgnsWriter::finalize

  Iterative data first, then cg_close. If writing the iterative data
  fails the handle is still released before the error propagates.
=====================================================================*/
void CgnsWriter::finalize()
{
    if (!file_.is_open())
        return;

    try {
        write_iterative_data();
    }
    catch (const std::exception&) {
        file_.release();
        throw;
    }
    file_.close();

    int created = 0;
    for (const auto& kv : zones_)
        created += kv.second.idx != 0 ? 1 : 0;
    log_.info("Wrote " + path_ + " (" + std::to_string(times_.size()) + " step(s), " +
              std::to_string(created) + " zone(s))");
}

} // namespace meshstep
