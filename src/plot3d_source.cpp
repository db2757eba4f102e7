/*─────────────────────────────────────────────────────────────
  File: src/plot3d_source.cpp
  Plot3D grid + function files as a Source
─────────────────────────────────────────────────────────────*/
#include "meshstep/plot3d_source.hpp"
#include "meshstep/errors.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace meshstep {

namespace {

const char* const kBasisName    = "mesh";
const char* const kGeometryName = "Geometry";

/* Corner points with the first axis fastest: 2, 4 or 8 of them. */
std::vector<Point> block_corners(const Plot3DBlock& b, int pardim)
{
    std::vector<Point> out;
    const long long ni = b.ni(), nj = b.nj();
    const long long is[2] = { 0, b.ni() - 1 };
    const long long js[2] = { 0, pardim >= 2 ? b.nj() - 1 : 0 };
    const long long ks[2] = { 0, pardim >= 3 ? b.nk() - 1 : 0 };

    for (int k = 0; k < (pardim >= 3 ? 2 : 1); ++k)
        for (int j = 0; j < (pardim >= 2 ? 2 : 1); ++j)
            for (int i = 0; i < 2; ++i) {
                const auto p = static_cast<std::size_t>(ks[k] * ni * nj + js[j] * ni + is[i]);
                out.push_back(Point{ b.x[p], b.y[p], b.z[p] });
            }
    return out;
}

} // anonymous namespace

/*=====================================================================
  Plot3DSource::Plot3DSource

  Reads the grid and the layout records of every function file. All
  function files must have the grid's block count, block sizes and
  one common variable count.
=====================================================================*/
Plot3DSource::Plot3DSource(std::string grid_path, std::vector<std::string> function_paths,
                           Logger& log)
    : grid_path_(std::move(grid_path)), function_paths_(std::move(function_paths)), log_(log)
{
    blocks_ = read_plot3d_grid(grid_path_);
    log_.debug("Plot3D grid " + grid_path_ + ": " + std::to_string(blocks_.size()) + " block(s)");

    bool flat_k = !blocks_.empty();
    bool flat_j = !blocks_.empty();
    for (const auto& b : blocks_) {
        flat_k = flat_k && b.nk() == 1;
        flat_j = flat_j && b.nj() == 1;
    }
    pardim_ = flat_k ? (flat_j ? 1 : 2) : 3;

    for (std::size_t f = 0; f < function_paths_.size(); ++f) {
        const auto layout = read_plot3d_function_layout(function_paths_[f]);
        if (layout.size() != blocks_.size())
            throw std::runtime_error("Function file " + function_paths_[f] + " has " +
                                     std::to_string(layout.size()) + " block(s), grid has " +
                                     std::to_string(blocks_.size()));
        for (std::size_t b = 0; b < layout.size(); ++b) {
            if (layout[b].vtxSize != blocks_[b].vtxSize)
                throw std::runtime_error("Function file " + function_paths_[f] +
                                         ": block " + std::to_string(b + 1) +
                                         " does not match the grid");
            const int nv = layout[b].nvars;
            if ((f > 0 || b > 0) && nv != nvars_)
                throw std::runtime_error("Function file " + function_paths_[f] +
                                         ": inconsistent variable count " + std::to_string(nv));
            nvars_ = nv;
        }
    }

    geometry_.name = kGeometryName;
    geometry_.type = FieldType::geometry(3);
    geometry_.splittable = false;

    for (int v = 0; v < nvars_; ++v) {
        Field f;
        f.name = "var" + std::to_string(v + 1);
        f.type = FieldType::scalar();
        fields_.push_back(f);
    }
}

SourceProperties Plot3DSource::properties() const
{
    SourceProperties p;
    p.instantaneous     = function_paths_.empty();
    p.globally_keyed    = true;
    p.discrete_topology = true;
    p.single_basis      = true;
    p.single_zoned      = blocks_.size() == 1;
    p.step_interpretation = StepInterpretation::Generic;
    return p;
}

std::vector<Basis> Plot3DSource::bases() const
{
    Basis b;
    b.name = kBasisName;
    b.pardim = pardim_;
    return { b };
}

void Plot3DSource::check_basis(const Basis& basis) const
{
    if (basis.name != kBasisName)
        throw ContractViolation("basis '" + basis.name + "' is not provided by " + grid_path_);
}

Basis Plot3DSource::basis_of(const Field& field) const
{
    bool known = field.name == geometry_.name;
    for (const Field& f : fields_)
        known = known || f.name == field.name;
    if (!known)
        throw ContractViolation("field '" + field.name + "' is not provided by " + grid_path_);
    return bases().front();
}

std::vector<Field> Plot3DSource::geometries(const Basis& basis) const
{
    check_basis(basis);
    return { geometry_ };
}

std::vector<Field> Plot3DSource::fields(const Basis& basis) const
{
    check_basis(basis);
    return fields_;
}

std::vector<Zone> Plot3DSource::zones() const
{
    std::vector<Zone> out;
    for (const auto& b : blocks_) {
        Zone z;
        z.key = b.name;
        z.shape = shape_from_pardim(pardim_);
        z.coords = block_corners(b, pardim_);
        out.push_back(std::move(z));
    }
    return out;
}

Sequence<Step> Plot3DSource::steps()
{
    const int nsteps = function_paths_.empty() ? 1 : static_cast<int>(function_paths_.size());
    auto next = std::make_shared<int>(0);
    return Sequence<Step>([nsteps, next](Step& out) {
        if (*next >= nsteps)
            return false;
        out = Step{};
        out.index = (*next)++;
        return true;
    });
}

const std::string& Plot3DSource::function_path(const Step& step) const
{
    if (step.index < 0 || step.index >= static_cast<int>(function_paths_.size()))
        throw ContractViolation("step " + std::to_string(step.index) + " is not provided by " +
                                grid_path_);
    return function_paths_[static_cast<std::size_t>(step.index)];
}

bool Plot3DSource::topology_updates(const Step& /*step*/, const Basis& basis)
{
    check_basis(basis);
    const bool first = !topology_reported_;
    topology_reported_ = true;
    return first;
}

bool Plot3DSource::field_updates(const Step& step, const Field& field)
{
    if (field.name == geometry_.name) {
        const bool first = !geometry_reported_;
        geometry_reported_ = true;
        return first;
    }
    basis_of(field);

    const std::string& path = function_path(step);
    auto it = last_file_.find(field.name);
    if (it != last_file_.end() && it->second == path)
        return false;
    last_file_[field.name] = path;
    return true;
}

const Plot3DBlock& Plot3DSource::block(const Zone& zone) const
{
    for (const auto& b : blocks_)
        if (b.name == zone.key)
            return b;
    throw ContractViolation("zone '" + zone.key + "' is not provided by " + grid_path_);
}

Topology Plot3DSource::topology(const Step& /*step*/, const Basis& basis, const Zone& zone)
{
    check_basis(basis);
    return Topology::structured(block(zone).vtxSize, pardim_);
}

/* One function file is kept in memory; steps usually ask for it field by field. */
const std::vector<Plot3DFunction>& Plot3DSource::function_blocks(const std::string& path)
{
    if (path != cached_path_) {
        cached_blocks_ = read_plot3d_function(path);
        cached_path_ = path;
        log_.debug("Loaded Plot3D function file " + path);
    }
    return cached_blocks_;
}

FieldData Plot3DSource::field_data(const Step& step, const Field& field, const Zone& zone)
{
    const Plot3DBlock& b = block(zone);
    if (field.name == geometry_.name)
        return FieldData::from_components({ b.x, b.y, b.z });

    int var = -1;
    for (std::size_t v = 0; v < fields_.size(); ++v)
        if (fields_[v].name == field.name)
            var = static_cast<int>(v);
    if (var < 0)
        throw ContractViolation("field '" + field.name + "' is not provided by " + grid_path_);

    const std::string& path = function_path(step);
    const auto& fblocks = function_blocks(path);
    const auto bi = static_cast<std::size_t>(b.idx - 1);
    if (bi >= fblocks.size() || fblocks[bi].vtxSize != b.vtxSize)
        throw FetchFailure("function file " + path + " does not match grid block " + b.name);
    if (var >= fblocks[bi].nvars)
        throw FetchFailure("function file " + path + " has no variable " +
                           std::to_string(var + 1) + " in " + b.name);

    return FieldData(1, fblocks[bi].variable(var));
}

} // namespace meshstep
