/*─────────────────────────────────────────────────────────────
  File: src/filter_unstructured.cpp
  ForceUnstructured: structured topologies as explicit cells
─────────────────────────────────────────────────────────────*/
#include "meshstep/errors.hpp"
#include "meshstep/filters.hpp"

namespace meshstep {

/*=====================================================================
  to_unstructured

  Cells of a structured block, first parametric axis fastest. Corner c
  of a cell sits at offset (c & 1, (c >> 1) & 1, (c >> 2) & 1), the
  tensor order cgns_writer.cpp permutes to element node order.
=====================================================================*/
Topology to_unstructured(const Topology& topo)
{
    if (!topo.is_structured())
        return topo;

    const int pd = topo.pardim();
    const auto& vtx = topo.vtxSize();
    const long long ni = vtx[0], nj = vtx[1];

    long long ncell[3] = { 1, 1, 1 };
    for (int d = 0; d < pd; ++d)
        ncell[d] = vtx[d] - 1;

    const int npc = Topology::nodes_per_cell(topo.shape());
    std::vector<long long> cells;
    cells.reserve(static_cast<std::size_t>(ncell[0] * ncell[1] * ncell[2] * npc));

    for (long long k = 0; k < ncell[2]; ++k)
        for (long long j = 0; j < ncell[1]; ++j)
            for (long long i = 0; i < ncell[0]; ++i)
                for (int c = 0; c < npc; ++c) {
                    const long long ci = i + (c & 1);
                    const long long cj = j + ((c >> 1) & 1);
                    const long long ck = k + ((c >> 2) & 1);
                    cells.push_back(ci + ni * (cj + nj * ck));
                }

    return Topology::unstructured(topo.shape(), topo.num_nodes(), std::move(cells));
}

ForceUnstructured::ForceUnstructured(std::unique_ptr<Source> source, Logger& log)
    : Passthrough(std::move(source), log)
{
    if (!src_->properties().discrete_topology)
        throw ContractViolation("ForceUnstructured needs a source with discrete topology");
}

Topology ForceUnstructured::topology(const Step& step, const Basis& basis, const Zone& zone)
{
    return to_unstructured(src_->topology(step, basis, zone));
}

} // namespace meshstep
