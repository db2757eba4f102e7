/*─────────────────────────────────────────────────────────────
  File: src/filter_strict.cpp

  Strict: Source contract verification.

  The declared descriptors are enumerated once, when the filter is
  attached. Per step, the answers to the update queries are kept so a
  fetch can be checked against them; they are cleared when the next
  step is pulled.
─────────────────────────────────────────────────────────────*/
#include "meshstep/filters.hpp"
#include "meshstep/errors.hpp"

namespace meshstep {

Strict::Strict(std::unique_ptr<Source> source, Logger& log)
    : Passthrough(std::move(source), log)
{
    for (const Basis& basis : src_->bases()) {
        if (!bases_.insert(basis.name).second)
            throw ContractViolation("basis '" + basis.name + "' is enumerated twice");

        for (const Field& g : src_->geometries(basis)) {
            if (!field_basis_.emplace(g.name, basis.name).second)
                throw ContractViolation("field '" + g.name + "' belongs to more than one basis");
            if (!g.is_geometry())
                throw ContractViolation("'" + g.name + "' is listed as a geometry but is not one");
            geometries_.insert(g.name);
        }
        for (const Field& f : src_->fields(basis))
            if (!field_basis_.emplace(f.name, basis.name).second)
                throw ContractViolation("field '" + f.name + "' belongs to more than one basis");
    }

    for (const Zone& zone : src_->zones())
        if (!zones_.insert(zone.key).second)
            throw ContractViolation("zone key '" + zone.key + "' is not unique");

    log_.debug("Strict: " + std::to_string(bases_.size()) + " basis/bases, " +
               std::to_string(field_basis_.size()) + " field(s), " +
               std::to_string(zones_.size()) + " zone(s) declared");
}

void Strict::check_basis(const Basis& basis) const
{
    if (!bases_.count(basis.name))
        throw ContractViolation("basis '" + basis.name + "' was not declared");
}

void Strict::check_field(const Field& field) const
{
    if (!field_basis_.count(field.name))
        throw ContractViolation("field '" + field.name + "' was not declared");
}

void Strict::check_zone(const Zone& zone) const
{
    if (!zones_.count(zone.key))
        throw ContractViolation("zone '" + zone.key + "' was not declared");
}

void Strict::check_step(const Step& step) const
{
    if (!stepping_ || step.index != current_)
        throw ContractViolation("query for step " + std::to_string(step.index) +
                                ", which is not the current step");
}

Basis Strict::basis_of(const Field& field) const
{
    check_field(field);
    Basis basis = src_->basis_of(field);
    const std::string& declared = field_basis_.at(field.name);
    if (basis.name != declared)
        throw ContractViolation("basis_of('" + field.name + "') is '" + basis.name +
                                "', but the field was enumerated under '" + declared + "'");
    return basis;
}

std::vector<Field> Strict::geometries(const Basis& basis) const
{
    check_basis(basis);
    return src_->geometries(basis);
}

std::vector<Field> Strict::fields(const Basis& basis) const
{
    check_basis(basis);
    return src_->fields(basis);
}

std::vector<Zone> Strict::zones() const
{
    std::vector<Zone> out = src_->zones();
    for (const Zone& zone : out)
        check_zone(zone);
    return out;
}

Sequence<Step> Strict::steps()
{
    auto inner = std::make_shared<Sequence<Step>>(src_->steps());
    auto it = std::make_shared<Sequence<Step>::iterator>();
    auto started = std::make_shared<bool>(false);

    return Sequence<Step>([this, inner, it, started](Step& out) {
        if (!*started) {
            *it = inner->begin();
            *started = true;
        }
        else {
            ++*it;
        }
        if (*it == inner->end())
            return false;

        const Step& step = **it;
        if (stepping_ && step.index <= current_)
            throw ContractViolation("step index " + std::to_string(step.index) +
                                    " follows " + std::to_string(current_));
        stepping_ = true;
        current_ = step.index;
        topo_answer_.clear();
        field_answer_.clear();

        out = step;
        return true;
    });
}

bool Strict::topology_updates(const Step& step, const Basis& basis)
{
    check_step(step);
    check_basis(basis);
    const bool answer = src_->topology_updates(step, basis);
    topo_answer_[basis.name] = answer;
    return answer;
}

bool Strict::field_updates(const Step& step, const Field& field)
{
    check_step(step);
    check_field(field);
    const bool answer = src_->field_updates(step, field);
    field_answer_[field.name] = answer;
    return answer;
}

/*
  A fetch is allowed when the update query for this step answered true,
  or during the step the basis/field is fetched for the first time.
*/
Topology Strict::topology(const Step& step, const Basis& basis, const Zone& zone)
{
    check_step(step);
    check_basis(basis);
    check_zone(zone);

    auto answer = topo_answer_.find(basis.name);
    if (answer == topo_answer_.end())
        throw ContractViolation("topology of basis '" + basis.name + "' fetched at step " +
                                std::to_string(step.index) + " without an update query");

    auto first = topo_first_.emplace(basis.name, step.index).first;
    if (!answer->second && first->second != step.index)
        throw ContractViolation("topology of basis '" + basis.name + "' fetched at step " +
                                std::to_string(step.index) + " after it reported no update");

    return src_->topology(step, basis, zone);
}

FieldData Strict::field_data(const Step& step, const Field& field, const Zone& zone)
{
    check_step(step);
    check_field(field);
    check_zone(zone);

    auto answer = field_answer_.find(field.name);
    if (answer == field_answer_.end())
        throw ContractViolation("field '" + field.name + "' fetched at step " +
                                std::to_string(step.index) + " without an update query");

    auto first = field_first_.emplace(field.name, step.index).first;
    if (!answer->second && first->second != step.index)
        throw ContractViolation("field '" + field.name + "' fetched at step " +
                                std::to_string(step.index) + " after it reported no update");

    return src_->field_data(step, field, zone);
}

void Strict::use_geometry(const Field& geometry)
{
    if (!geometries_.count(geometry.name))
        throw ContractViolation("'" + geometry.name + "' is not a declared geometry");
    src_->use_geometry(geometry);
}

} // namespace meshstep
