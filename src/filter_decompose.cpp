/*─────────────────────────────────────────────────────────────
  File: src/filter_decompose.cpp
  Decompose: one scalar field per vector component
─────────────────────────────────────────────────────────────*/
#include "meshstep/filters.hpp"
#include "meshstep/errors.hpp"

#include <algorithm>

namespace meshstep {

namespace {
const char kSuffix[3] = { 'x', 'y', 'z' };
}

std::vector<Field> Decompose::fields(const Basis& basis) const
{
    std::vector<Field> out;
    for (const Field& field : src_->fields(basis)) {
        out.push_back(field);
        if (field.is_scalar() || !field.splittable)
            continue;

        const int n = std::min(field.num_comps(), 3);
        for (int c = 0; c < n; ++c) {
            Field comp;
            comp.name = field.name + "_" + kSuffix[c];
            comp.type = field.type.slice();
            comp.cellwise = field.cellwise;
            comp.splittable = false;
            components_[comp.name] = Component{ field.name, c };
            out.push_back(comp);
        }
    }
    return out;
}

std::optional<Decompose::Component> Decompose::component_of(const std::string& name) const
{
    auto it = components_.find(name);
    if (it == components_.end())
        return std::nullopt;
    return it->second;
}

/* Parents are looked up again so their full descriptor reaches the inner Source. */
Field Decompose::parent_field(const Component& c) const
{
    for (const Basis& basis : src_->bases())
        for (const Field& field : src_->fields(basis))
            if (field.name == c.parent)
                return field;
    throw ContractViolation("vector field '" + c.parent + "' disappeared from the source");
}

Basis Decompose::basis_of(const Field& field) const
{
    if (auto c = component_of(field.name))
        return src_->basis_of(parent_field(*c));
    return src_->basis_of(field);
}

bool Decompose::field_updates(const Step& step, const Field& field)
{
    const auto c = component_of(field.name);
    const Field parent = c ? parent_field(*c) : field;

    auto it = answers_.find(parent.name);
    if (it != answers_.end() && it->second.first == step.index)
        return it->second.second;

    const bool answer = src_->field_updates(step, parent);
    answers_[parent.name] = std::make_pair(step.index, answer);
    return answer;
}

FieldData Decompose::field_data(const Step& step, const Field& field, const Zone& zone)
{
    if (auto c = component_of(field.name))
        return src_->field_data(step, parent_field(*c), zone).slice({ c->comp });
    return src_->field_data(step, field, zone);
}

} // namespace meshstep
