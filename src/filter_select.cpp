/*─────────────────────────────────────────────────────────────
  File: src/filter_select.cpp
  FieldFilter and BasisFilter
─────────────────────────────────────────────────────────────*/
#include "meshstep/filters.hpp"

namespace meshstep {

namespace {

std::string joined(const std::set<std::string>& names)
{
    std::string out;
    for (const auto& n : names)
        out += (out.empty() ? "" : ", ") + n;
    return out.empty() ? "(none)" : out;
}

} // anonymous namespace

/*=====================================================================
  FieldFilter
=====================================================================*/
FieldFilter::FieldFilter(std::unique_ptr<Source> source, Logger& log,
                         std::set<std::string> allowed)
    : Passthrough(std::move(source), log)
{
    for (const auto& name : allowed)
        allowed_.insert(casefold(trim(name)));
    log_.debug("FieldFilter: keeping " + joined(allowed_));

    std::set<std::string> unmatched = allowed_;
    for (const Basis& basis : src_->bases())
        for (const Field& field : src_->fields(basis))
            unmatched.erase(casefold(field.name));
    for (const auto& name : unmatched)
        log_.warn("Field filter: no field named '" + name + "'");
}

std::vector<Field> FieldFilter::fields(const Basis& basis) const
{
    std::vector<Field> out;
    for (const Field& field : src_->fields(basis))
        if (allowed_.count(casefold(field.name)))
            out.push_back(field);
    return out;
}

/*=====================================================================
  BasisFilter
=====================================================================*/
BasisFilter::BasisFilter(std::unique_ptr<Source> source, Logger& log,
                         std::set<std::string> allowed)
    : Passthrough(std::move(source), log)
{
    for (const auto& name : allowed)
        allowed_.insert(casefold(trim(name)));
    log_.debug("BasisFilter: keeping " + joined(allowed_));

    std::set<std::string> unmatched = allowed_;
    for (const Basis& basis : src_->bases())
        unmatched.erase(casefold(basis.name));
    for (const auto& name : unmatched)
        log_.warn("Basis filter: no basis named '" + name + "'");
}

bool BasisFilter::keeps(const Basis& basis) const
{
    return allowed_.count(casefold(basis.name)) > 0;
}

SourceProperties BasisFilter::properties() const
{
    SourceProperties p = src_->properties();
    p.single_basis = p.single_basis || bases().size() == 1;
    return p;
}

std::vector<Basis> BasisFilter::bases() const
{
    std::vector<Basis> out;
    for (const Basis& basis : src_->bases())
        if (keeps(basis))
            out.push_back(basis);
    return out;
}

} // namespace meshstep
