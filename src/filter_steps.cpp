/*─────────────────────────────────────────────────────────────
  File: src/filter_steps.cpp

  Step filters: StepSlice and LastTime, on top of GroupedSteps.

  Inner steps are pulled one at a time, only when the outer sequence
  is advanced, so the inner Source is never queried ahead of the step
  it is asked about.
─────────────────────────────────────────────────────────────*/
#include "meshstep/filters.hpp"
#include "meshstep/errors.hpp"

namespace meshstep {

/*=====================================================================
  GroupedSteps
=====================================================================*/
Step GroupedSteps::emit_group(int index, std::vector<Step> group)
{
    group_index_ = index;
    group_ = std::move(group);

    Step out;
    out.index = index;
    out.value = group_.back().value;
    return out;
}

const std::vector<Step>& GroupedSteps::group(const Step& step) const
{
    if (step.index != group_index_ || group_.empty())
        throw ContractViolation("step " + std::to_string(step.index) +
                                " is not the current step of the step filter");
    return group_;
}

bool GroupedSteps::topology_updates(const Step& step, const Basis& basis)
{
    bool any = false;
    for (const Step& s : group(step)) {
        const bool u = src_->topology_updates(s, basis);
        any = any || u;
    }
    return any;
}

bool GroupedSteps::field_updates(const Step& step, const Field& field)
{
    bool any = false;
    for (const Step& s : group(step)) {
        const bool u = src_->field_updates(s, field);
        any = any || u;
    }
    return any;
}

Topology GroupedSteps::topology(const Step& step, const Basis& basis, const Zone& zone)
{
    return src_->topology(group(step).back(), basis, zone);
}

FieldData GroupedSteps::field_data(const Step& step, const Field& field, const Zone& zone)
{
    return src_->field_data(group(step).back(), field, zone);
}

/*=====================================================================
  StepSlice
=====================================================================*/
StepSlice::StepSlice(std::unique_ptr<Source> source, Logger& log,
                     std::optional<int> start, std::optional<int> stop, std::optional<int> stride)
    : GroupedSteps(std::move(source), log),
      start_(start.value_or(0)), stop_(stop), stride_(stride.value_or(1))
{
    if (start_ < 0)
        throw std::invalid_argument("step slice start must be non-negative");
    if (stop_ && *stop_ < 0)
        throw std::invalid_argument("step slice stop must be non-negative");
    if (stride_ < 1)
        throw std::invalid_argument("step slice stride must be at least 1");

    log_.debug("StepSlice: start=" + std::to_string(start_) +
               " stop=" + (stop_ ? std::to_string(*stop_) : std::string("end")) +
               " stride=" + std::to_string(stride_));
}

/*
  Pull loop:
    - stop reached        -> end, without pulling further inner steps
    - inner step at a kept ordinal (start + n*stride) -> closes a group
    - any other inner step -> joins the pending group
  Inner steps after the last kept one are never yielded.
*/
Sequence<Step> StepSlice::steps()
{
    struct State
    {
        Sequence<Step>           inner;
        Sequence<Step>::iterator it;
        bool                     started = false;
        bool                     advance = false;
        bool                     done    = false;
        int                      pos     = 0;
        int                      out     = 0;
        std::vector<Step>        pending;
    };
    auto st = std::make_shared<State>();
    st->inner = src_->steps();

    return Sequence<Step>([this, st](Step& out) {
        while (!st->done) {
            if (stop_ && st->pos >= *stop_)
                break;
            if (!st->started) {
                st->it = st->inner.begin();
                st->started = true;
            }
            else if (st->advance) {
                ++st->it;
            }
            st->advance = false;
            if (st->it == st->inner.end())
                break;

            st->pending.push_back(*st->it);
            st->advance = true;
            const int p = st->pos++;
            if (p >= start_ && (p - start_) % stride_ == 0) {
                out = emit_group(st->out++, std::move(st->pending));
                st->pending.clear();
                return true;
            }
        }
        st->done = true;
        return false;
    });
}

/*=====================================================================
  LastTime
=====================================================================*/
LastTime::LastTime(std::unique_ptr<Source> source, Logger& log)
    : GroupedSteps(std::move(source), log)
{
    log_.debug("LastTime: keeping the final step only");
}

SourceProperties LastTime::properties() const
{
    SourceProperties p = src_->properties();
    p.instantaneous = true;
    return p;
}

/* Drains the inner steps on the first pull; nothing for an empty source. */
Sequence<Step> LastTime::steps()
{
    auto inner = std::make_shared<Sequence<Step>>(src_->steps());
    auto done = std::make_shared<bool>(false);

    return Sequence<Step>([this, inner, done](Step& out) {
        if (*done)
            return false;
        *done = true;

        std::vector<Step> all;
        for (const Step& s : *inner)
            all.push_back(s);
        if (all.empty())
            return false;
        out = emit_group(0, std::move(all));
        return true;
    });
}

} // namespace meshstep
