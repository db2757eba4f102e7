/*
  File: include/meshstep/sequence.hpp

  Sequence<T>: a lazy, forward-only, single-pass producer.

  Sources hand out steps through it, and the writer's consume_basis /
  consume_field building blocks hand out update records through it.
  Values are pulled one at a time from a callable:

      bool pull(T& out);   // fills out and returns true, or returns false at the end

  Iteration:
    - begin() may be called once. A second begin() throws
      ContractViolation: callers must not assume a Sequence can be
      replayed (a Source re-reading its files would answer the update
      queries differently the second time).
    - Iterators are input iterators; the value is owned by the Sequence
      and stays valid until the iterator is advanced.

  Helpers:
    - from_vector(v) : sequence over an owned copy of v
    - collect(seq)   : drain into a std::vector
*/
#pragma once

#include "meshstep/errors.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace meshstep {

template <typename T>
class Sequence
{
public:
    using Pull = std::function<bool(T&)>;

private:
    struct State
    {
        Pull             pull;
        std::optional<T> current;
        bool             started = false;
        bool             done    = false;
    };

public:
    Sequence() : Sequence(Pull([](T&) { return false; })) {}
    explicit Sequence(Pull pull) : state_(std::make_shared<State>())
    {
        state_->pull = std::move(pull);
    }

    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;

        iterator() = default;

        reference operator*()  const { return *state_->current; }
        pointer   operator->() const { return &*state_->current; }

        iterator& operator++()
        {
            advance();
            return *this;
        }

        /* Only end-ness is compared: all live iterators share one cursor. */
        bool operator==(const iterator& o) const { return at_end() == o.at_end(); }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class Sequence;
        explicit iterator(std::shared_ptr<State> s) : state_(std::move(s))
        {
            advance();
        }

        void advance()
        {
            T next{};
            if (state_->pull(next))
                state_->current.emplace(std::move(next));
            else {
                state_->current.reset();
                state_->done = true;
            }
        }

        bool at_end() const { return !state_ || state_->done; }

        std::shared_ptr<State> state_;
    };

    iterator begin()
    {
        if (state_->started)
            throw ContractViolation("sequence is single-pass and was already iterated");
        state_->started = true;
        return iterator(state_);
    }

    iterator end() { return iterator(); }

    static Sequence from_vector(std::vector<T> items)
    {
        auto owned = std::make_shared<std::vector<T>>(std::move(items));
        auto pos = std::make_shared<std::size_t>(0);
        return Sequence([owned, pos](T& out) {
            if (*pos >= owned->size())
                return false;
            out = (*owned)[(*pos)++];
            return true;
        });
    }

private:
    std::shared_ptr<State> state_;
};

/* Drain a sequence into a vector. */
template <typename T>
std::vector<T> collect(Sequence<T> seq)
{
    std::vector<T> out;
    for (const T& item : seq)
        out.push_back(item);
    return out;
}

} // namespace meshstep
