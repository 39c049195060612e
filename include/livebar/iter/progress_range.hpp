#pragma once

#include "livebar/core/progress_bar.hpp"
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace livebar {
namespace iter {

namespace detail {

template<typename Range, typename = void>
struct has_size : std::false_type {};

template<typename Range>
struct has_size<Range, std::void_t<decltype(std::size(std::declval<Range&>()))>> : std::true_type {};

}

// Range adapter that advances a bar by one each time iteration moves past
// an element. The bar is finalized when the adapter is destroyed, which for
// a range-for over track(...) is the end of the loop statement on every
// exit path.
template<typename Range>
class TrackedRange {
public:
    using base_iterator = decltype(std::begin(std::declval<Range&>()));
    using base_sentinel = decltype(std::end(std::declval<Range&>()));

    struct sentinel {
        base_sentinel end;
    };

    class iterator {
    public:
        iterator(base_iterator it, core::ProgressBar* bar) : it_(std::move(it)), bar_(bar) {}

        decltype(auto) operator*() const { return *it_; }

        iterator& operator++() {
            ++it_;
            bar_->update(1);
            return *this;
        }

        bool operator!=(const sentinel& other) const { return it_ != other.end; }
        bool operator==(const sentinel& other) const { return it_ == other.end; }

    private:
        base_iterator it_;
        core::ProgressBar* bar_;
    };

    TrackedRange(Range&& range, core::BarOptions options, term::Environment env)
        : range_(std::forward<Range>(range)) {
        if constexpr (detail::has_size<Range>::value) {
            auto count = static_cast<int64_t>(std::size(range_));
            if (!options.total && count > 0) {
                options.total = count;
            }
        }
        bar_ = std::make_unique<core::ProgressBar>(options, std::move(env));
    }

    iterator begin() { return iterator(std::begin(range_), bar_.get()); }
    sentinel end() { return sentinel{std::end(range_)}; }

    core::ProgressBar& bar() { return *bar_; }

private:
    Range range_;
    std::unique_ptr<core::ProgressBar> bar_;
};

template<typename Range>
TrackedRange<Range> track(Range&& range,
                          core::BarOptions options = core::BarOptions(),
                          term::Environment env = term::Environment::standard()) {
    return TrackedRange<Range>(std::forward<Range>(range), std::move(options), std::move(env));
}

}

using iter::track;

}
