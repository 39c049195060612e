#pragma once

#include <optional>

namespace livebar {
namespace core {

// Exponential moving average over instantaneous rates. alpha = 1 reports the
// latest sample unchanged, alpha = 0 freezes the first one.
class RateSmoother {
public:
    explicit RateSmoother(double alpha);

    // Feeds one (elapsed seconds, count delta) sample. Returns false when the
    // sample was skipped: non-positive elapsed time or a negative delta.
    bool addSample(double elapsed_seconds, double delta);

    double rate() const { return rate_.value_or(0.0); }
    bool hasRate() const { return rate_.has_value(); }
    double alpha() const { return alpha_; }

    // Seconds until remaining units are done; empty while the rate is unknown
    // or zero.
    std::optional<double> eta(double remaining) const;

    void reset() { rate_.reset(); }

private:
    double alpha_;
    std::optional<double> rate_;
};

// Bounded back-and-forth counter driving the indeterminate animation.
// Position always stays within [0, positions - 1].
class BounceCursor {
public:
    explicit BounceCursor(int positions);

    void tick();
    int position() const { return position_; }
    int positions() const { return positions_; }
    void reset();

private:
    int positions_;
    int position_ = 0;
    int direction_ = 1;
};

}}
