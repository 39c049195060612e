#include "livebar/core/smoother.hpp"
#include "livebar/common/error_codes.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace livebar {
namespace core {

RateSmoother::RateSmoother(double alpha) : alpha_(alpha) {
    if (!std::isfinite(alpha) || alpha < 0.0 || alpha > 1.0) {
        common::ErrorContext ctx;
        ctx.component = "RateSmoother";
        ctx.details["smoothing"] = fmt::format("{}", alpha);
        throw common::BarError(common::BarErrorCode::CONFIG_INVALID_SMOOTHING, ctx);
    }
}

bool RateSmoother::addSample(double elapsed_seconds, double delta) {
    if (!(elapsed_seconds > 0.0) || delta < 0.0) {
        return false;
    }

    double instantaneous = delta / elapsed_seconds;
    if (!std::isfinite(instantaneous)) {
        return false;
    }

    if (!rate_) {
        rate_ = instantaneous;
    } else {
        rate_ = alpha_ * instantaneous + (1.0 - alpha_) * *rate_;
    }
    return true;
}

std::optional<double> RateSmoother::eta(double remaining) const {
    if (!rate_ || *rate_ <= 0.0) {
        return std::nullopt;
    }
    return std::max(remaining, 0.0) / *rate_;
}

BounceCursor::BounceCursor(int positions) : positions_(std::max(1, positions)) {}

void BounceCursor::tick() {
    if (positions_ <= 1) {
        position_ = 0;
        return;
    }
    int next = position_ + direction_;
    if (next < 0 || next >= positions_) {
        direction_ = -direction_;
        next = position_ + direction_;
    }
    position_ = next;
}

void BounceCursor::reset() {
    position_ = 0;
    direction_ = 1;
}

}}
