#pragma once

#include <optional>

namespace walkguide {

/// EMA: s = alpha * x + (1 - alpha) * s. The first sample passes through.
class ExponentialSmoother {
public:
    explicit ExponentialSmoother(double alpha = 0.3) : alpha_(alpha) {}

    double update(double x) {
        value_ = value_ ? alpha_ * x + (1.0 - alpha_) * *value_ : x;
        return *value_;
    }

    std::optional<double> value() const { return value_; }
    void reset() { value_.reset(); }

private:
    double alpha_;
    std::optional<double> value_;
};

}  // namespace walkguide
