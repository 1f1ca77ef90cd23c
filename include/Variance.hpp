#pragma once

#include <Mean.hpp>
#include <Univariate.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Welford's running variance
//  - ddof is the delta degrees of freedom, n - ddof is the divisor
//  - get() is 0 until more than ddof values have been seen
class Variance : public RevertibleUnivariate
{
public:
    explicit Variance(unsigned ddof = 1);
    void update(double x) override;
    void revert(double x) override;
    double get() const override;

    friend void to_json(json &j, const Variance &v);
    friend void from_json(const json &j, Variance &v);

private:
    Mean mean;
    unsigned ddof;
    // sum of squared differences from the mean
    double state;
};
