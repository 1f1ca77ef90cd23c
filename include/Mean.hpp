#pragma once

#include <Univariate.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// incremental mean, no running sum kept so large streams do not lose precision
class Mean : public RevertibleUnivariate
{
public:
    Mean();
    void update(double x) override;
    // throws std::runtime_error when nothing is left to remove
    void revert(double x) override;
    double get() const override;

    double count() const;

    friend void to_json(json &j, const Mean &m);
    friend void from_json(const json &j, Mean &m);

private:
    double n;
    double mean;
};
