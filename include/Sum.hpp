#pragma once

#include <Univariate.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class Sum : public RevertibleUnivariate
{
public:
    Sum();
    void update(double x) override;
    void revert(double x) override;
    double get() const override;

    friend void to_json(json &j, const Sum &s);
    friend void from_json(const json &j, Sum &s);

private:
    double sum;
};
