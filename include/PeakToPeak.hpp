#pragma once

#include <Extremes.hpp>
#include <Univariate.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>

using json = nlohmann::json;

// max - min over everything seen
class PeakToPeak : public Univariate
{
public:
    void update(double x) override;
    double get() const override;

    friend void to_json(json &j, const PeakToPeak &p);
    friend void from_json(const json &j, PeakToPeak &p);

private:
    Min min;
    Max max;
};

// max - min over the last windowSize values
class RollingPeakToPeak : public Univariate
{
public:
    explicit RollingPeakToPeak(size_t windowSize);
    void update(double x) override;
    double get() const override;

    friend void to_json(json &j, const RollingPeakToPeak &p);
    friend void from_json(const json &j, RollingPeakToPeak &p);

private:
    RollingMin min;
    RollingMax max;
};
