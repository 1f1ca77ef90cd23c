#pragma once

#include <SortedWindow.hpp>
#include <Univariate.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>

using json = nlohmann::json;

// quantile of the last windowSize values, linear interpolation between the
// two order statistics around q * (n - 1)
class RollingQuantile : public Univariate
{
public:
    // throws std::invalid_argument if q is outside [0, 1] or windowSize is 0
    RollingQuantile(double q, size_t windowSize);

    void update(double x) override;
    double get() const override;

    double quantile() const;
    size_t windowSize() const;
    const SortedWindow &window() const;

    friend void to_json(json &j, const RollingQuantile &est);
    friend void from_json(const json &j, RollingQuantile &est);

private:
    struct Ranks
    {
        size_t lower;
        size_t higher;
        double frac;
    };
    static Ranks ranksFor(double q, size_t length);
    Ranks prepare() const;

    SortedWindow sortedWindow;
    double q;
    size_t size;
    // cached ranks once the window is full
    size_t lower;
    size_t higher;
    double frac;
};
