#pragma once

#include <Univariate.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <cstddef>
#include <vector>

using json = nlohmann::json;

// running quantile with the P-square algorithm (Jain & Chlamtac, 1985).
// five markers, O(1) memory and update, nothing else is stored.
//  - markers 0 and 4 track min and max
//  - marker 2 tracks the requested quantile, get() returns its height
//  - the first five values are only collected, get() then reads them directly
class Quantile : public Univariate
{
public:
    // throws std::invalid_argument if q is outside [0, 1]
    explicit Quantile(double q = 0.5);

    void update(double x) override;
    double get() const override;

    double quantile() const;

    friend void to_json(json &j, const Quantile &est);
    friend void from_json(const json &j, Quantile &est);

private:
    size_t findK(double x);
    void adjust();
    static double parabolic(double qp1, double q, double qm1, double d, double np1, double n, double nm1);

    double q;
    std::array<double, 5> desiredMarkerPosition;
    std::array<double, 5> markerPosition;
    std::array<double, 5> position;
    std::vector<double> heights;
    bool heightsSorted;
};
