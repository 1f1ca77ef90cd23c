#include <Quantile.hpp>
#include <StatsError.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

Quantile::Quantile(double q)
    : q(q),
      desiredMarkerPosition{0.0, q / 2.0, q, (1.0 + q) / 2.0, 1.0},
      markerPosition{1.0, 1.0 + 2.0 * q, 1.0 + 4.0 * q, 3.0 + 2.0 * q, 5.0},
      position{1.0, 2.0, 3.0, 4.0, 5.0},
      heightsSorted(false)
{
    if (!(q >= 0.0 && q <= 1.0))
    {
        throw std::invalid_argument("q should be between 0 and 1");
    }
    heights.reserve(5);
}

void Quantile::update(double x)
{
    if (std::isnan(x))
    {
        throw InvariantViolation("cannot update a quantile with NaN");
    }

    if (heights.size() != 5)
    {
        // still collecting the first five observations
        heights.push_back(x);
    }
    else
    {
        if (!heightsSorted)
        {
            std::sort(heights.begin(), heights.end());
            heightsSorted = true;
        }

        size_t k = findK(x);

        // markers right of the cell move one rank up
        for (size_t i = k; i < 5; ++i)
        {
            position[i] += 1.0;
        }
        for (size_t i = 0; i < 5; ++i)
        {
            markerPosition[i] += desiredMarkerPosition[i];
        }
        adjust();
    }
    std::sort(heights.begin(), heights.end());
}

double Quantile::get() const
{
    if (heightsSorted)
    {
        return heights[2];
    }
    if (heights.empty())
    {
        throw InvariantViolation("quantile has no observations");
    }

    double length = static_cast<double>(heights.size());
    double index = std::min(std::max(length - 1.0, 0.0), length * q);
    return heights[static_cast<size_t>(index)];
}

double Quantile::quantile() const
{
    return q;
}

// cell k such that heights[k-1] <= x < heights[k]; extreme markers are
// stretched when x falls outside them
size_t Quantile::findK(double x)
{
    if (x < heights[0])
    {
        heights[0] = x;
        return 1;
    }
    for (size_t i = 1; i <= 4; ++i)
    {
        if (heights[i - 1] <= x && x < heights[i])
        {
            return i;
        }
    }
    if (heights[4] < x)
    {
        heights[4] = x;
    }
    return 4;
}

double Quantile::parabolic(double qp1, double q, double qm1, double d, double np1, double n, double nm1)
{
    double outer = d / (np1 - nm1);
    double innerLeft = (n - nm1 + d) * (qp1 - q) / (np1 - n);
    double innerRight = (np1 - n - d) * (q - qm1) / (n - nm1);
    return q + outer * (innerLeft + innerRight);
}

void Quantile::adjust()
{
    for (size_t i = 1; i < 4; ++i)
    {
        double n = position[i];
        double h = heights[i];
        double d = markerPosition[i] - n;

        if ((d >= 1.0 && position[i + 1] - n > 1.0) || (d <= -1.0 && position[i - 1] - n < -1.0))
        {
            d = std::copysign(1.0, d);

            double qp1 = heights[i + 1];
            double qm1 = heights[i - 1];
            double np1 = position[i + 1];
            double nm1 = position[i - 1];

            double qn = parabolic(qp1, h, qm1, d, np1, n, nm1);
            if (qm1 < qn && qn < qp1)
            {
                heights[i] = qn;
            }
            else
            {
                // parabola would break monotonicity, move linearly toward the neighbour
                size_t j = d > 0.0 ? i + 1 : i - 1;
                heights[i] = h + d * (heights[j] - h) / (position[j] - n);
            }
            position[i] = n + d;
        }
    }
}

void to_json(json &j, const Quantile &est)
{
    j = json{{"q", est.q},
             {"desired_marker_position", est.desiredMarkerPosition},
             {"marker_position", est.markerPosition},
             {"position", est.position},
             {"heights", est.heights},
             {"heights_sorted", est.heightsSorted}};
}

void from_json(const json &j, Quantile &est)
{
    auto q = j.at("q").get<double>();
    if (!(q >= 0.0 && q <= 1.0))
    {
        throw std::invalid_argument("q should be between 0 and 1");
    }
    for (const char *key : {"desired_marker_position", "marker_position", "position"})
    {
        if (!j.at(key).is_array() || j.at(key).size() != 5)
        {
            throw std::invalid_argument(std::string(key) + " must hold 5 values");
        }
    }
    auto desired = j.at("desired_marker_position").get<std::array<double, 5>>();
    auto markers = j.at("marker_position").get<std::array<double, 5>>();
    auto position = j.at("position").get<std::array<double, 5>>();
    auto heights = j.at("heights").get<std::vector<double>>();
    auto heightsSorted = j.at("heights_sorted").get<bool>();

    // the targets are fixed by q, anything else belongs to another estimator
    Quantile fresh(q);
    if (desired != fresh.desiredMarkerPosition)
    {
        throw std::invalid_argument("desired_marker_position does not match q");
    }
    if (heights.size() > 5 || (heightsSorted && heights.size() != 5))
    {
        throw std::invalid_argument("heights must hold at most 5 values, exactly 5 once sorted");
    }
    // heights are re-sorted after every update
    if (!std::is_sorted(heights.begin(), heights.end()))
    {
        throw std::invalid_argument("heights are not sorted");
    }
    if (!heightsSorted && (position != fresh.position || markers != fresh.markerPosition))
    {
        throw std::invalid_argument("markers moved before the first five values were collected");
    }
    // marker ranks are distinct and increasing, parabolic() divides by their gaps
    if (!(position[0] >= 1.0))
    {
        throw std::invalid_argument("position must start at 1 or above");
    }
    for (size_t i = 1; i < 5; ++i)
    {
        if (!(position[i] > position[i - 1]))
        {
            throw std::invalid_argument("position must be strictly increasing");
        }
    }

    est.q = q;
    est.desiredMarkerPosition = desired;
    est.markerPosition = markers;
    est.position = position;
    est.heights = std::move(heights);
    est.heights.reserve(5);
    est.heightsSorted = heightsSorted;
}
