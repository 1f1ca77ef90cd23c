#include <RollingQuantile.hpp>
#include <StatsError.hpp>
#include <cmath>
#include <stdexcept>
#include <utility>

RollingQuantile::RollingQuantile(double q, size_t windowSize) : sortedWindow(windowSize), q(q), size(windowSize)
{
    if (!(q >= 0.0 && q <= 1.0))
    {
        throw std::invalid_argument("q should be between 0 and 1");
    }
    if (windowSize == 0)
    {
        throw std::invalid_argument("size has to be greater than 0");
    }
    Ranks r = ranksFor(q, windowSize);
    lower = r.lower;
    higher = r.higher;
    frac = r.frac;
}

RollingQuantile::Ranks RollingQuantile::ranksFor(double q, size_t length)
{
    double idx = q * (static_cast<double>(length) - 1.0);
    Ranks r;
    r.lower = static_cast<size_t>(std::floor(idx));
    r.higher = r.lower + 1;
    if (r.higher > length - 1)
    {
        r.higher = length - 1;
    }
    r.frac = idx - static_cast<double>(r.lower);
    return r;
}

RollingQuantile::Ranks RollingQuantile::prepare() const
{
    if (sortedWindow.size() < size)
    {
        return ranksFor(q, sortedWindow.size());
    }
    return Ranks{lower, higher, frac};
}

void RollingQuantile::update(double x)
{
    sortedWindow.pushBack(x);
}

double RollingQuantile::get() const
{
    if (sortedWindow.empty())
    {
        throw InvariantViolation("rolling quantile has no observations");
    }
    Ranks r = prepare();
    double lo = sortedWindow[r.lower];
    return lo + (sortedWindow[r.higher] - lo) * r.frac;
}

double RollingQuantile::quantile() const
{
    return q;
}

size_t RollingQuantile::windowSize() const
{
    return size;
}

const SortedWindow &RollingQuantile::window() const
{
    return sortedWindow;
}

void to_json(json &j, const RollingQuantile &est)
{
    j = json{{"sorted_window", est.sortedWindow},
             {"q", est.q},
             {"window_size", est.size},
             {"lower", est.lower},
             {"higher", est.higher},
             {"frac", est.frac}};
}

void from_json(const json &j, RollingQuantile &est)
{
    auto q = j.at("q").get<double>();
    auto windowSize = j.at("window_size").get<size_t>();
    if (!(q >= 0.0 && q <= 1.0))
    {
        throw std::invalid_argument("q should be between 0 and 1");
    }
    if (windowSize == 0)
    {
        throw std::invalid_argument("size has to be greater than 0");
    }
    auto lower = j.at("lower").get<size_t>();
    auto higher = j.at("higher").get<size_t>();
    if (lower >= windowSize || higher >= windowSize)
    {
        throw std::invalid_argument("cached ranks outside the window");
    }

    SortedWindow window(windowSize);
    j.at("sorted_window").get_to(window);
    if (window.capacity() != windowSize)
    {
        throw std::invalid_argument("sorted_window capacity does not match window_size");
    }

    est.sortedWindow = std::move(window);
    est.q = q;
    est.size = windowSize;
    est.lower = lower;
    est.higher = higher;
    est.frac = j.at("frac").get<double>();
}
