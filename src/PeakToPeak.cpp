#include <PeakToPeak.hpp>

void PeakToPeak::update(double x)
{
    min.update(x);
    max.update(x);
}

double PeakToPeak::get() const
{
    return max.get() - min.get();
}

RollingPeakToPeak::RollingPeakToPeak(size_t windowSize) : min(windowSize), max(windowSize) {}

void RollingPeakToPeak::update(double x)
{
    min.update(x);
    max.update(x);
}

double RollingPeakToPeak::get() const
{
    return max.get() - min.get();
}

void to_json(json &j, const PeakToPeak &p)
{
    j = json{{"min", p.min}, {"max", p.max}};
}

void from_json(const json &j, PeakToPeak &p)
{
    j.at("min").get_to(p.min);
    j.at("max").get_to(p.max);
}

void to_json(json &j, const RollingPeakToPeak &p)
{
    j = json{{"min", p.min}, {"max", p.max}};
}

void from_json(const json &j, RollingPeakToPeak &p)
{
    j.at("min").get_to(p.min);
    j.at("max").get_to(p.max);
}
