#include <Extremes.hpp>
#include <limits>
#include <stdexcept>

Min::Min() : min(std::numeric_limits<double>::infinity()) {}

void Min::update(double x)
{
    if (x < min)
    {
        min = x;
    }
}

double Min::get() const
{
    return min;
}

Max::Max() : max(-std::numeric_limits<double>::infinity()) {}

void Max::update(double x)
{
    if (x > max)
    {
        max = x;
    }
}

double Max::get() const
{
    return max;
}

RollingMin::RollingMin(size_t windowSize) : window(windowSize)
{
    if (windowSize == 0)
    {
        throw std::invalid_argument("size has to be greater than 0");
    }
}

void RollingMin::update(double x)
{
    window.pushBack(x);
}

double RollingMin::get() const
{
    return window.front();
}

RollingMax::RollingMax(size_t windowSize) : window(windowSize)
{
    if (windowSize == 0)
    {
        throw std::invalid_argument("size has to be greater than 0");
    }
}

void RollingMax::update(double x)
{
    window.pushBack(x);
}

double RollingMax::get() const
{
    return window.back();
}

// infinities have no JSON representation, an untouched extreme is written as null
void to_json(json &j, const Min &m)
{
    j = json{{"min", nullptr}};
    if (m.min != std::numeric_limits<double>::infinity())
    {
        j["min"] = m.min;
    }
}

void from_json(const json &j, Min &m)
{
    const auto &v = j.at("min");
    m.min = v.is_null() ? std::numeric_limits<double>::infinity() : v.get<double>();
}

void to_json(json &j, const Max &m)
{
    j = json{{"max", nullptr}};
    if (m.max != -std::numeric_limits<double>::infinity())
    {
        j["max"] = m.max;
    }
}

void from_json(const json &j, Max &m)
{
    const auto &v = j.at("max");
    m.max = v.is_null() ? -std::numeric_limits<double>::infinity() : v.get<double>();
}

void to_json(json &j, const RollingMin &m)
{
    j = json{{"sorted_window", m.window}};
}

void from_json(const json &j, RollingMin &m)
{
    SortedWindow window(0);
    j.at("sorted_window").get_to(window);
    if (window.capacity() == 0)
    {
        throw std::invalid_argument("size has to be greater than 0");
    }
    m.window = window;
}

void to_json(json &j, const RollingMax &m)
{
    j = json{{"sorted_window", m.window}};
}

void from_json(const json &j, RollingMax &m)
{
    SortedWindow window(0);
    j.at("sorted_window").get_to(window);
    if (window.capacity() == 0)
    {
        throw std::invalid_argument("size has to be greater than 0");
    }
    m.window = window;
}
