#include <Mean.hpp>
#include <stdexcept>

Mean::Mean() : n(0.0), mean(0.0) {}

void Mean::update(double x)
{
    n += 1.0;
    mean += (x - mean) / n;
}

void Mean::revert(double x)
{
    if (n <= 0.0)
    {
        throw std::runtime_error("cannot revert an empty mean");
    }
    n -= 1.0;
    if (n == 0.0)
    {
        mean = 0.0;
    }
    else
    {
        mean -= (x - mean) / n;
    }
}

double Mean::get() const
{
    return mean;
}

double Mean::count() const
{
    return n;
}

void to_json(json &j, const Mean &m)
{
    j = json{{"n", m.n}, {"mean", m.mean}};
}

void from_json(const json &j, Mean &m)
{
    auto n = j.at("n").get<double>();
    if (n < 0.0)
    {
        throw std::invalid_argument("mean count cannot be negative");
    }
    m.n = n;
    j.at("mean").get_to(m.mean);
}
