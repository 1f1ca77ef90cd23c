#include <Sum.hpp>

Sum::Sum() : sum(0.0) {}

void Sum::update(double x)
{
    sum += x;
}

void Sum::revert(double x)
{
    sum -= x;
}

double Sum::get() const
{
    return sum;
}

void to_json(json &j, const Sum &s)
{
    j = json{{"sum", s.sum}};
}

void from_json(const json &j, Sum &s)
{
    j.at("sum").get_to(s.sum);
}
