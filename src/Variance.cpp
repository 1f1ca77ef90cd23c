#include <Variance.hpp>
#include <stdexcept>

Variance::Variance(unsigned ddof) : ddof(ddof), state(0.0) {}

void Variance::update(double x)
{
    double oldMean = mean.get();
    mean.update(x);
    state += (x - oldMean) * (x - mean.get());
}

void Variance::revert(double x)
{
    double oldMean = mean.get();
    mean.revert(x);
    state -= (x - oldMean) * (x - mean.get());
    // removing values accumulates rounding error and can push the sum of
    // squares below zero
    if (state < 0.0 || mean.count() == 0.0)
    {
        state = 0.0;
    }
}

double Variance::get() const
{
    double n = mean.count();
    if (n > static_cast<double>(ddof))
    {
        double variance = state / (n - static_cast<double>(ddof));
        if (variance < 0.0)
        {
            variance = 0.0;
        }
        return variance;
    }
    return 0.0;
}

void to_json(json &j, const Variance &v)
{
    j = json{{"mean", v.mean}, {"ddof", v.ddof}, {"state", v.state}};
}

void from_json(const json &j, Variance &v)
{
    j.at("mean").get_to(v.mean);
    j.at("ddof").get_to(v.ddof);
    auto state = j.at("state").get<double>();
    if (state < 0.0)
    {
        throw std::invalid_argument("variance state cannot be negative");
    }
    v.state = state;
}
