#pragma once

//parent class for all running statistics
class Univariate
{
public:
    virtual ~Univariate() = default;
    //called for every new observation
    virtual void update(double x) = 0;
    //current value of the statistic, does not mutate
    virtual double get() const = 0;
};

//statistics that can undo a previous update(x), needed by Rolling
class RevertibleUnivariate : public Univariate
{
public:
    //throws std::runtime_error if x cannot be removed
    virtual void revert(double x) = 0;
};
