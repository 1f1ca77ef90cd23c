#pragma once

#include <SortedWindow.hpp>
#include <Univariate.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>

using json = nlohmann::json;

// running minimum, +inf until the first update
class Min : public Univariate
{
public:
    Min();
    void update(double x) override;
    double get() const override;

    friend void to_json(json &j, const Min &m);
    friend void from_json(const json &j, Min &m);

private:
    double min;
};

// running maximum, -inf until the first update
class Max : public Univariate
{
public:
    Max();
    void update(double x) override;
    double get() const override;

    friend void to_json(json &j, const Max &m);
    friend void from_json(const json &j, Max &m);

private:
    double max;
};

// min/max cannot be reverted so their windowed versions read the ends of a
// SortedWindow instead of going through Rolling
class RollingMin : public Univariate
{
public:
    // throws std::invalid_argument if windowSize is 0
    explicit RollingMin(size_t windowSize);
    void update(double x) override;
    double get() const override;

    friend void to_json(json &j, const RollingMin &m);
    friend void from_json(const json &j, RollingMin &m);

private:
    SortedWindow window;
};

class RollingMax : public Univariate
{
public:
    // throws std::invalid_argument if windowSize is 0
    explicit RollingMax(size_t windowSize);
    void update(double x) override;
    double get() const override;

    friend void to_json(json &j, const RollingMax &m);
    friend void from_json(const json &j, RollingMax &m);

private:
    SortedWindow window;
};
