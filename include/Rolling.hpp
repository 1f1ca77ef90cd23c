#pragma once

#include <StatsError.hpp>
#include <Univariate.hpp>
#include <boost/circular_buffer.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstddef>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using json = nlohmann::json;

// turns any revertible running statistic into a windowed one:
//  - the last windowSize raw values are kept in a FIFO
//  - once full, the oldest value is reverted out of the statistic before the new one goes in
// the statistic is borrowed for the lifetime of the Rolling and must not be
// touched by anyone else meanwhile. Stat is a template parameter so the
// calls below go straight to the concrete type.
template <typename Stat>
class Rolling : public Univariate
{
    static_assert(std::is_base_of<RevertibleUnivariate, Stat>::value,
                  "Rolling needs a statistic that can revert an update");

public:
    Rolling(Stat &stat, size_t windowSize) : stat(stat), size(windowSize), buf(windowSize)
    {
        if (windowSize == 0)
        {
            throw std::invalid_argument("size has to be greater than 0");
        }
    }

    void update(double x) override
    {
        // a NaN would stay in the statistic after it leaves the window
        if (std::isnan(x))
        {
            throw InvariantViolation("cannot push a NaN value into a rolling statistic");
        }
        if (buf.full())
        {
            double oldest = buf.front();
            try
            {
                stat.Stat::revert(oldest);
            }
            catch (const std::exception &e)
            {
                // the statistic no longer matches the window, nothing sensible to recover
                std::cerr << "rolling: revert of " << oldest << " failed: " << e.what() << "\n";
                throw InvariantViolation(std::string("rolling revert failed: ") + e.what());
            }
            buf.pop_front();
        }
        buf.push_back(x);
        stat.Stat::update(x);
    }

    double get() const override
    {
        return stat.Stat::get();
    }

    size_t windowSize() const
    {
        return size;
    }

    size_t count() const
    {
        return buf.size();
    }

    std::vector<double> window() const
    {
        return std::vector<double>(buf.begin(), buf.end());
    }

    // reloads the FIFO written by to_json; the wrapped statistic is restored
    // separately and must already reflect these values
    void restoreWindow(const json &j)
    {
        auto windowSize = j.at("window_size").get<size_t>();
        auto values = j.at("window").get<std::vector<double>>();
        if (windowSize != size)
        {
            throw std::invalid_argument("window_size does not match this rolling statistic");
        }
        if (values.size() > size)
        {
            throw std::invalid_argument("window holds more values than its capacity");
        }
        buf.assign(size, values.begin(), values.end());
    }

    friend void to_json(json &j, const Rolling &r)
    {
        j = json{{"window_size", r.size}, {"window", r.window()}};
    }

private:
    Stat &stat;
    size_t size;
    boost::circular_buffer<double> buf;
};
