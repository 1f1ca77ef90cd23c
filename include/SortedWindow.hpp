#pragma once

#include <boost/circular_buffer.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <vector>

using json = nlohmann::json;

// last N pushed values kept twice: in arrival order (to know what to evict)
// and sorted ascending (for rank access)
class SortedWindow
{
public:
    // capacity 0 is accepted here but pushBack will refuse it
    explicit SortedWindow(size_t capacity);

    // evicts the oldest value once full. throws InvariantViolation on NaN,
    // in which case the window is left untouched
    void pushBack(double x);

    double front() const;
    double back() const;
    // i-th smallest value held
    double operator[](size_t rank) const;

    size_t size() const;
    bool empty() const;
    size_t capacity() const;

    std::vector<double> sorted() const;
    std::vector<double> insertionOrder() const;

    friend void to_json(json &j, const SortedWindow &w);
    friend void from_json(const json &j, SortedWindow &w);

private:
    size_t windowSize;
    boost::circular_buffer<double> unsortedWindow;
    std::vector<double> sortedWindow;
};
