#include <SortedWindow.hpp>
#include <StatsError.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

SortedWindow::SortedWindow(size_t capacity) : windowSize(capacity), unsortedWindow(capacity)
{
    sortedWindow.reserve(capacity);
}

void SortedWindow::pushBack(double x)
{
    if (std::isnan(x))
    {
        throw InvariantViolation("cannot push a NaN value into SortedWindow");
    }
    if (windowSize == 0)
    {
        throw InvariantViolation("cannot push into a SortedWindow of capacity 0");
    }

    // drop the oldest value before inserting the new one
    if (sortedWindow.size() == windowSize)
    {
        double oldest = unsortedWindow.front();
        unsortedWindow.pop_front();

        // duplicates are interchangeable, any equal element will do
        auto pos = std::lower_bound(sortedWindow.begin(), sortedWindow.end(), oldest);
        if (pos == sortedWindow.end() || *pos != oldest)
        {
            throw InvariantViolation("oldest value missing from the sorted view");
        }
        sortedWindow.erase(pos);
    }

    unsortedWindow.push_back(x);
    sortedWindow.insert(std::lower_bound(sortedWindow.begin(), sortedWindow.end(), x), x);
}

double SortedWindow::front() const
{
    if (sortedWindow.empty())
    {
        throw InvariantViolation("window is empty");
    }
    return sortedWindow.front();
}

double SortedWindow::back() const
{
    if (sortedWindow.empty())
    {
        throw InvariantViolation("window is empty");
    }
    return sortedWindow.back();
}

double SortedWindow::operator[](size_t rank) const
{
    if (rank >= sortedWindow.size())
    {
        throw InvariantViolation("rank " + std::to_string(rank) + " out of range for window of length " +
                                 std::to_string(sortedWindow.size()));
    }
    return sortedWindow[rank];
}

size_t SortedWindow::size() const
{
    return sortedWindow.size();
}

bool SortedWindow::empty() const
{
    return sortedWindow.empty();
}

size_t SortedWindow::capacity() const
{
    return windowSize;
}

std::vector<double> SortedWindow::sorted() const
{
    return sortedWindow;
}

std::vector<double> SortedWindow::insertionOrder() const
{
    return std::vector<double>(unsortedWindow.begin(), unsortedWindow.end());
}

void to_json(json &j, const SortedWindow &w)
{
    j = json{{"window_size", w.windowSize},
             {"sorted_window", w.sortedWindow},
             {"unsorted_window", w.insertionOrder()}};
}

void from_json(const json &j, SortedWindow &w)
{
    auto windowSize = j.at("window_size").get<size_t>();
    auto sortedValues = j.at("sorted_window").get<std::vector<double>>();
    auto unsortedValues = j.at("unsorted_window").get<std::vector<double>>();

    if (sortedValues.size() != unsortedValues.size())
    {
        throw std::invalid_argument("sorted and unsorted windows differ in length");
    }
    if (sortedValues.size() > windowSize)
    {
        throw std::invalid_argument("window holds more values than its capacity");
    }
    if (!std::is_sorted(sortedValues.begin(), sortedValues.end()))
    {
        throw std::invalid_argument("sorted_window is not sorted");
    }
    if (!std::is_permutation(sortedValues.begin(), sortedValues.end(), unsortedValues.begin()))
    {
        throw std::invalid_argument("sorted and unsorted windows hold different values");
    }

    w.windowSize = windowSize;
    w.unsortedWindow = boost::circular_buffer<double>(windowSize, unsortedValues.begin(), unsortedValues.end());
    w.sortedWindow = std::move(sortedValues);
    w.sortedWindow.reserve(windowSize);
}
