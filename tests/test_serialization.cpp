/**
 * @file test_serialization.cpp
 * @brief JSON state records: field layout, round trips, malformed input
 */

#include "TestHarness.hpp"

#include <Extremes.hpp>
#include <Mean.hpp>
#include <PeakToPeak.hpp>
#include <Quantile.hpp>
#include <RollingQuantile.hpp>
#include <SortedWindow.hpp>
#include <Sum.hpp>
#include <Variance.hpp>

#include <random>
#include <stdexcept>
#include <vector>

static std::vector<double> make_stream(unsigned seed, int n) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> dist(50.0, 15.0);
    std::vector<double> out;
    for (int i = 0; i < n; ++i) {
        out.push_back(dist(rng));
    }
    return out;
}

// feed the first half, save and reload through a JSON string, then feed the
// second half to both and compare every read
template <typename Est>
static void check_round_trip(Est original, Est restored, const std::vector<double>& stream) {
    size_t half = stream.size() / 2;
    for (size_t i = 0; i < half; ++i) {
        original.update(stream[i]);
    }

    std::string text = json(original).dump();
    json::parse(text).get_to(restored);
    ASSERT_EQ(restored.get(), original.get());

    for (size_t i = half; i < stream.size(); ++i) {
        original.update(stream[i]);
        restored.update(stream[i]);
        ASSERT_EQ(restored.get(), original.get());
    }
}

TEST(test_quantile_fields) {
    Quantile est(0.25);
    for (double x : {1.0, 2.0, 3.0}) {
        est.update(x);
    }
    json j = est;
    ASSERT_EQ(j.at("q").get<double>(), 0.25);
    ASSERT_EQ(j.at("desired_marker_position").size(), 5u);
    ASSERT_EQ(j.at("marker_position").size(), 5u);
    ASSERT_EQ(j.at("position").size(), 5u);
    ASSERT_EQ(j.at("heights").size(), 3u);
    ASSERT_FALSE(j.at("heights_sorted").get<bool>());
}

TEST(test_quantile_round_trip) {
    auto stream = make_stream(1, 400);
    check_round_trip(Quantile(0.5), Quantile(), stream);
    check_round_trip(Quantile(0.95), Quantile(), stream);
    // saved while still collecting the first values
    check_round_trip(Quantile(0.1), Quantile(), make_stream(2, 6));
}

TEST(test_sorted_window_round_trip) {
    SortedWindow window(4);
    for (double x : {4.0, 1.0, 3.0, 2.0, 8.0}) {
        window.pushBack(x);
    }
    json j = window;
    ASSERT_EQ(j.at("window_size").get<size_t>(), 4u);
    ASSERT_TRUE((j.at("sorted_window").get<std::vector<double>>() == std::vector<double>{1.0, 2.0, 3.0, 8.0}));
    ASSERT_TRUE((j.at("unsorted_window").get<std::vector<double>>() == std::vector<double>{1.0, 3.0, 2.0, 8.0}));

    SortedWindow restored(0);
    j.get_to(restored);
    restored.pushBack(0.5);
    window.pushBack(0.5);
    ASSERT_TRUE((restored.sorted() == window.sorted()));
    ASSERT_TRUE((restored.insertionOrder() == window.insertionOrder()));
}

TEST(test_rolling_quantile_round_trip) {
    auto stream = make_stream(3, 300);
    check_round_trip(RollingQuantile(0.5, 25), RollingQuantile(0.5, 1), stream);
    check_round_trip(RollingQuantile(0.9, 500), RollingQuantile(0.5, 1), stream);

    json j = RollingQuantile(0.75, 9);
    for (const char* key : {"sorted_window", "q", "window_size", "lower", "higher", "frac"}) {
        ASSERT_TRUE(j.contains(key));
    }
}

TEST(test_accumulators_round_trip) {
    auto stream = make_stream(4, 100);
    check_round_trip(Sum(), Sum(), stream);
    check_round_trip(Mean(), Mean(), stream);
    check_round_trip(Variance(), Variance(), stream);
    check_round_trip(Variance(0), Variance(), stream);
    check_round_trip(Min(), Min(), stream);
    check_round_trip(Max(), Max(), stream);
    check_round_trip(PeakToPeak(), PeakToPeak(), stream);
    check_round_trip(RollingMin(10), RollingMin(1), stream);
    check_round_trip(RollingMax(10), RollingMax(1), stream);
    check_round_trip(RollingPeakToPeak(10), RollingPeakToPeak(1), stream);
}

TEST(test_untouched_extremes_survive) {
    json j = Min();
    ASSERT_TRUE(j.at("min").is_null());
    Min restored;
    restored.update(-3.0);
    j.get_to(restored);
    restored.update(5.0);
    ASSERT_EQ(restored.get(), 5.0);
}

TEST(test_malformed_records_rejected) {
    json quantile = Quantile(0.5);
    quantile["q"] = 1.5;
    Quantile est;
    ASSERT_THROWS(std::invalid_argument, quantile.get_to(est));

    json markers = Quantile(0.5);
    markers["position"] = {1.0, 2.0, 3.0};
    ASSERT_THROWS(std::invalid_argument, markers.get_to(est));

    SortedWindow window(0);
    json unsorted = {{"window_size", 3}, {"sorted_window", {3.0, 1.0}}, {"unsorted_window", {3.0, 1.0}}};
    ASSERT_THROWS(std::invalid_argument, unsorted.get_to(window));

    json overfull = {{"window_size", 1}, {"sorted_window", {1.0, 3.0}}, {"unsorted_window", {3.0, 1.0}}};
    ASSERT_THROWS(std::invalid_argument, overfull.get_to(window));

    json mismatched = {{"window_size", 3}, {"sorted_window", {1.0, 2.0}}, {"unsorted_window", {3.0, 1.0}}};
    ASSERT_THROWS(std::invalid_argument, mismatched.get_to(window));

    json rolling = RollingQuantile(0.5, 4);
    rolling["window_size"] = 0;
    RollingQuantile rq(0.5, 1);
    ASSERT_THROWS(std::invalid_argument, rolling.get_to(rq));
}

TEST(test_inconsistent_quantile_state_rejected) {
    Quantile est(0.5);
    for (double x : {9.0, 7.0, 3.0, 2.0, 6.0, 1.0, 8.0}) {
        est.update(x);
    }
    json good = est;
    Quantile restored;
    good.get_to(restored);
    ASSERT_EQ(restored.get(), est.get());

    json unsortedHeights = good;
    unsortedHeights["heights"] = {1.0, 5.0, 3.0, 7.0, 9.0};
    ASSERT_THROWS(std::invalid_argument, unsortedHeights.get_to(restored));

    json flatPositions = good;
    flatPositions["position"] = {1.0, 2.0, 2.0, 4.0, 7.0};
    ASSERT_THROWS(std::invalid_argument, flatPositions.get_to(restored));

    json decreasingPositions = good;
    decreasingPositions["position"] = {1.0, 3.0, 2.0, 4.0, 7.0};
    ASSERT_THROWS(std::invalid_argument, decreasingPositions.get_to(restored));

    json otherTargets = good;
    otherTargets["desired_marker_position"] = {0.0, 0.1, 0.2, 0.6, 1.0};
    ASSERT_THROWS(std::invalid_argument, otherTargets.get_to(restored));

    // still collecting: markers cannot have moved yet
    Quantile filling(0.5);
    filling.update(1.0);
    json early = filling;
    early["position"] = {1.0, 2.0, 3.0, 4.0, 6.0};
    ASSERT_THROWS(std::invalid_argument, early.get_to(restored));

    // a rejected record leaves the target untouched
    ASSERT_EQ(restored.get(), est.get());
}

TEST(test_negative_variance_state_rejected) {
    Variance var;
    var.update(1.0);
    var.update(3.0);
    json j = var;
    j["state"] = -1.0;
    Variance restored;
    ASSERT_THROWS(std::invalid_argument, j.get_to(restored));
}

int main() {
    return report("SERIALIZATION TESTS");
}
