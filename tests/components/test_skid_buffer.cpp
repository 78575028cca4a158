#include <algorithm>
#include <vector>
#include <optional>
#include <random>

#include <catch2/catch.hpp>
#include <sw/axidma/components/skid_buffer.hpp>

using namespace sw::axidma;

namespace {

// Producer honouring the registered ready, consumer driven by a pattern
template <typename SinkPattern, typename SourcePattern>
std::vector<int> run_skid(SkidBuffer<int>& skid, int count, SinkPattern sink_ready, SourcePattern source_valid,
                          int& max_occupancy, int max_cycles = 100000) {
    std::vector<int> received;
    int next = 0;

    for (int cycle = 0; cycle < max_cycles && static_cast<int>(received.size()) < count; ++cycle) {
        const bool ready = sink_ready(cycle);
        std::optional<int> input;
        if (skid.input_ready() && next < count && source_valid(cycle)) {
            input = next;
        }

        if (skid.output_valid() && ready) {
            received.push_back(skid.output());
        }

        auto step = skid.evaluate(input, ready);
        skid.commit(step);
        if (input) ++next;

        max_occupancy = std::max(max_occupancy, skid.occupancy());
    }
    return received;
}

} // namespace

TEST_CASE("Skid buffer - starts empty and not ready", "[skid][basic]") {
    SkidBuffer<int> skid;
    REQUIRE(skid.is_empty());
    REQUIRE_FALSE(skid.input_ready());
    REQUIRE_FALSE(skid.output_valid());
    REQUIRE(skid.occupancy() == 0);

    // ready registers one cycle after reset
    skid.commit(skid.evaluate(std::nullopt, false));
    REQUIRE(skid.input_ready());
}

TEST_CASE("Skid buffer - one cycle latency when the sink is always ready", "[skid][basic]") {
    SkidBuffer<int> skid;
    skid.commit(skid.evaluate(std::nullopt, true));

    for (int value = 0; value < 8; ++value) {
        REQUIRE(skid.input_ready());
        auto step = skid.evaluate(value, true);
        REQUIRE(step.loaded_output);
        skid.commit(step);
        REQUIRE(skid.output_valid());
        REQUIRE(skid.output() == value);
        REQUIRE(skid.occupancy() == 1);
    }
}

TEST_CASE("Skid buffer - stalled sink parks one beat in temp", "[skid][backpressure]") {
    SkidBuffer<int> skid;
    skid.commit(skid.evaluate(std::nullopt, true));

    // beat 0 into output
    skid.commit(skid.evaluate(0, false));
    REQUIRE(skid.output() == 0);
    REQUIRE(skid.input_ready());

    // beat 1 arrives while the sink stalls: parked, ready drops
    skid.commit(skid.evaluate(1, false));
    REQUIRE(skid.occupancy() == 2);
    REQUIRE_FALSE(skid.input_ready());

    // stall continues: nothing moves
    skid.commit(skid.evaluate(std::nullopt, false));
    REQUIRE(skid.occupancy() == 2);
    REQUIRE(skid.output() == 0);

    // sink takes beat 0, temp drains into output
    auto step = skid.evaluate(std::nullopt, true);
    REQUIRE(step.loaded_output);
    skid.commit(step);
    REQUIRE(skid.output() == 1);
    REQUIRE(skid.occupancy() == 1);
    REQUIRE(skid.input_ready());
}

TEST_CASE("Skid buffer - order preserved under random stalls", "[skid][backpressure]") {
    const int count = 1000;
    std::mt19937 rng(0x5eed);
    std::bernoulli_distribution sink_dist(0.6);
    std::bernoulli_distribution source_dist(0.8);

    SkidBuffer<int> skid;
    int max_occupancy = 0;
    auto received = run_skid(skid, count,
                             [&](int) { return sink_dist(rng); },
                             [&](int) { return source_dist(rng); },
                             max_occupancy);

    REQUIRE(received.size() == static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        REQUIRE(received[i] == i);
    }
    REQUIRE(max_occupancy == 2);
}

TEST_CASE("Skid buffer - order preserved with every other cycle stalled", "[skid][backpressure]") {
    const int count = 200;
    SkidBuffer<int> skid;
    int max_occupancy = 0;
    auto received = run_skid(skid, count,
                             [](int cycle) { return cycle % 2 == 0; },
                             [](int) { return true; },
                             max_occupancy, 1000);

    REQUIRE(received.size() == static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        REQUIRE(received[i] == i);
    }
    REQUIRE(max_occupancy <= 2);
}

TEST_CASE("Skid buffer - reset clears validity only", "[skid][reset]") {
    SkidBuffer<int> skid;
    skid.commit(skid.evaluate(std::nullopt, true));
    skid.commit(skid.evaluate(42, false));
    skid.commit(skid.evaluate(43, false));
    REQUIRE(skid.occupancy() == 2);

    skid.reset();
    REQUIRE(skid.is_empty());
    REQUIRE_FALSE(skid.input_ready());
    REQUIRE(skid.output() == 42);   // data register untouched

    skid.reset();
    REQUIRE(skid.is_empty());
}
