#include <vector>
#include <numeric>

#include <catch2/catch.hpp>
#include <sw/axidma/components/stream_sequencer.hpp>

using namespace sw::axidma;

// Drives the sequencer with one command and an always-valid R channel
class StreamSequencerFixture {
public:
    ReadEngineGeometry geometry;
    StreamSequencer sequencer;
    std::vector<uint8_t> memory;
    std::vector<OutputBeat> beats;
    std::vector<CompletionStatus> completions;
    int bubble_cycles = 0;

    StreamSequencerFixture()
        : geometry(make_geometry())
        , sequencer(geometry)
        , memory(256)
    {
        std::iota(memory.begin(), memory.end(), uint8_t(0));
    }

    static ReadEngineGeometry make_geometry() {
        ReadEngineConfig config;
        config.axi_data_width = 32;
        config.enable_unaligned = true;
        return ReadEngineGeometry::from(config);
    }

    static StreamCommand make_command(const ReadEngineGeometry& g, Address address, Size length, uint64_t tag) {
        const Size word_offset = static_cast<Size>(address & g.offset_mask);
        StreamCommand cmd;
        cmd.offset = static_cast<uint32_t>((g.bus_bytes - word_offset) & g.offset_mask);
        cmd.bubble_cycle = cmd.offset > 0;
        cmd.input_cycle_count = (length + word_offset - 1) >> g.burst_size;
        cmd.output_cycle_count = (length - 1) >> g.burst_size;
        cmd.last_offset = static_cast<uint32_t>(length & g.offset_mask);
        cmd.tag = tag;
        cmd.context.address = address;
        cmd.context.length = length;
        return cmd;
    }

    // R beats come from the aligned address of the transfer
    void run(const StreamCommand& cmd, Address address, int max_cycles = 100) {
        Address beat_addr = address & ~static_cast<Address>(geometry.offset_mask);
        bool cmd_pending = true;

        for (int cycle = 0; cycle < max_cycles; ++cycle) {
            RChannel r;
            r.valid = true;
            r.data.assign(memory.begin() + beat_addr, memory.begin() + beat_addr + geometry.bus_bytes);

            StreamSequencer::Inputs in;
            in.cmd = cmd_pending ? &cmd : nullptr;
            in.r = &r;
            in.downstream_ready = true;
            in.downstream_drained = true;

            auto step = sequencer.evaluate(in);
            step.finalize(true);

            if (step.cmd_ready) cmd_pending = false;
            if (step.input_transfer) {
                if (sequencer.state().bubble_cycle) ++bubble_cycles;
                beat_addr += geometry.bus_bytes;
            }
            if (step.beat) {
                beats.push_back(step.beat->beat);
                if (step.beat->completion) completions.push_back(*step.beat->completion);
            }
            sequencer.commit(step);

            if (!cmd_pending && sequencer.is_idle()) break;
        }
    }

    std::vector<uint8_t> kept_bytes() const {
        std::vector<uint8_t> bytes;
        for (const auto& beat : beats) {
            for (Size i = 0; i < beat.data.size(); ++i) {
                if (beat.keep.test(i)) bytes.push_back(beat.data[i]);
            }
        }
        return bytes;
    }

    std::vector<uint8_t> expected(Address address, Size length) const {
        return std::vector<uint8_t>(memory.begin() + address, memory.begin() + address + length);
    }
};

TEST_CASE_METHOD(StreamSequencerFixture, "Stream sequencer - aligned transfer forwards beats unchanged", "[sequencer][aligned]") {
    auto cmd = make_command(geometry, 0x10, 16, 7);
    run(cmd, 0x10);

    REQUIRE(beats.size() == 4);
    REQUIRE(bubble_cycles == 0);
    REQUIRE(beats[0].data == std::vector<uint8_t>{0x10, 0x11, 0x12, 0x13});
    for (size_t i = 0; i < beats.size(); ++i) {
        REQUIRE(beats[i].keep.count() == 4);
        REQUIRE(beats[i].last == (i == beats.size() - 1));
    }
    REQUIRE(completions.size() == 1);
    REQUIRE(completions[0].tag == 7);
}

TEST_CASE_METHOD(StreamSequencerFixture, "Stream sequencer - partial final beat is keep-masked", "[sequencer][keep]") {
    auto cmd = make_command(geometry, 0x20, 10, 1);
    run(cmd, 0x20);

    REQUIRE(beats.size() == 3);
    REQUIRE(beats.back().last);
    REQUIRE(beats.back().keep.count() == 2);
    REQUIRE(beats.back().keep.test(0));
    REQUIRE(beats.back().keep.test(1));
    REQUIRE(kept_bytes() == expected(0x20, 10));
}

TEST_CASE_METHOD(StreamSequencerFixture, "Stream sequencer - unaligned start realigns through the save register", "[sequencer][unaligned]") {
    auto cmd = make_command(geometry, 0x03, 10, 2);
    run(cmd, 0x03);

    // 4 input beats, the first one only primes the save register
    REQUIRE(bubble_cycles == 1);
    REQUIRE(beats.size() == 3);
    REQUIRE(beats[0].data == std::vector<uint8_t>{0x03, 0x04, 0x05, 0x06});
    REQUIRE(beats[1].data == std::vector<uint8_t>{0x07, 0x08, 0x09, 0x0a});
    REQUIRE(beats[2].keep.count() == 2);
    REQUIRE(kept_bytes() == expected(0x03, 10));
    REQUIRE(completions.size() == 1);
}

TEST_CASE_METHOD(StreamSequencerFixture, "Stream sequencer - short unaligned transfer drains from the save register", "[sequencer][unaligned]") {
    SECTION("Single byte at the top of a word") {
        auto cmd = make_command(geometry, 0x43, 1, 3);
        run(cmd, 0x43);
        REQUIRE(beats.size() == 1);
        REQUIRE(beats[0].keep.count() == 1);
        REQUIRE(kept_bytes() == expected(0x43, 1));
    }

    SECTION("Three bytes from offset one") {
        auto cmd = make_command(geometry, 0x41, 3, 3);
        run(cmd, 0x41);
        REQUIRE(beats.size() == 1);
        REQUIRE(kept_bytes() == expected(0x41, 3));
    }

    SECTION("Full word straddling two input beats") {
        auto cmd = make_command(geometry, 0x42, 4, 3);
        run(cmd, 0x42);
        REQUIRE(beats.size() == 1);
        REQUIRE(beats[0].keep.count() == 4);
        REQUIRE(kept_bytes() == expected(0x42, 4));
    }

    REQUIRE(completions.size() == 1);
    REQUIRE(beats.back().last);
}

TEST_CASE_METHOD(StreamSequencerFixture, "Stream sequencer - every offset and length streams the right bytes", "[sequencer][unaligned]") {
    for (Address address = 0x80; address < 0x84; ++address) {
        for (Size length = 1; length <= 13; ++length) {
            sequencer = StreamSequencer(geometry);
            beats.clear();
            completions.clear();

            run(make_command(geometry, address, length, 0), address);
            REQUIRE(kept_bytes() == expected(address, length));
            REQUIRE(beats.size() == (length + geometry.bus_bytes - 1) / geometry.bus_bytes);
            REQUIRE(completions.size() == 1);
        }
    }
}

TEST_CASE_METHOD(StreamSequencerFixture, "Stream sequencer - zero length waits for a drained output stage", "[sequencer][zero]") {
    StreamCommand cmd;
    cmd.zero_length = true;
    cmd.tag = 9;

    RChannel r;
    StreamSequencer::Inputs in;
    in.cmd = &cmd;
    in.r = &r;
    in.downstream_ready = true;
    in.downstream_drained = false;

    auto step = sequencer.evaluate(in);
    REQUIRE_FALSE(step.cmd_ready);
    REQUIRE_FALSE(step.direct_completion);

    in.downstream_drained = true;
    step = sequencer.evaluate(in);
    REQUIRE(step.cmd_ready);
    REQUIRE(step.direct_completion);
    REQUIRE(step.direct_completion->tag == 9);
    REQUIRE_FALSE(step.beat);
    REQUIRE(step.next.phase == StreamSequencer::Phase::IDLE);
}

TEST_CASE_METHOD(StreamSequencerFixture, "Stream sequencer - rready follows downstream early ready", "[sequencer][backpressure]") {
    auto cmd = make_command(geometry, 0x00, 16, 0);
    RChannel r;
    r.valid = true;
    r.data.assign(4, 0);

    StreamSequencer::Inputs in;
    in.cmd = &cmd;
    in.r = &r;
    in.downstream_ready = true;
    in.downstream_drained = true;

    auto step = sequencer.evaluate(in);
    step.finalize(false);
    sequencer.commit(step);
    REQUIRE(sequencer.state().phase == StreamSequencer::Phase::READ);
    REQUIRE_FALSE(sequencer.rready());

    // no rready, no transfer even though rvalid is high
    in.cmd = nullptr;
    step = sequencer.evaluate(in);
    REQUIRE_FALSE(step.input_transfer);
    REQUIRE_FALSE(step.beat);
    step.finalize(true);
    sequencer.commit(step);
    REQUIRE(sequencer.rready());

    step = sequencer.evaluate(in);
    REQUIRE(step.input_transfer);
    REQUIRE(step.beat);
}
