#pragma once

#include <cstdint>
#include <optional>

// Windows/MSVC compatibility
#ifdef _MSC_VER
    #pragma warning(push)
    #pragma warning(disable: 4251) // DLL interface warnings
    #ifdef BUILDING_AXIDMA_SIMULATOR
        #define AXIDMA_API __declspec(dllexport)
    #else
        #define AXIDMA_API __declspec(dllimport)
    #endif
#else
    #define AXIDMA_API
#endif

#include <sw/concepts.hpp>
#include <sw/axidma/axi_types.hpp>
#include <sw/axidma/read_engine_config.hpp>

namespace sw::axidma {

/**
 * @brief R channel to AXI-stream state machine
 *
 * Takes one stream command at a time from the burst issuer and turns the
 * R beats of that descriptor into output beats. Input and output cycles are
 * counted separately: with unaligned support the first input beat may only
 * prime the save register (bubble cycle), and a short unaligned transfer may
 * emit its final beat from the save register with no input left.
 *
 * `rready` is registered: evaluate() reports whether more input is wanted
 * and the engine combines that with the skid buffer's early ready.
 */
class AXIDMA_API StreamSequencer {
public:
    enum class Phase { IDLE, READ };

    struct State {
        Phase phase = Phase::IDLE;
        uint32_t offset = 0;
        uint32_t last_offset = 0;
        uint64_t input_cycle_count = 0;
        uint64_t output_cycle_count = 0;
        bool input_active = false;
        bool output_active = false;
        bool bubble_cycle = false;
        bool first_cycle = false;
        bool output_last_cycle = false;
        uint64_t tag = 0;
        uint64_t stream_id = 0;
        uint64_t stream_dest = 0;
        uint64_t stream_user = 0;
        TransferContext context;
        BeatData save_rdata;        // previous input beat for realignment
        bool rready = false;        // m_axi_rready register
    };

    struct Inputs {
        const StreamCommand* cmd = nullptr;  // non-null when the issuer holds a valid command
        const RChannel* r = nullptr;
        bool downstream_ready = false;       // skid buffer input_ready register
        bool downstream_drained = false;     // skid buffer holds nothing
    };

    struct Step {
        State next;
        bool cmd_ready = false;              // stream command consumed this cycle
        bool input_transfer = false;         // R beat consumed this cycle
        bool wants_input = false;            // rready request before the early-ready gate
        std::optional<StagedBeat> beat;      // beat presented to the skid buffer
        std::optional<CompletionStatus> direct_completion;  // zero-length descriptors
        TransferContext direct_context;

        // Latch rready from the skid buffer's early ready
        void finalize(bool downstream_ready_early) {
            next.rready = wants_input && downstream_ready_early;
        }
    };

private:
    ReadEngineGeometry geometry_;
    State state_;

    BeatData realign(const BeatData& rdata) const;

public:
    explicit StreamSequencer(const ReadEngineGeometry& geometry);

    Step evaluate(const Inputs& in) const;
    void commit(const Step& step) { state_ = step.next; }
    void reset();

    const State& state() const { return state_; }
    bool is_idle() const { return state_.phase == Phase::IDLE; }
    bool rready() const { return state_.rready; }
};

AXIDMA_API const char* to_string(StreamSequencer::Phase phase);

} // namespace sw::axidma

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
