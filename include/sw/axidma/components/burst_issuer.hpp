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
 * @brief Compute the next AXI burst of a transfer
 *
 * The burst never exceeds the configured maximum burst size and never
 * crosses a 4 KB boundary; when both limits apply the smaller wins.
 *
 * @param geometry Derived engine geometry
 * @param address Current transfer address (unaligned only with unaligned support)
 * @param remaining Bytes still to be requested, must be non-zero
 */
AXIDMA_API BurstCommand plan_burst(const ReadEngineGeometry& geometry, Address address, Size remaining);

// AR channel state machine: splits descriptors into bursts
class AXIDMA_API BurstIssuer {
public:
    enum class Phase { IDLE, START };

    struct State {
        Phase phase = Phase::IDLE;
        Address addr = 0;
        Size op_word_count = 0;     // bytes left to request
        bool desc_ready = false;    // descriptor intake ready register
        ArChannel ar;               // AR output registers
        StreamCommand cmd;          // stream command register
        bool cmd_valid = false;
    };

    struct Inputs {
        std::optional<ReadDescriptor> descriptor;   // present when desc_valid
        bool enable = false;
        bool ar_ready = false;
        bool cmd_ready = false;                     // sequencer takes the stream command
    };

    struct Step {
        State next;
        bool descriptor_accepted = false;
        std::optional<BurstCommand> burst;          // burst loaded into the AR registers
    };

private:
    ReadEngineGeometry geometry_;
    State state_;

    StreamCommand make_stream_command(const ReadDescriptor& desc, Address start_addr) const;

public:
    explicit BurstIssuer(const ReadEngineGeometry& geometry);

    Step evaluate(const Inputs& in) const;
    void commit(const Step& step) { state_ = step.next; }
    void reset();

    const State& state() const { return state_; }
    bool is_idle() const { return state_.phase == Phase::IDLE && !state_.cmd_valid && !state_.ar.valid; }
    const ReadEngineGeometry& geometry() const { return geometry_; }
};

AXIDMA_API const char* to_string(BurstIssuer::Phase phase);

} // namespace sw::axidma

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
