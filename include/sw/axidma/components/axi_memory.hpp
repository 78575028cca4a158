#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

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

namespace sw::axidma {

// AXI slave memory answering read bursts in request order
class AXIDMA_API AxiMemory {
public:
    struct Config {
        Size capacity_bytes = 64 * 1024;
        Size bus_bytes = 4;
        Cycle read_latency = 2;        // cycles from AR handshake to first R beat
        Size max_outstanding = 4;      // AR requests queued before arready drops
    };

    // Deliberate protocol faults for checker tests
    enum class LastFault {
        NONE,
        MISSING,    // rlast never asserted
        EARLY       // rlast asserted one beat before the end of a multi-beat burst
    };

    using StallPattern = std::function<bool(Cycle)>;  // true = withhold rvalid this cycle

private:
    struct PendingBurst {
        uint64_t id;
        Address beat_addr;      // aligned address of the next beat
        uint32_t beats_left;
        uint32_t beats_total;
        Cycle ready_cycle;
    };

    struct State {
        std::deque<PendingBurst> pending;
        RChannel r;
        bool ar_ready = false;
    };

    Config config_;
    std::vector<uint8_t> memory_model;
    State state_;
    State next_;
    Cycle current_cycle_;
    StallPattern stall_pattern_;
    LastFault last_fault_;

    BeatData read_beat(Address aligned_addr) const;

public:
    explicit AxiMemory(const Config& config);

    // Backdoor access for test setup and result checking
    void read(Address addr, void* data, Size size) const;
    void write(Address addr, const void* data, Size size);

    // Wire outputs (registered)
    bool ar_ready() const { return state_.ar_ready; }
    const RChannel& r() const { return state_.r; }

    // Two-phase clocking
    void evaluate(const ArChannel& ar, bool r_ready);
    void commit();
    void reset();

    void set_stall_pattern(StallPattern pattern) { stall_pattern_ = std::move(pattern); }
    void set_last_fault(LastFault fault) { last_fault_ = fault; }

    bool is_idle() const { return state_.pending.empty() && !state_.r.valid; }
    Size get_outstanding() const { return state_.pending.size(); }
    Size get_capacity() const { return config_.capacity_bytes; }
    const Config& get_config() const { return config_; }
};

} // namespace sw::axidma

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
