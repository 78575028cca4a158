#pragma once

#include <chrono>
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
#include <sw/axidma/read_engine_config.hpp>
#include <sw/axidma/axi_dma_read_engine.hpp>
#include <sw/axidma/components/axi_memory.hpp>

namespace sw::axidma {

/**
 * @brief Read engine wired to an AXI memory, a descriptor FIFO and a stream sink
 *
 * Every cycle the harness samples the registered outputs of engine and
 * memory, drives each with the other's wires, records the handshakes that
 * happened and clocks both. Recording order within a cycle is AR burst,
 * stream beat, completion status.
 */
class AXIDMA_API AxiDmaReadSimulator {
public:
    struct Config {
        ReadEngineConfig engine;
        AxiMemory::Config memory;   // bus width is taken from the engine
        double clock_freq_ghz = 0.25;
        bool tracing = false;
    };

    using ReadyPattern = std::function<bool(Cycle)>;   // sink tready per cycle

    struct IssuedBurst {
        ArChannel ar;
        Cycle cycle;
    };

    struct ReceivedBeat {
        OutputBeat beat;
        Cycle cycle;
    };

    struct ReceivedStatus {
        CompletionStatus status;
        Cycle cycle;
    };

private:
    Config config_;
    AxiDmaReadEngine engine_;
    AxiMemory memory_;

    std::deque<ReadDescriptor> pending_;
    ReadyPattern sink_ready_;
    bool enable_;

    std::vector<IssuedBurst> bursts_;
    std::vector<ReceivedBeat> beats_;
    std::vector<ReceivedStatus> statuses_;

    Cycle current_cycle_;
    uint64_t stall_cycles_;
    std::chrono::high_resolution_clock::time_point sim_start_time;

    static AxiMemory::Config memory_config(const Config& config);

public:
    explicit AxiDmaReadSimulator(const Config& config);

    // Descriptor source
    void submit(const ReadDescriptor& descriptor) { pending_.push_back(descriptor); }
    size_t get_pending_descriptors() const { return pending_.size(); }

    void set_enable(bool enable) { enable_ = enable; }
    void set_sink_ready_pattern(ReadyPattern pattern) { sink_ready_ = std::move(pattern); }

    // Simulation control
    void step();
    Cycle run_until_idle(Cycle max_cycles = 1000000);  // throws std::runtime_error on timeout
    bool is_idle() const;
    void reset();   // engine, bus state and records; memory contents survive
    void clear_records();

    // Memory backdoor
    void write_memory(Address addr, const void* data, Size size) { memory_.write(addr, data, size); }
    void read_memory(Address addr, void* data, Size size) const { memory_.read(addr, data, size); }

    // Records
    const std::vector<IssuedBurst>& get_bursts() const { return bursts_; }
    const std::vector<ReceivedBeat>& get_beats() const { return beats_; }
    const std::vector<ReceivedStatus>& get_statuses() const { return statuses_; }

    // Bytes of all received beats with their keep bit set, in stream order
    BeatData get_stream_bytes() const;
    // Same, split into one payload per last-terminated packet
    std::vector<BeatData> get_packets() const;

    // Components
    AxiDmaReadEngine& engine() { return engine_; }
    const AxiDmaReadEngine& engine() const { return engine_; }
    AxiMemory& memory() { return memory_; }
    const AxiMemory& memory() const { return memory_; }

    // Statistics
    Cycle get_current_cycle() const { return current_cycle_; }
    uint64_t get_stall_cycles() const { return stall_cycles_; }
    double get_elapsed_time_ms() const;
    const Config& get_config() const { return config_; }
    void print_stats() const;
    void print_component_status() const;
};

} // namespace sw::axidma

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
