#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <stdexcept>

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
#include <sw/axidma/components/burst_issuer.hpp>
#include <sw/axidma/components/stream_sequencer.hpp>
#include <sw/axidma/components/skid_buffer.hpp>
#include <sw/trace/trace_logger.hpp>

namespace sw::axidma {

// Upstream AXI slave broke the read protocol (rlast misplaced, unsolicited data)
class AXIDMA_API ProtocolError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Cycle-accurate model of the AXI DMA read engine
 *
 * Descriptors enter on a valid/ready channel, leave as AXI read bursts on the
 * AR channel, come back on the R channel and are forwarded as an AXI-stream
 * with a completion status per descriptor.
 *
 * Clocking is two-phase: evaluate() computes every next register value from
 * the current registers and the wire inputs, commit() latches them all at
 * once. outputs() reflects the registers, so a caller can sample outputs,
 * drive the collaborators and then clock everything together.
 *
 * Example:
 * @code
 * AxiDmaReadEngine engine(ReadEngineConfig{});
 * AxiDmaReadEngine::Inputs in;
 * in.enable = true;
 * in.data_ready = true;
 * in.descriptor = ReadDescriptor{0x1000, 64, 7};
 * engine.tick(in);
 * @endcode
 */
class AXIDMA_API AxiDmaReadEngine {
public:
    using Config = ReadEngineConfig;
    using OutputStage = SkidBuffer<StagedBeat>;

    struct Inputs {
        std::optional<ReadDescriptor> descriptor;   // s_axis_read_desc_valid when present
        bool enable = true;
        bool ar_ready = false;
        RChannel r;
        bool data_ready = false;                    // m_axis_read_data_tready
    };

    struct Outputs {
        bool desc_ready = false;
        ArChannel ar;
        bool r_ready = false;
        OutputBeat data;
        bool data_valid = false;
        CompletionStatus status;
        bool status_valid = false;
    };

    struct Stats {
        uint64_t descriptors_accepted = 0;
        uint64_t descriptors_completed = 0;
        uint64_t bursts_issued = 0;
        uint64_t beats_in = 0;
        uint64_t beats_out = 0;
        uint64_t bytes_out = 0;
        uint64_t bubble_cycles = 0;
        uint64_t stall_cycles = 0;      // output valid while the sink held tready low
    };

private:
    // AR burst awaiting its R beats
    struct OutstandingBurst {
        BurstCommand burst;
        uint32_t beats_left;
        Cycle issue_cycle;
        TransferContext context;
    };

    // Output side of one descriptor, from its first visible beat
    struct StreamProgress {
        Cycle first_cycle;
        uint64_t beats;
        uint64_t bytes;
        uint64_t stall_cycles;
    };

    ReadEngineGeometry geometry_;
    size_t engine_id;

    BurstIssuer issuer_;
    StreamSequencer sequencer_;
    OutputStage output_stage_;

    // Completion status registers
    CompletionStatus status_;
    bool status_valid_;
    TransferContext status_context_;

    // Register inputs of the current cycle, latched by commit()
    BurstIssuer::Step issuer_step_;
    StreamSequencer::Step sequencer_step_;
    OutputStage::Step output_step_;
    CompletionStatus status_next_;
    bool status_valid_next_;
    TransferContext status_context_next_;
    bool evaluated_;

    // Protocol monitor
    std::optional<BurstCommand> ar_burst_;      // burst held in the AR registers
    TransferContext ar_context_;
    std::deque<OutstandingBurst> outstanding_;
    std::deque<OutstandingBurst> outstanding_next_;
    std::optional<OutstandingBurst> burst_done_;
    bool ar_handshake_;
    bool data_handshake_;
    bool data_stalled_;

    std::map<uint64_t, TransferContext> in_flight_;
    std::map<uint64_t, StreamProgress> stream_progress_;
    Stats stats_;

    // Tracing support
    bool tracing_enabled_;
    trace::TraceLogger* trace_logger_;
    double clock_freq_ghz_;
    Cycle current_cycle_;

    void trace_descriptor_accepted(const StreamCommand& cmd);
    void trace_burst(const OutstandingBurst& burst, bool completed);
    void trace_completion(const CompletionStatus& status, const TransferContext& context);
    void trace_stream(const TransferContext& context, const StreamProgress& progress);

public:
    explicit AxiDmaReadEngine(const Config& config, size_t engine_id = 0, double clock_freq_ghz = 0.25);

    // Enable/disable tracing
    void enable_tracing(bool enabled = true, trace::TraceLogger* logger = nullptr) {
        tracing_enabled_ = enabled;
        if (logger) trace_logger_ = logger;
    }

    Outputs outputs() const;

    void evaluate(const Inputs& in);
    void commit();
    void tick(const Inputs& in) { evaluate(in); commit(); }

    // Synchronous reset: all state machines to IDLE, every valid flag cleared
    void reset();

    // Result of the last evaluate()
    bool descriptor_accepted() const { return evaluated_ && issuer_step_.descriptor_accepted; }

    bool is_busy() const;
    Cycle get_current_cycle() const { return current_cycle_; }
    size_t get_engine_id() const { return engine_id; }
    const Stats& get_stats() const { return stats_; }
    const ReadEngineGeometry& geometry() const { return geometry_; }
    Size get_outstanding_bursts() const { return outstanding_.size(); }

    // Internal blocks, read-only
    const BurstIssuer& issuer() const { return issuer_; }
    const StreamSequencer& sequencer() const { return sequencer_; }
    const OutputStage& output_stage() const { return output_stage_; }
};

} // namespace sw::axidma

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
