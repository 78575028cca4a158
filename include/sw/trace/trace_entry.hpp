#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <optional>

// Windows/MSVC compatibility
#ifdef _MSC_VER
    #pragma warning(push)
    #pragma warning(disable: 4251)
    #ifdef BUILDING_AXIDMA_SIMULATOR
        #define AXIDMA_API __declspec(dllexport)
    #else
        #define AXIDMA_API __declspec(dllimport)
    #endif
#else
    #define AXIDMA_API
#endif

namespace sw::trace {

// Fundamental time unit for the simulator
using CycleCount = uint64_t;

// Components of the AXI DMA read datapath
enum class ComponentType : uint8_t {
    // Descriptor side
    DESCRIPTOR_SOURCE = 0,     // Upstream descriptor producer (driver/host model)

    // Read engine blocks
    READ_ENGINE = 1,           // Top-level AXI DMA read engine
    BURST_ISSUER = 2,          // AR channel state machine
    STREAM_SEQUENCER = 3,      // R channel to AXI-stream state machine
    SKID_BUFFER = 4,           // Output register + temp register stage

    // Collaborators
    AXI_MEMORY = 5,            // AXI slave answering read bursts
    STREAM_SINK = 6,           // AXI-stream consumer

    UNKNOWN = 255
};

// Transaction types observed on the engine interfaces
enum class TransactionType : uint8_t {
    DESCRIPTOR = 0,    // Read descriptor, from acceptance to completion status
    BURST_READ = 1,    // One AR request and its R beats
    STREAM = 2,        // AXI-stream output activity

    // Control transactions
    CONFIGURE = 20,
    RESET = 21,

    UNKNOWN = 255
};

// Transaction status
enum class TransactionStatus : uint8_t {
    ISSUED = 0,      // Transaction has been issued
    IN_PROGRESS = 1, // Transaction is being processed
    COMPLETED = 2,   // Transaction completed successfully
    FAILED = 3,      // Transaction failed
    CANCELLED = 4    // Transaction was cancelled (reset)
};

// Transaction-specific payload data structures

// Descriptor payload - what the source asked for
struct DescriptorPayload {
    uint64_t address;
    uint64_t length;         // bytes
    uint64_t tag;
    uint64_t stream_id;
    uint64_t stream_dest;
    uint64_t stream_user;

    DescriptorPayload()
        : address(0), length(0), tag(0), stream_id(0), stream_dest(0), stream_user(0) {}
};

// Burst payload - one AR request
struct BurstPayload {
    uint64_t address;
    uint64_t length;         // bytes covered by the burst
    uint32_t beats;          // arlen + 1
    uint32_t beat_bytes;     // 1 << arsize

    BurstPayload() : address(0), length(0), beats(0), beat_bytes(0) {}
};

// Stream payload - data delivered on the AXI-stream side
struct StreamPayload {
    uint64_t beats;
    uint64_t bytes;          // sum of keep bits
    uint64_t stall_cycles;   // cycles the sink held tready low with data pending

    StreamPayload() : beats(0), bytes(0), stall_cycles(0) {}
};

// Control/synchronization payload
struct ControlPayload {
    std::string command;      // Control command string
    uint64_t parameter;       // Generic parameter

    ControlPayload() : parameter(0) {}
};

// Variant to hold different payload types
using PayloadData = std::variant<
    std::monostate,          // No payload
    DescriptorPayload,
    BurstPayload,
    StreamPayload,
    ControlPayload
>;

// Main trace entry structure - cycle-based timestamping
struct AXIDMA_API TraceEntry {
    // Cycle-based timing (deterministic)
    CycleCount cycle_issue;      // Cycle when transaction was issued
    CycleCount cycle_complete;   // Cycle when transaction completed (0 if not completed)

    // Component identification
    ComponentType component_type;
    uint32_t component_id;

    // Transaction details
    TransactionType transaction_type;
    TransactionStatus status;
    uint64_t transaction_id;        // Unique transaction ID

    // Optional payload
    PayloadData payload;

    // Optional metadata
    std::string description;

    // Clock frequency for this component (GHz) - optional, for time conversion
    std::optional<double> clock_freq_ghz;

    TraceEntry(CycleCount cycle, ComponentType comp_type, uint32_t comp_id,
               TransactionType trans_type, uint64_t trans_id)
        : cycle_issue(cycle)
        , cycle_complete(0)
        , component_type(comp_type)
        , component_id(comp_id)
        , transaction_type(trans_type)
        , status(TransactionStatus::ISSUED)
        , transaction_id(trans_id)
        , payload()
        , description()
        , clock_freq_ghz()
    {}

    // Mark transaction as completed
    void complete(CycleCount completion_cycle, TransactionStatus final_status = TransactionStatus::COMPLETED) {
        cycle_complete = completion_cycle;
        status = final_status;
    }

    // Duration in cycles (0 while the transaction is still open)
    CycleCount get_duration_cycles() const {
        if (status == TransactionStatus::ISSUED || status == TransactionStatus::IN_PROGRESS) {
            return 0;
        }
        return cycle_complete - cycle_issue;
    }

    double get_issue_time_ns() const {
        if (!clock_freq_ghz.has_value()) return -1.0;
        return static_cast<double>(cycle_issue) / clock_freq_ghz.value();
    }

    double get_complete_time_ns() const {
        if (!clock_freq_ghz.has_value() || cycle_complete == 0) return -1.0;
        return static_cast<double>(cycle_complete) / clock_freq_ghz.value();
    }

    double get_duration_ns() const {
        if (!clock_freq_ghz.has_value() || cycle_complete == 0) return -1.0;
        return static_cast<double>(get_duration_cycles()) / clock_freq_ghz.value();
    }
};

// Helper functions to convert enums to strings for export/debugging
AXIDMA_API const char* to_string(ComponentType type);
AXIDMA_API const char* to_string(TransactionType type);
AXIDMA_API const char* to_string(TransactionStatus status);

} // namespace sw::trace

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
