#pragma once

#include <bitset>
#include <cstdint>
#include <optional>
#include <vector>

#include <sw/concepts.hpp>
#include <sw/axidma/read_engine_config.hpp>

namespace sw::axidma {

using KeepMask = std::bitset<kMaxBusBytes>;
using BeatData = std::vector<uint8_t>;

// Read descriptor as presented on the descriptor intake channel
struct ReadDescriptor {
    Address address = 0;
    Size length = 0;            // bytes (AXI strobe units)
    uint64_t tag = 0;
    uint64_t stream_id = 0;
    uint64_t stream_dest = 0;
    uint64_t stream_user = 0;
};

// Completion status, one per accepted descriptor
struct CompletionStatus {
    uint64_t tag = 0;
};

// One AXI read burst derived from a descriptor
struct BurstCommand {
    Address address = 0;
    Size length = 0;            // bytes of the descriptor covered by this burst
    uint32_t arlen = 0;         // beats - 1
};

// AXI-stream data beat as seen by the consumer
struct OutputBeat {
    BeatData data;
    KeepMask keep;
    bool last = false;
    uint64_t id = 0;
    uint64_t dest = 0;
    uint64_t user = 0;
};

// AXI burst types and attributes driven on the AR channel
enum class AxiBurst : uint8_t { FIXED = 0, INCR = 1, WRAP = 2 };
enum class AxiResp : uint8_t { OKAY = 0, EXOKAY = 1, SLVERR = 2, DECERR = 3 };

constexpr uint8_t kArCacheModifiableBufferable = 0b0011;
constexpr uint8_t kArProtNonSecure = 0b010;

// AR channel signals
struct ArChannel {
    uint64_t id = 0;
    Address addr = 0;
    uint32_t len = 0;
    uint8_t size = 0;
    AxiBurst burst = AxiBurst::INCR;
    bool lock = false;
    uint8_t cache = kArCacheModifiableBufferable;
    uint8_t prot = kArProtNonSecure;
    bool valid = false;
};

// R channel signals
struct RChannel {
    uint64_t id = 0;
    BeatData data;
    AxiResp resp = AxiResp::OKAY;
    bool last = false;
    bool valid = false;
};

/**
 * @brief Per-descriptor bookkeeping that travels with the transfer
 *
 * Not part of the wire contract; it lets the engine correlate trace
 * records from acceptance to completion.
 */
struct TransferContext {
    uint64_t transaction_id = 0;
    Cycle accept_cycle = 0;
    Address address = 0;
    Size length = 0;
};

// Handoff from the burst issuer to the stream sequencer, one per descriptor
struct StreamCommand {
    uint32_t offset = 0;             // realignment shift complement, 0 when aligned
    uint32_t last_offset = 0;        // valid words in the final beat, 0 = full
    uint64_t input_cycle_count = 0;  // input beats - 1
    uint64_t output_cycle_count = 0; // output beats - 1
    bool bubble_cycle = false;       // first input beat only primes the save register
    bool zero_length = false;
    uint64_t tag = 0;
    uint64_t stream_id = 0;
    uint64_t stream_dest = 0;
    uint64_t stream_user = 0;
    TransferContext context;
};

// Beat held in the output stage; the completion rides with the final beat
struct StagedBeat {
    OutputBeat beat;
    std::optional<CompletionStatus> completion;
    TransferContext context;
};

} // namespace sw::axidma
