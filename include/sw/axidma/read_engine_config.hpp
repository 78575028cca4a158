#pragma once

#include <cstdint>
#include <string>
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

namespace sw::axidma {

// Widest AXI data bus the model supports (1024 bits = 128 byte lanes)
constexpr Size kMaxBusBytes = 128;

// 4 KB page rule of the AXI specification
constexpr Address kAxiBoundary = 0x1000;

/**
 * @brief Elaboration parameters of the AXI DMA read engine
 *
 * Mirrors the HDL parameter list. Zero in a derived width field
 * (axis_data_width, axis_keep_width) selects the value the hardware would
 * derive from the other parameters.
 */
struct ReadEngineConfig {
    // AXI master interface
    Size axi_data_width = 32;       // bits
    Size axi_addr_width = 16;       // bits
    Size axi_id_width = 8;          // bits
    Size axi_max_burst_len = 16;    // beats, 1..256

    // AXI-stream output interface
    Size axis_data_width = 0;       // bits, 0 = same as axi_data_width
    bool axis_keep_enable = true;   // an 8-bit stream has a single keep bit either way
    Size axis_keep_width = 0;       // 0 = axis_data_width / 8
    bool axis_last_enable = true;
    bool axis_id_enable = false;
    Size axis_id_width = 8;
    bool axis_dest_enable = false;
    Size axis_dest_width = 8;
    bool axis_user_enable = true;
    Size axis_user_width = 1;

    // Descriptor fields
    Size len_width = 20;
    Size tag_width = 8;

    // Features
    bool enable_sg = false;          // scatter/gather, not implemented
    bool enable_unaligned = false;   // byte-granular start addresses

#ifdef NDEBUG
    bool check_protocol = false;     // verify rlast/burst accounting on the R channel
#else
    bool check_protocol = true;
#endif
};

/**
 * @brief Validation result for engine configurations
 */
struct ConfigValidationResult {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    explicit operator bool() const { return valid; }
};

// Collect every elaboration error and warning of a configuration
AXIDMA_API ConfigValidationResult validate_config(const ReadEngineConfig& config);

/**
 * @brief Quantities the hardware derives from its parameters
 *
 * Built once per engine; construction fails fast with std::invalid_argument
 * listing every configuration error.
 */
struct AXIDMA_API ReadEngineGeometry {
    Size bus_bytes;             // AXI_STRB_WIDTH, words per beat
    Size word_bits;             // AXI_WORD_SIZE
    unsigned burst_size;        // log2(bus_bytes), the arsize field
    Size max_burst_bytes;       // AXI_MAX_BURST_LEN << burst_size
    Size max_burst_len;
    Size keep_width;            // AXIS_KEEP_WIDTH_INT

    Address offset_mask;        // address bits below the bus width
    Address addr_mask;          // all valid address bits
    Address aligned_addr_mask;  // addr_mask with offset bits cleared

    uint64_t len_mask;
    uint64_t tag_mask;
    uint64_t id_mask;           // zero when the sideband is disabled
    uint64_t dest_mask;
    uint64_t user_mask;

    bool keep_enable;
    bool last_enable;
    bool unaligned;
    bool check_protocol;

    static ReadEngineGeometry from(const ReadEngineConfig& config);
};

// Mask with the low `bits` bits set (bits may be 64)
constexpr uint64_t low_mask(Size bits) {
    return bits >= 64 ? ~uint64_t(0) : ((uint64_t(1) << bits) - 1);
}

} // namespace sw::axidma

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
