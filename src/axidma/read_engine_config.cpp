#include <stdexcept>
#include <string>

#include <sw/axidma/read_engine_config.hpp>

namespace sw::axidma {

namespace {

bool is_power_of_two(Size value) {
    return value != 0 && (value & (value - 1)) == 0;
}

unsigned clog2(Size value) {
    unsigned bits = 0;
    while ((Size(1) << bits) < value) ++bits;
    return bits;
}

void check_field_width(const char* name, Size width, ConfigValidationResult& result) {
    if (width == 0 || width > 64) {
        result.errors.push_back(std::string(name) + " must be between 1 and 64 bits (got " +
                                std::to_string(width) + ")");
    }
}

} // namespace

ConfigValidationResult validate_config(const ReadEngineConfig& config) {
    ConfigValidationResult result;

    // AXI side: words are strobe lanes
    const Size axi_data_width = config.axi_data_width;
    if (axi_data_width == 0 || axi_data_width % 8 != 0) {
        result.errors.push_back("AXI data width not evenly divisible into byte lanes (got " +
                                std::to_string(axi_data_width) + " bits)");
    } else if (axi_data_width > kMaxBusBytes * 8) {
        result.errors.push_back("AXI data width must not exceed " +
                                std::to_string(kMaxBusBytes * 8) + " bits");
    } else if (!is_power_of_two(axi_data_width / 8)) {
        result.errors.push_back("AXI word width must be even power of two (got " +
                                std::to_string(axi_data_width / 8) + " byte lanes)");
    }

    // AXI-stream side
    const Size axis_data_width = config.axis_data_width ? config.axis_data_width : axi_data_width;
    const Size axis_keep_width = config.axis_keep_enable
        ? (config.axis_keep_width ? config.axis_keep_width : axis_data_width / 8)
        : 1;

    if (axis_keep_width == 0 || axis_data_width % axis_keep_width != 0) {
        result.errors.push_back("AXI stream data width not evenly divisible (" +
                                std::to_string(axis_data_width) + " bits over " +
                                std::to_string(axis_keep_width) + " keep bits)");
    } else if (axi_data_width % 8 == 0 && axis_data_width / axis_keep_width != 8) {
        result.errors.push_back("word size mismatch: AXI words are 8 bits, AXI stream words are " +
                                std::to_string(axis_data_width / axis_keep_width) + " bits");
    }

    if (axi_data_width != axis_data_width) {
        result.errors.push_back("AXI interface width must match AXI stream interface width");
    }

    if (config.axi_max_burst_len < 1 || config.axi_max_burst_len > 256) {
        result.errors.push_back("AXI_MAX_BURST_LEN must be between 1 and 256 (got " +
                                std::to_string(config.axi_max_burst_len) + ")");
    }

    if (config.enable_sg) {
        result.errors.push_back("scatter/gather is not yet implemented");
    }

    check_field_width("axi_addr_width", config.axi_addr_width, result);
    check_field_width("axi_id_width", config.axi_id_width, result);
    check_field_width("len_width", config.len_width, result);
    check_field_width("tag_width", config.tag_width, result);
    if (config.axis_id_enable) check_field_width("axis_id_width", config.axis_id_width, result);
    if (config.axis_dest_enable) check_field_width("axis_dest_width", config.axis_dest_width, result);
    if (config.axis_user_enable) check_field_width("axis_user_width", config.axis_user_width, result);

    // Non-fatal observations
    if (!config.enable_unaligned && axi_data_width > 8) {
        result.warnings.push_back("unaligned transfers disabled: descriptor addresses are aligned down to the bus width");
    }
    if (config.axi_addr_width > 0 && config.axi_addr_width < 12) {
        result.warnings.push_back("address space smaller than one 4 KB page");
    }
    if (config.len_width > 0 && config.len_width < 64 &&
        axi_data_width % 8 == 0 &&
        low_mask(config.len_width) < axi_data_width / 8) {
        result.warnings.push_back("len_width cannot express a full beat");
    }

    result.valid = result.errors.empty();
    return result;
}

ReadEngineGeometry ReadEngineGeometry::from(const ReadEngineConfig& config) {
    ConfigValidationResult result = validate_config(config);
    if (!result) {
        std::string message = "Invalid AXI DMA read engine configuration:";
        for (const auto& error : result.errors) {
            message += "\n  - " + error;
        }
        throw std::invalid_argument(message);
    }

    ReadEngineGeometry g{};
    g.bus_bytes = config.axi_data_width / 8;
    g.word_bits = 8;
    g.burst_size = clog2(g.bus_bytes);
    g.max_burst_len = config.axi_max_burst_len;
    g.max_burst_bytes = config.axi_max_burst_len << g.burst_size;
    g.keep_width = config.axis_keep_enable ? g.bus_bytes : 1;

    g.offset_mask = g.bus_bytes > 1 ? static_cast<Address>(g.bus_bytes - 1) : 0;
    g.addr_mask = low_mask(config.axi_addr_width);
    g.aligned_addr_mask = g.addr_mask & ~g.offset_mask;

    g.len_mask = low_mask(config.len_width);
    g.tag_mask = low_mask(config.tag_width);
    g.id_mask = config.axis_id_enable ? low_mask(config.axis_id_width) : 0;
    g.dest_mask = config.axis_dest_enable ? low_mask(config.axis_dest_width) : 0;
    g.user_mask = config.axis_user_enable ? low_mask(config.axis_user_width) : 0;

    g.keep_enable = config.axis_keep_enable && g.keep_width > 1;
    g.last_enable = config.axis_last_enable;
    g.unaligned = config.enable_unaligned;
    g.check_protocol = config.check_protocol;
    return g;
}

} // namespace sw::axidma
