#include <string>
#include <algorithm>
#include <stdexcept>

#include <catch2/catch.hpp>
#include <sw/axidma/read_engine_config.hpp>

using namespace sw::axidma;

namespace {

bool has_error_containing(const ConfigValidationResult& result, const std::string& text) {
    return std::any_of(result.errors.begin(), result.errors.end(),
                       [&](const std::string& e) { return e.find(text) != std::string::npos; });
}

} // namespace

TEST_CASE("Read engine config - defaults are valid", "[config][engine]") {
    ReadEngineConfig config;
    auto result = validate_config(config);

    REQUIRE(result.valid);
    REQUIRE(result.errors.empty());
    // 32-bit bus with unaligned support off
    REQUIRE(result.warnings.size() == 1);
}

TEST_CASE("Read engine config - bus width errors", "[config][engine]") {
    ReadEngineConfig config;

    SECTION("Not a multiple of eight") {
        config.axi_data_width = 12;
        auto result = validate_config(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_error_containing(result, "byte lanes"));
    }

    SECTION("Strobe width not a power of two") {
        config.axi_data_width = 24;
        auto result = validate_config(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_error_containing(result, "power of two"));
    }

    SECTION("Wider than 1024 bits") {
        config.axi_data_width = 2048;
        auto result = validate_config(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_error_containing(result, "must not exceed"));
    }

    SECTION("Stream width differs from AXI width") {
        config.axis_data_width = 64;
        auto result = validate_config(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_error_containing(result, "must match AXI stream interface width"));
    }

    SECTION("Keep disabled on a multi-byte stream") {
        config.axis_keep_enable = false;
        auto result = validate_config(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_error_containing(result, "word size mismatch"));
    }

    SECTION("Keep width that does not divide the stream") {
        config.axis_keep_width = 3;
        auto result = validate_config(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(has_error_containing(result, "not evenly divisible"));
    }
}

TEST_CASE("Read engine config - parameter range errors", "[config][engine]") {
    ReadEngineConfig config;

    SECTION("Burst length zero") {
        config.axi_max_burst_len = 0;
        REQUIRE(has_error_containing(validate_config(config), "AXI_MAX_BURST_LEN"));
    }

    SECTION("Burst length above 256") {
        config.axi_max_burst_len = 257;
        REQUIRE(has_error_containing(validate_config(config), "AXI_MAX_BURST_LEN"));
    }

    SECTION("Scatter/gather requested") {
        config.enable_sg = true;
        REQUIRE(has_error_containing(validate_config(config), "scatter/gather"));
    }

    SECTION("Field widths out of range") {
        config.len_width = 0;
        config.tag_width = 65;
        auto result = validate_config(config);
        REQUIRE(has_error_containing(result, "len_width"));
        REQUIRE(has_error_containing(result, "tag_width"));
    }

    SECTION("Disabled sideband widths are not checked") {
        config.axis_id_enable = false;
        config.axis_id_width = 0;
        REQUIRE(validate_config(config).valid);
    }
}

TEST_CASE("Read engine config - every error is reported at once", "[config][engine]") {
    ReadEngineConfig config;
    config.axi_data_width = 24;
    config.axi_max_burst_len = 300;
    config.enable_sg = true;

    auto result = validate_config(config);
    REQUIRE(result.errors.size() >= 3);

    try {
        ReadEngineGeometry::from(config);
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        std::string message = e.what();
        REQUIRE(message.find("power of two") != std::string::npos);
        REQUIRE(message.find("AXI_MAX_BURST_LEN") != std::string::npos);
        REQUIRE(message.find("scatter/gather") != std::string::npos);
    }
}

TEST_CASE("Read engine geometry - derived quantities", "[config][geometry]") {
    SECTION("Hardware defaults") {
        auto g = ReadEngineGeometry::from(ReadEngineConfig{});
        REQUIRE(g.bus_bytes == 4);
        REQUIRE(g.burst_size == 2);
        REQUIRE(g.max_burst_bytes == 64);
        REQUIRE(g.keep_width == 4);
        REQUIRE(g.offset_mask == 0x3);
        REQUIRE(g.addr_mask == 0xffff);
        REQUIRE(g.aligned_addr_mask == 0xfffc);
        REQUIRE(g.len_mask == 0xfffff);
        REQUIRE(g.tag_mask == 0xff);
        REQUIRE(g.id_mask == 0);
        REQUIRE(g.dest_mask == 0);
        REQUIRE(g.user_mask == 0x1);
        REQUIRE(g.keep_enable);
        REQUIRE(g.last_enable);
        REQUIRE_FALSE(g.unaligned);
    }

    SECTION("8-bit bus") {
        ReadEngineConfig config;
        config.axi_data_width = 8;
        config.axis_keep_enable = false;
        auto g = ReadEngineGeometry::from(config);
        REQUIRE(g.bus_bytes == 1);
        REQUIRE(g.burst_size == 0);
        REQUIRE(g.keep_width == 1);
        REQUIRE(g.offset_mask == 0);
        REQUIRE_FALSE(g.keep_enable);
    }

    SECTION("1024-bit bus with 64-bit fields") {
        ReadEngineConfig config;
        config.axi_data_width = 1024;
        config.axi_addr_width = 64;
        config.axi_max_burst_len = 256;
        config.len_width = 64;
        auto g = ReadEngineGeometry::from(config);
        REQUIRE(g.bus_bytes == 128);
        REQUIRE(g.burst_size == 7);
        REQUIRE(g.max_burst_bytes == 256 * 128);
        REQUIRE(g.addr_mask == ~uint64_t(0));
        REQUIRE(g.len_mask == ~uint64_t(0));
    }
}
