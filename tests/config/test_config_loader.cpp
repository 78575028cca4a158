#include <fstream>
#include <string>
#include <stdexcept>

#include <catch2/catch.hpp>
#include <sw/axidma/axi_dma_config_loader.hpp>

#include "../test_utilities.hpp"

using namespace sw::axidma;

TEST_CASE("Config loader - partial JSON keeps defaults", "[config][loader]") {
    const std::string json = R"({
        "axi": { "data_width": 64, "max_burst_len": 32 },
        "axis": { "id_enable": true, "id_width": 4 },
        "features": { "unaligned": true },
        "memory": { "capacity_kb": 128, "read_latency": 5 },
        "simulation": { "clock_freq_ghz": 0.5 }
    })";

    auto config = AxiDmaConfigLoader::from_json_string(json);
    AxiDmaReadSimulator::Config defaults;

    REQUIRE(config.engine.axi_data_width == 64);
    REQUIRE(config.engine.axi_max_burst_len == 32);
    REQUIRE(config.engine.axis_id_enable);
    REQUIRE(config.engine.axis_id_width == 4);
    REQUIRE(config.engine.enable_unaligned);
    REQUIRE(config.memory.capacity_bytes == 128 * 1024);
    REQUIRE(config.memory.read_latency == 5);
    REQUIRE(config.clock_freq_ghz == Catch::Detail::Approx(0.5));

    // untouched keys
    REQUIRE(config.engine.axi_addr_width == defaults.engine.axi_addr_width);
    REQUIRE(config.engine.len_width == defaults.engine.len_width);
    REQUIRE(config.engine.axis_user_enable == defaults.engine.axis_user_enable);
    REQUIRE(config.memory.max_outstanding == defaults.memory.max_outstanding);
    REQUIRE_FALSE(config.tracing);
}

TEST_CASE("Config loader - serialized config loads back unchanged", "[config][loader]") {
    auto original = AxiDmaConfigLoader::create_wide();
    original.engine.check_protocol = true;
    original.tracing = true;

    auto restored = AxiDmaConfigLoader::from_json_string(AxiDmaConfigLoader::to_json_string(original));

    REQUIRE(restored.engine.axi_data_width == original.engine.axi_data_width);
    REQUIRE(restored.engine.axi_addr_width == original.engine.axi_addr_width);
    REQUIRE(restored.engine.axi_max_burst_len == original.engine.axi_max_burst_len);
    REQUIRE(restored.engine.axis_dest_enable == original.engine.axis_dest_enable);
    REQUIRE(restored.engine.axis_dest_width == original.engine.axis_dest_width);
    REQUIRE(restored.engine.axis_user_width == original.engine.axis_user_width);
    REQUIRE(restored.engine.tag_width == original.engine.tag_width);
    REQUIRE(restored.engine.enable_unaligned == original.engine.enable_unaligned);
    REQUIRE(restored.engine.check_protocol);
    REQUIRE(restored.memory.capacity_bytes == original.memory.capacity_bytes);
    REQUIRE(restored.memory.read_latency == original.memory.read_latency);
    REQUIRE(restored.clock_freq_ghz == Catch::Detail::Approx(original.clock_freq_ghz));
    REQUIRE(restored.tracing);
}

TEST_CASE("Config loader - file round trip", "[config][loader]") {
    const std::string path = sw::test::get_test_output_path("axidma_minimal.json");
    auto original = AxiDmaConfigLoader::create_minimal();

    AxiDmaConfigLoader::save_json(original, path);
    auto loaded = AxiDmaConfigLoader::load(path);

    REQUIRE(loaded.engine.axi_data_width == 8);
    REQUIRE_FALSE(loaded.engine.axis_keep_enable);
    REQUIRE(loaded.memory.capacity_bytes == original.memory.capacity_bytes);
    REQUIRE(AxiDmaConfigLoader::validate(std::filesystem::path(path)).valid);
}

TEST_CASE("Config loader - YAML subset", "[config][loader][yaml]") {
    const std::string yaml = R"(# 64-bit engine with unaligned transfers
axi:
  data_width: 64
  addr_width: 0x14
axis:
  id_enable: true   # forward the descriptor id
  id_width: 4
features:
  unaligned: true
memory:
  capacity_kb: 256
simulation:
  clock_freq_ghz: 0.5
)";

    auto config = AxiDmaConfigLoader::from_yaml_string(yaml);
    REQUIRE(config.engine.axi_data_width == 64);
    REQUIRE(config.engine.axi_addr_width == 20);
    REQUIRE(config.engine.axis_id_enable);
    REQUIRE(config.engine.axis_id_width == 4);
    REQUIRE(config.engine.enable_unaligned);
    REQUIRE(config.memory.capacity_bytes == 256 * 1024);
    REQUIRE(config.clock_freq_ghz == Catch::Detail::Approx(0.5));
    REQUIRE(config.engine.axi_max_burst_len == 16);

    SECTION("File round trip") {
        const std::string path = sw::test::get_test_output_path("axidma_wide.yaml");
        auto original = AxiDmaConfigLoader::create_wide();
        AxiDmaConfigLoader::save_yaml(original, path);

        auto loaded = AxiDmaConfigLoader::load(path);
        REQUIRE(loaded.engine.axi_data_width == 128);
        REQUIRE(loaded.engine.axi_max_burst_len == 256);
        REQUIRE(loaded.engine.axis_dest_width == original.engine.axis_dest_width);
        REQUIRE(loaded.engine.tag_width == original.engine.tag_width);
        REQUIRE(loaded.memory.capacity_bytes == original.memory.capacity_bytes);
        REQUIRE(loaded.clock_freq_ghz == Catch::Detail::Approx(original.clock_freq_ghz));
    }

    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(AxiDmaConfigLoader::from_yaml_string("axi:\n  data_width: wide\n"), std::runtime_error);
    }

    SECTION("Line without a key") {
        REQUIRE_THROWS_AS(AxiDmaConfigLoader::from_yaml_string("axi\n"), std::runtime_error);
    }
}

TEST_CASE("Config loader - load errors", "[config][loader]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(AxiDmaConfigLoader::load("does_not_exist.json"), std::runtime_error);
    }

    SECTION("Unsupported extension") {
        REQUIRE_THROWS_AS(AxiDmaConfigLoader::load("config.toml"), std::runtime_error);
    }

    SECTION("Malformed JSON string") {
        REQUIRE_THROWS_AS(AxiDmaConfigLoader::from_json_string("{ \"axi\": "), std::runtime_error);
    }

    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(AxiDmaConfigLoader::from_json_string(R"({"axi": {"data_width": "wide"}})"),
                          std::runtime_error);
    }

    SECTION("Validation of a broken file reports instead of throwing") {
        const std::string path = sw::test::get_test_output_path("axidma_broken.json");
        {
            std::ofstream file(path);
            file << "{ not json";
        }
        auto result = AxiDmaConfigLoader::validate(std::filesystem::path(path));
        REQUIRE_FALSE(result.valid);
        REQUIRE_FALSE(result.errors.empty());
    }
}

TEST_CASE("Config loader - validation of simulator settings", "[config][loader]") {
    auto config = AxiDmaConfigLoader::create_default();

    SECTION("Engine errors propagate") {
        config.engine.axi_max_burst_len = 0;
        REQUIRE_FALSE(AxiDmaConfigLoader::validate(config).valid);
    }

    SECTION("Memory capacity not a multiple of the bus") {
        config.memory.capacity_bytes = 1022;
        REQUIRE_FALSE(AxiDmaConfigLoader::validate(config).valid);
    }

    SECTION("Small memory wraps with a warning") {
        config.memory.capacity_bytes = 4096;
        auto result = AxiDmaConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 2);
    }

    SECTION("Clock must be positive") {
        config.clock_freq_ghz = 0.0;
        REQUIRE_FALSE(AxiDmaConfigLoader::validate(config).valid);
    }
}

TEST_CASE("Config loader - factory configurations", "[config][factory]") {
    SECTION("Minimal") {
        auto config = AxiDmaConfigLoader::create_minimal();
        auto result = AxiDmaConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.empty());
        REQUIRE(config.engine.axi_data_width == 8);
    }

    SECTION("Default") {
        auto config = AxiDmaConfigLoader::create_default();
        REQUIRE(AxiDmaConfigLoader::validate(config).valid);
        REQUIRE(config.engine.axi_data_width == 32);
        REQUIRE(config.engine.axi_max_burst_len == 16);
    }

    SECTION("Wide") {
        auto config = AxiDmaConfigLoader::create_wide();
        auto result = AxiDmaConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.empty());
        REQUIRE(config.engine.enable_unaligned);
        REQUIRE(config.engine.axis_id_enable);
        REQUIRE(config.engine.axis_dest_enable);
    }

    SECTION("By name") {
        REQUIRE(AxiDmaConfigLoader::create_named("wide").engine.axi_data_width == 128);
        REQUIRE_THROWS_AS(AxiDmaConfigLoader::create_named("huge"), std::invalid_argument);
    }

    SECTION("Every factory builds a simulator") {
        for (const char* name : {"minimal", "default", "wide"}) {
            REQUIRE_NOTHROW(AxiDmaReadSimulator(AxiDmaConfigLoader::create_named(name)));
        }
    }
}
