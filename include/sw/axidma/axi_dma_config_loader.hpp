#pragma once

/**
 * @file axi_dma_config_loader.hpp
 * @brief Loader for AXI DMA read simulator configuration files (YAML and JSON)
 *
 * A configuration file carries the engine elaboration parameters plus the
 * memory model and simulation settings:
 *
 * @code
 * {
 *   "axi":        { "data_width": 32, "addr_width": 16, "id_width": 8, "max_burst_len": 16 },
 *   "axis":       { "data_width": 32, "keep_enable": true, "last_enable": true,
 *                   "id_enable": false, "id_width": 8, "dest_enable": false, "dest_width": 8,
 *                   "user_enable": true, "user_width": 1 },
 *   "descriptor": { "len_width": 20, "tag_width": 8 },
 *   "features":   { "scatter_gather": false, "unaligned": false, "check_protocol": true },
 *   "memory":     { "capacity_kb": 64, "read_latency": 2, "max_outstanding": 4 },
 *   "simulation": { "clock_freq_ghz": 0.25, "tracing": false }
 * }
 * @endcode
 *
 * The YAML form has the same two-level layout:
 *
 * @code
 * axi:
 *   data_width: 64
 *   max_burst_len: 32
 * features:
 *   unaligned: true
 * @endcode
 *
 * Missing keys keep their defaults.
 */

#include <sw/axidma/axi_dma_read_simulator.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>
#include <vector>

namespace sw::axidma {

class AxiDmaConfigLoader {
public:
    /**
     * @brief Load configuration from file (format from the extension)
     * @throws std::runtime_error on unsupported format, file read or parse errors
     */
    static AxiDmaReadSimulator::Config load(const std::filesystem::path& file_path);

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error on file read or parse errors
     */
    static AxiDmaReadSimulator::Config load_json(const std::filesystem::path& file_path);

    /**
     * @brief Load configuration from YAML file
     * @throws std::runtime_error on file read or parse errors
     */
    static AxiDmaReadSimulator::Config load_yaml(const std::filesystem::path& file_path);

    /**
     * @brief Load configuration from JSON string
     * @throws std::runtime_error on parse errors
     */
    static AxiDmaReadSimulator::Config from_json_string(const std::string& json_string);

    /**
     * @brief Load configuration from YAML string
     * @throws std::runtime_error on values of the wrong type
     */
    static AxiDmaReadSimulator::Config from_yaml_string(const std::string& yaml_string);

    /**
     * @brief Save configuration to JSON file
     * @param pretty Pretty-print with indentation
     */
    static void save_json(const AxiDmaReadSimulator::Config& config,
                          const std::filesystem::path& file_path,
                          bool pretty = true);

    static std::string to_json_string(const AxiDmaReadSimulator::Config& config,
                                      bool pretty = true);

    static void save_yaml(const AxiDmaReadSimulator::Config& config,
                          const std::filesystem::path& file_path);

    static std::string to_yaml_string(const AxiDmaReadSimulator::Config& config);

    /**
     * @brief Validate configuration file without building a simulator
     * @return Validation result; load failures are reported as errors
     */
    static ConfigValidationResult validate(const std::filesystem::path& file_path);

    /**
     * @brief Validate configuration object
     * @return Engine elaboration errors plus memory model checks
     */
    static ConfigValidationResult validate(const AxiDmaReadSimulator::Config& config);

    // =========================================
    // Factory Methods for Common Configurations
    // =========================================

    // 8-bit bus, short bursts, all sidebands off: smallest elaboration
    static AxiDmaReadSimulator::Config create_minimal();

    // Hardware default parameters
    static AxiDmaReadSimulator::Config create_default();

    // 128-bit bus with unaligned transfers and every sideband enabled
    static AxiDmaReadSimulator::Config create_wide();

    // Look up a factory by name ("minimal", "default", "wide")
    static AxiDmaReadSimulator::Config create_named(const std::string& name);

private:
    static AxiDmaReadSimulator::Config parse_json(const nlohmann::json& j);
    static nlohmann::json to_json(const AxiDmaReadSimulator::Config& config);

    // YAML subset (nested mappings of scalars), converted through JSON
    static nlohmann::json yaml_to_json(const std::string& yaml_string);
    static std::string json_to_yaml(const nlohmann::json& j, int indent = 0);

    static bool is_yaml_file(const std::filesystem::path& file_path);
    static bool is_json_file(const std::filesystem::path& file_path);

    static void validate_config(const AxiDmaReadSimulator::Config& config,
                                ConfigValidationResult& result);

    template<typename T>
    static T get_nested_or_default(const nlohmann::json& j,
                                   const std::string& key1,
                                   const std::string& key2,
                                   const T& default_value) {
        if (j.contains(key1) && j[key1].contains(key2)) {
            return j[key1][key2].get<T>();
        }
        return default_value;
    }
};

} // namespace sw::axidma
