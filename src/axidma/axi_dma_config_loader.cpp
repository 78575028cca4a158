/**
 * @file axi_dma_config_loader.cpp
 * @brief Implementation of AXI DMA configuration file loader
 */

#include <sw/axidma/axi_dma_config_loader.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <utility>

namespace sw::axidma {

// =========================================
// File Loading
// =========================================

AxiDmaReadSimulator::Config AxiDmaConfigLoader::load(const std::filesystem::path& file_path) {
    if (is_yaml_file(file_path)) {
        return load_yaml(file_path);
    } else if (is_json_file(file_path)) {
        return load_json(file_path);
    }
    throw std::runtime_error("Unsupported file format: " + file_path.string() +
                             " (expected .yaml, .yml, or .json)");
}

AxiDmaReadSimulator::Config AxiDmaConfigLoader::load_json(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + file_path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("JSON parse error in " + file_path.string() + ": " + e.what());
    }
}

AxiDmaReadSimulator::Config AxiDmaConfigLoader::load_yaml(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + file_path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_yaml_string(buffer.str());
}

AxiDmaReadSimulator::Config AxiDmaConfigLoader::from_json_string(const std::string& json_string) {
    try {
        nlohmann::json j = nlohmann::json::parse(json_string);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("JSON parse error: ") + e.what());
    }
}

AxiDmaReadSimulator::Config AxiDmaConfigLoader::from_yaml_string(const std::string& yaml_string) {
    try {
        return parse_json(yaml_to_json(yaml_string));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("YAML value error: ") + e.what());
    }
}

// =========================================
// File Saving
// =========================================

void AxiDmaConfigLoader::save_json(const AxiDmaReadSimulator::Config& config,
                                   const std::filesystem::path& file_path,
                                   bool pretty) {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + file_path.string());
    }

    nlohmann::json j = to_json(config);
    file << (pretty ? j.dump(2) : j.dump());
}

std::string AxiDmaConfigLoader::to_json_string(const AxiDmaReadSimulator::Config& config, bool pretty) {
    nlohmann::json j = to_json(config);
    return pretty ? j.dump(2) : j.dump();
}

void AxiDmaConfigLoader::save_yaml(const AxiDmaReadSimulator::Config& config,
                                   const std::filesystem::path& file_path) {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + file_path.string());
    }

    file << to_yaml_string(config);
}

std::string AxiDmaConfigLoader::to_yaml_string(const AxiDmaReadSimulator::Config& config) {
    return json_to_yaml(to_json(config));
}

// =========================================
// JSON Parsing
// =========================================

AxiDmaReadSimulator::Config AxiDmaConfigLoader::parse_json(const nlohmann::json& j) {
    AxiDmaReadSimulator::Config config;
    ReadEngineConfig& e = config.engine;

    // AXI master interface
    e.axi_data_width = get_nested_or_default<Size>(j, "axi", "data_width", e.axi_data_width);
    e.axi_addr_width = get_nested_or_default<Size>(j, "axi", "addr_width", e.axi_addr_width);
    e.axi_id_width = get_nested_or_default<Size>(j, "axi", "id_width", e.axi_id_width);
    e.axi_max_burst_len = get_nested_or_default<Size>(j, "axi", "max_burst_len", e.axi_max_burst_len);

    // AXI-stream output
    e.axis_data_width = get_nested_or_default<Size>(j, "axis", "data_width", e.axis_data_width);
    e.axis_keep_enable = get_nested_or_default<bool>(j, "axis", "keep_enable", e.axis_keep_enable);
    e.axis_keep_width = get_nested_or_default<Size>(j, "axis", "keep_width", e.axis_keep_width);
    e.axis_last_enable = get_nested_or_default<bool>(j, "axis", "last_enable", e.axis_last_enable);
    e.axis_id_enable = get_nested_or_default<bool>(j, "axis", "id_enable", e.axis_id_enable);
    e.axis_id_width = get_nested_or_default<Size>(j, "axis", "id_width", e.axis_id_width);
    e.axis_dest_enable = get_nested_or_default<bool>(j, "axis", "dest_enable", e.axis_dest_enable);
    e.axis_dest_width = get_nested_or_default<Size>(j, "axis", "dest_width", e.axis_dest_width);
    e.axis_user_enable = get_nested_or_default<bool>(j, "axis", "user_enable", e.axis_user_enable);
    e.axis_user_width = get_nested_or_default<Size>(j, "axis", "user_width", e.axis_user_width);

    // Descriptor fields
    e.len_width = get_nested_or_default<Size>(j, "descriptor", "len_width", e.len_width);
    e.tag_width = get_nested_or_default<Size>(j, "descriptor", "tag_width", e.tag_width);

    // Features
    e.enable_sg = get_nested_or_default<bool>(j, "features", "scatter_gather", e.enable_sg);
    e.enable_unaligned = get_nested_or_default<bool>(j, "features", "unaligned", e.enable_unaligned);
    e.check_protocol = get_nested_or_default<bool>(j, "features", "check_protocol", e.check_protocol);

    // Memory model
    config.memory.capacity_bytes =
        get_nested_or_default<Size>(j, "memory", "capacity_kb", config.memory.capacity_bytes / 1024) * 1024;
    config.memory.read_latency = get_nested_or_default<Cycle>(j, "memory", "read_latency", config.memory.read_latency);
    config.memory.max_outstanding = get_nested_or_default<Size>(j, "memory", "max_outstanding", config.memory.max_outstanding);

    // Simulation
    config.clock_freq_ghz = get_nested_or_default<double>(j, "simulation", "clock_freq_ghz", config.clock_freq_ghz);
    config.tracing = get_nested_or_default<bool>(j, "simulation", "tracing", config.tracing);

    return config;
}

nlohmann::json AxiDmaConfigLoader::to_json(const AxiDmaReadSimulator::Config& config) {
    nlohmann::json j;
    const ReadEngineConfig& e = config.engine;

    j["axi"]["data_width"] = e.axi_data_width;
    j["axi"]["addr_width"] = e.axi_addr_width;
    j["axi"]["id_width"] = e.axi_id_width;
    j["axi"]["max_burst_len"] = e.axi_max_burst_len;

    j["axis"]["data_width"] = e.axis_data_width ? e.axis_data_width : e.axi_data_width;
    j["axis"]["keep_enable"] = e.axis_keep_enable;
    if (e.axis_keep_width != 0) {
        j["axis"]["keep_width"] = e.axis_keep_width;
    }
    j["axis"]["last_enable"] = e.axis_last_enable;
    j["axis"]["id_enable"] = e.axis_id_enable;
    j["axis"]["id_width"] = e.axis_id_width;
    j["axis"]["dest_enable"] = e.axis_dest_enable;
    j["axis"]["dest_width"] = e.axis_dest_width;
    j["axis"]["user_enable"] = e.axis_user_enable;
    j["axis"]["user_width"] = e.axis_user_width;

    j["descriptor"]["len_width"] = e.len_width;
    j["descriptor"]["tag_width"] = e.tag_width;

    j["features"]["scatter_gather"] = e.enable_sg;
    j["features"]["unaligned"] = e.enable_unaligned;
    j["features"]["check_protocol"] = e.check_protocol;

    j["memory"]["capacity_kb"] = config.memory.capacity_bytes / 1024;
    j["memory"]["read_latency"] = config.memory.read_latency;
    j["memory"]["max_outstanding"] = config.memory.max_outstanding;

    j["simulation"]["clock_freq_ghz"] = config.clock_freq_ghz;
    j["simulation"]["tracing"] = config.tracing;

    return j;
}

// =========================================
// YAML Subset
// =========================================

namespace {

std::string trim(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Scalar: bool, hex or decimal integer, float, else string
nlohmann::json parse_scalar(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;

    try {
        size_t pos = 0;
        if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
            const uint64_t number = std::stoull(value, &pos, 16);
            if (pos == value.size()) return number;
        } else if (value.find_first_of(".eE") != std::string::npos) {
            const double number = std::stod(value, &pos);
            if (pos == value.size()) return number;
        } else {
            const int64_t number = std::stoll(value, &pos);
            if (pos == value.size()) return number;
        }
    } catch (const std::exception&) {
        // not a number
    }
    return value;
}

} // namespace

// Handles the mapping-of-scalars shape the config files use; no sequences or anchors
nlohmann::json AxiDmaConfigLoader::yaml_to_json(const std::string& yaml_string) {
    nlohmann::json result = nlohmann::json::object();
    std::vector<std::pair<int, nlohmann::json*>> stack;
    stack.push_back({-1, &result});

    std::istringstream stream(yaml_string);
    std::string line;

    while (std::getline(stream, line)) {
        const size_t first_non_space = line.find_first_not_of(" \t");
        if (first_non_space == std::string::npos || line[first_non_space] == '#') continue;

        const int indent = static_cast<int>(first_non_space);
        const std::string trimmed = trim(line);
        if (trimmed.empty()) continue;

        while (stack.size() > 1 && stack.back().first >= indent) {
            stack.pop_back();
        }

        const size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos) {
            throw std::runtime_error("YAML parse error: expected 'key: value' in \"" + trimmed + "\"");
        }

        const std::string key = trim(trimmed.substr(0, colon_pos));
        std::string value = trim(trimmed.substr(colon_pos + 1));

        // trailing comment
        if (!value.empty() && value.front() == '#') {
            value.clear();
        } else if (const size_t hash = value.find(" #"); hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }

        nlohmann::json& parent = *stack.back().second;
        if (value.empty()) {
            parent[key] = nlohmann::json::object();
            stack.push_back({indent, &parent[key]});
        } else if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            parent[key] = value.substr(1, value.size() - 2);
        } else {
            parent[key] = parse_scalar(value);
        }
    }

    return result;
}

std::string AxiDmaConfigLoader::json_to_yaml(const nlohmann::json& j, int indent) {
    std::ostringstream ss;
    const std::string indent_str(indent * 2, ' ');

    for (auto it = j.begin(); it != j.end(); ++it) {
        ss << indent_str << it.key() << ":";
        const auto& value = it.value();
        if (value.is_object()) {
            ss << "\n" << json_to_yaml(value, indent + 1);
        } else if (value.is_boolean()) {
            ss << " " << (value.get<bool>() ? "true" : "false") << "\n";
        } else if (value.is_number_unsigned()) {
            ss << " " << value.get<uint64_t>() << "\n";
        } else if (value.is_number_integer()) {
            ss << " " << value.get<int64_t>() << "\n";
        } else if (value.is_number_float()) {
            ss << " " << value.dump() << "\n";
        } else if (value.is_string()) {
            ss << " \"" << value.get<std::string>() << "\"\n";
        } else {
            ss << " " << value.dump() << "\n";
        }
    }

    return ss.str();
}

// =========================================
// Validation
// =========================================

ConfigValidationResult AxiDmaConfigLoader::validate(const std::filesystem::path& file_path) {
    ConfigValidationResult result;

    try {
        AxiDmaReadSimulator::Config config = load(file_path);
        validate_config(config, result);
    } catch (const std::exception& e) {
        result.valid = false;
        result.errors.push_back(e.what());
    }

    return result;
}

ConfigValidationResult AxiDmaConfigLoader::validate(const AxiDmaReadSimulator::Config& config) {
    ConfigValidationResult result;
    validate_config(config, result);
    return result;
}

void AxiDmaConfigLoader::validate_config(const AxiDmaReadSimulator::Config& config,
                                         ConfigValidationResult& result) {
    result = sw::axidma::validate_config(config.engine);

    const Size bus_bytes = config.engine.axi_data_width / 8;
    if (config.memory.capacity_bytes == 0) {
        result.errors.push_back("Memory capacity must be non-zero");
    } else if (bus_bytes > 0 && config.memory.capacity_bytes % bus_bytes != 0) {
        result.errors.push_back("Memory capacity must be a multiple of the bus width");
    } else if (config.engine.axi_addr_width < 64 &&
               config.memory.capacity_bytes < (uint64_t(1) << config.engine.axi_addr_width)) {
        result.warnings.push_back("Memory smaller than the AXI address space: addresses wrap modulo " +
                                  std::to_string(config.memory.capacity_bytes) + " bytes");
    }

    if (config.memory.max_outstanding == 0) {
        result.errors.push_back("Memory must accept at least one outstanding burst");
    }
    if (config.memory.read_latency == 0) {
        result.warnings.push_back("Zero read latency: first R beat follows the AR handshake immediately");
    }

    if (config.clock_freq_ghz <= 0.0) {
        result.errors.push_back("Clock frequency must be positive");
    }

    result.valid = result.errors.empty();
}

// =========================================
// File Format Detection
// =========================================

bool AxiDmaConfigLoader::is_yaml_file(const std::filesystem::path& file_path) {
    std::string ext = file_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".yaml" || ext == ".yml";
}

bool AxiDmaConfigLoader::is_json_file(const std::filesystem::path& file_path) {
    std::string ext = file_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".json";
}

// =========================================
// Factory Methods
// =========================================

AxiDmaReadSimulator::Config AxiDmaConfigLoader::create_minimal() {
    // 8-bit bus: one keep bit, so keep can be left out of the stream
    AxiDmaReadSimulator::Config config;

    config.engine.axi_data_width = 8;
    config.engine.axi_addr_width = 12;
    config.engine.axi_max_burst_len = 4;
    config.engine.axis_keep_enable = false;
    config.engine.axis_user_enable = false;
    config.engine.len_width = 12;
    config.engine.tag_width = 4;

    config.memory.capacity_bytes = 4 * 1024;
    config.memory.read_latency = 1;
    config.memory.max_outstanding = 2;

    return config;
}

AxiDmaReadSimulator::Config AxiDmaConfigLoader::create_default() {
    return AxiDmaReadSimulator::Config{};
}

AxiDmaReadSimulator::Config AxiDmaConfigLoader::create_wide() {
    // 128-bit bus, 256-beat bursts, byte-granular addressing, full sideband set
    AxiDmaReadSimulator::Config config;

    config.engine.axi_data_width = 128;
    config.engine.axi_addr_width = 20;
    config.engine.axi_max_burst_len = 256;
    config.engine.axis_id_enable = true;
    config.engine.axis_id_width = 8;
    config.engine.axis_dest_enable = true;
    config.engine.axis_dest_width = 4;
    config.engine.axis_user_enable = true;
    config.engine.axis_user_width = 4;
    config.engine.len_width = 20;
    config.engine.tag_width = 16;
    config.engine.enable_unaligned = true;

    config.memory.capacity_bytes = 1024 * 1024;
    config.memory.read_latency = 8;
    config.memory.max_outstanding = 8;

    config.clock_freq_ghz = 1.0;

    return config;
}

AxiDmaReadSimulator::Config AxiDmaConfigLoader::create_named(const std::string& name) {
    if (name == "minimal") return create_minimal();
    if (name == "default") return create_default();
    if (name == "wide") return create_wide();
    throw std::invalid_argument("Unknown factory configuration: " + name +
                                " (expected minimal, default, or wide)");
}

} // namespace sw::axidma
