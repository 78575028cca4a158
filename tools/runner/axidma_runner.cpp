/**
 * @file axidma_runner.cpp
 * @brief AXI DMA Read Runner - Command-line tool for running read engine simulations
 *
 * Usage:
 *   axidma-runner [options] [config-file]
 *
 * Options:
 *   -h, --help              Show help message
 *   -v, --verbose           Verbose output
 *   -a, --addr <address>    Start address of the first descriptor
 *   -l, --len <bytes>       Length of each descriptor
 *   -n, --count <n>         Number of back-to-back descriptors
 *   --unaligned             Enable unaligned transfer support
 *   --stall <percent>       Probability that the sink holds tready low
 *   --seed <n>              Random seed for memory contents and stalls
 *   --trace <file>          Export transaction trace
 *   --format <fmt>          Trace format: csv, json, chrome
 *   --validate              Validate config and exit
 *   --show-config           Show parsed configuration
 *   --factory <name>        Use factory config: minimal, default, wide
 */

#include <sw/axidma/axi_dma_read_simulator.hpp>
#include <sw/axidma/axi_dma_config_loader.hpp>
#include <sw/trace/trace_logger.hpp>
#include <sw/trace/trace_exporter.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <random>
#include <memory>

using namespace sw::axidma;

// =========================================
// Command Line Parsing
// =========================================

struct Options {
    std::string config_file;
    std::string factory_config;  // minimal, default, wide
    Address addr = 0x0ff8;
    Size len = 64;
    Size count = 4;
    bool unaligned = false;
    unsigned stall_percent = 0;
    unsigned seed = 1;
    std::string trace_file;
    std::string trace_format = "chrome";
    bool verbose = false;
    bool validate_only = false;
    bool show_config = false;
    bool help = false;
};

void print_help(const char* program_name) {
    std::cout << "AXI DMA Read Runner - Command-line tool for AXI DMA read engine simulations\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options] [config-file]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -a, --addr <address>    Start address, decimal or 0x hex (default: 0xff8)\n";
    std::cout << "  -l, --len <bytes>       Bytes per descriptor (default: 64)\n";
    std::cout << "  -n, --count <n>         Number of descriptors (default: 4)\n";
    std::cout << "  --unaligned             Enable unaligned transfer support\n";
    std::cout << "  --stall <percent>       Sink tready low probability, 0-100 (default: 0)\n";
    std::cout << "  --seed <n>              Random seed (default: 1)\n";
    std::cout << "  --trace <file>          Export transaction trace to file\n";
    std::cout << "  --format <fmt>          Trace format: csv, json, chrome (default: chrome)\n";
    std::cout << "  --validate              Validate config and exit\n";
    std::cout << "  --show-config           Show parsed configuration\n";
    std::cout << "  --factory <name>        Use factory config: minimal, default, wide\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --factory default -a 0xff8 -l 16 -n 1\n";
    std::cout << "  " << program_name << " --factory wide --stall 30 --trace dma.trace.json\n";
    std::cout << "  " << program_name << " --validate configs/axidma.yaml\n";
}

bool parse_number(const std::string& text, uint64_t& value) {
    try {
        size_t pos = 0;
        value = std::stoull(text, &pos, 0);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        uint64_t value = 0;

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--validate") {
            opts.validate_only = true;
        } else if (arg == "--show-config") {
            opts.show_config = true;
        } else if (arg == "--unaligned") {
            opts.unaligned = true;
        } else if ((arg == "-a" || arg == "--addr") && i + 1 < argc) {
            if (!parse_number(argv[++i], value)) {
                std::cerr << "Invalid address: " << argv[i] << "\n";
                return false;
            }
            opts.addr = value;
        } else if ((arg == "-l" || arg == "--len") && i + 1 < argc) {
            if (!parse_number(argv[++i], value)) {
                std::cerr << "Invalid length: " << argv[i] << "\n";
                return false;
            }
            opts.len = value;
        } else if ((arg == "-n" || arg == "--count") && i + 1 < argc) {
            if (!parse_number(argv[++i], value)) {
                std::cerr << "Invalid descriptor count: " << argv[i] << "\n";
                return false;
            }
            opts.count = value;
        } else if (arg == "--stall" && i + 1 < argc) {
            if (!parse_number(argv[++i], value) || value > 100) {
                std::cerr << "Invalid stall percentage: " << argv[i] << "\n";
                return false;
            }
            opts.stall_percent = static_cast<unsigned>(value);
        } else if (arg == "--seed" && i + 1 < argc) {
            if (!parse_number(argv[++i], value)) {
                std::cerr << "Invalid seed: " << argv[i] << "\n";
                return false;
            }
            opts.seed = static_cast<unsigned>(value);
        } else if (arg == "--trace" && i + 1 < argc) {
            opts.trace_file = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            opts.trace_format = argv[++i];
            if (opts.trace_format != "csv" && opts.trace_format != "json" && opts.trace_format != "chrome") {
                std::cerr << "Unknown trace format: " << opts.trace_format << "\n";
                return false;
            }
        } else if (arg == "--factory" && i + 1 < argc) {
            opts.factory_config = argv[++i];
        } else if (arg[0] != '-') {
            opts.config_file = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    return true;
}

// =========================================
// Configuration Display
// =========================================

void print_config(const AxiDmaReadSimulator::Config& config) {
    const ReadEngineConfig& e = config.engine;
    auto enabled = [](bool flag) { return flag ? "Yes" : "No"; };

    std::cout << "\n=== AXI DMA Read Engine Configuration ===\n\n";

    std::cout << "AXI Master:\n";
    std::cout << "  Data width:    " << e.axi_data_width << " bits\n";
    std::cout << "  Address width: " << e.axi_addr_width << " bits\n";
    std::cout << "  ID width:      " << e.axi_id_width << " bits\n";
    std::cout << "  Max burst:     " << e.axi_max_burst_len << " beats\n\n";

    std::cout << "AXI Stream:\n";
    std::cout << "  Data width:    " << (e.axis_data_width ? e.axis_data_width : e.axi_data_width) << " bits\n";
    std::cout << "  tkeep:         " << enabled(e.axis_keep_enable) << "\n";
    std::cout << "  tlast:         " << enabled(e.axis_last_enable) << "\n";
    std::cout << "  tid:           " << enabled(e.axis_id_enable) << " (" << e.axis_id_width << " bits)\n";
    std::cout << "  tdest:         " << enabled(e.axis_dest_enable) << " (" << e.axis_dest_width << " bits)\n";
    std::cout << "  tuser:         " << enabled(e.axis_user_enable) << " (" << e.axis_user_width << " bits)\n\n";

    std::cout << "Descriptor:\n";
    std::cout << "  Length width:  " << e.len_width << " bits\n";
    std::cout << "  Tag width:     " << e.tag_width << " bits\n\n";

    std::cout << "Features:\n";
    std::cout << "  Unaligned:     " << enabled(e.enable_unaligned) << "\n";
    std::cout << "  Protocol check:" << enabled(e.check_protocol) << "\n\n";

    std::cout << "Memory:\n";
    std::cout << "  Capacity:      " << config.memory.capacity_bytes / 1024 << " KB\n";
    std::cout << "  Read latency:  " << config.memory.read_latency << " cycles\n";
    std::cout << "  Outstanding:   " << config.memory.max_outstanding << " bursts\n\n";

    std::cout << "Clock:           " << config.clock_freq_ghz << " GHz\n\n";
}

// =========================================
// Transfer Run
// =========================================

struct RunResult {
    bool success = false;
    Cycle cycles = 0;
    double elapsed_ms = 0;
    Size bytes = 0;
    Size mismatches = 0;
    std::string error;
};

RunResult run_transfers(AxiDmaReadSimulator& sim, const Options& opts) {
    RunResult result;
    const auto& geometry = sim.engine().geometry();
    const Size capacity = sim.memory().get_capacity();

    // Fill memory with a seeded pattern
    std::mt19937 rng(opts.seed);
    std::uniform_int_distribution<int> byte_dist(0, 255);
    std::vector<uint8_t> image(capacity);
    for (auto& b : image) b = static_cast<uint8_t>(byte_dist(rng));
    sim.write_memory(0, image.data(), image.size());

    if (opts.stall_percent > 0) {
        auto stall_rng = std::make_shared<std::mt19937>(opts.seed + 1);
        const unsigned percent = opts.stall_percent;
        sim.set_sink_ready_pattern([stall_rng, percent](Cycle) {
            std::uniform_int_distribution<unsigned> dist(0, 99);
            return dist(*stall_rng) >= percent;
        });
    }

    // Descriptors back to back
    std::vector<ReadDescriptor> descriptors;
    for (Size i = 0; i < opts.count; ++i) {
        ReadDescriptor desc;
        desc.address = (opts.addr + i * opts.len) & geometry.addr_mask;
        desc.length = opts.len;
        desc.tag = i & geometry.tag_mask;
        desc.stream_id = i;
        desc.stream_dest = i;
        desc.stream_user = 0;
        descriptors.push_back(desc);
        sim.submit(desc);

        if (opts.verbose) {
            std::cout << "  Descriptor " << i << ": addr=0x" << std::hex << desc.address << std::dec
                      << " len=" << desc.length << " tag=" << desc.tag << "\n";
        }
    }

    try {
        result.cycles = sim.run_until_idle();
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }
    result.elapsed_ms = sim.get_elapsed_time_ms();

    // Compare streamed packets against memory
    const auto packets = sim.get_packets();
    const auto& statuses = sim.get_statuses();
    if (geometry.last_enable && packets.size() != descriptors.size()) {
        result.error = "expected " + std::to_string(descriptors.size()) + " packets, got " +
                       std::to_string(packets.size());
        return result;
    }
    if (statuses.size() != descriptors.size()) {
        result.error = "expected " + std::to_string(descriptors.size()) + " completions, got " +
                       std::to_string(statuses.size());
        return result;
    }

    const auto stream = sim.get_stream_bytes();
    Size offset = 0;
    for (Size i = 0; i < descriptors.size(); ++i) {
        const auto& desc = descriptors[i];
        const Address start = geometry.unaligned ? desc.address : (desc.address & geometry.aligned_addr_mask);
        const Size length = desc.length & geometry.len_mask;

        if (statuses[i].status.tag != desc.tag) {
            result.error = "completion " + std::to_string(i) + " carries tag " +
                           std::to_string(statuses[i].status.tag) + ", expected " + std::to_string(desc.tag);
            return result;
        }
        for (Size b = 0; b < length; ++b, ++offset) {
            const uint8_t expected = image[(start + b) % capacity];
            if (offset >= stream.size() || stream[offset] != expected) {
                ++result.mismatches;
            }
        }
    }
    result.bytes = stream.size();
    if (offset != stream.size()) {
        result.error = "stream carries " + std::to_string(stream.size()) + " bytes, expected " +
                       std::to_string(offset);
        return result;
    }
    if (result.mismatches > 0) {
        result.error = std::to_string(result.mismatches) + " bytes differ from memory";
        return result;
    }

    result.success = true;
    return result;
}

// =========================================
// Main
// =========================================

int main(int argc, char* argv[]) {
    Options opts;

    if (!parse_options(argc, argv, opts)) {
        print_help(argv[0]);
        return 1;
    }

    if (opts.help) {
        print_help(argv[0]);
        return 0;
    }

    // Load or create configuration
    AxiDmaReadSimulator::Config config;

    try {
        if (!opts.factory_config.empty()) {
            config = AxiDmaConfigLoader::create_named(opts.factory_config);
            if (opts.verbose) std::cout << "Using factory config: " << opts.factory_config << "\n";
        } else if (!opts.config_file.empty()) {
            if (opts.verbose) {
                std::cout << "Loading configuration from: " << opts.config_file << "\n";
            }
            config = AxiDmaConfigLoader::load(opts.config_file);
        } else {
            std::cout << "No configuration specified, using default factory config\n";
            config = AxiDmaConfigLoader::create_default();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << "\n";
        return 1;
    }

    if (opts.unaligned) {
        config.engine.enable_unaligned = true;
    }
    if (!opts.trace_file.empty()) {
        config.tracing = true;
    }

    // Validate if requested
    if (opts.validate_only) {
        auto result = AxiDmaConfigLoader::validate(config);
        if (result.valid) {
            std::cout << "Configuration is valid.\n";
            for (const auto& warning : result.warnings) {
                std::cout << "Warning: " << warning << "\n";
            }
            return 0;
        } else {
            std::cerr << "Configuration is invalid:\n";
            for (const auto& error : result.errors) {
                std::cerr << "  Error: " << error << "\n";
            }
            for (const auto& warning : result.warnings) {
                std::cerr << "  Warning: " << warning << "\n";
            }
            return 1;
        }
    }

    if (opts.show_config) {
        print_config(config);
    }

    // Create simulator
    std::unique_ptr<AxiDmaReadSimulator> sim;
    try {
        sim = std::make_unique<AxiDmaReadSimulator>(config);
    } catch (const std::exception& e) {
        std::cerr << "Error creating simulator: " << e.what() << "\n";
        return 1;
    }

    auto& logger = sw::trace::TraceLogger::instance();
    if (config.tracing) {
        logger.clear();
        logger.set_enabled(true);
    }

    if (opts.verbose) {
        std::cout << "\nAXI DMA read simulator initialized.\n";
        std::cout << "  Bus:        " << sim->engine().geometry().bus_bytes << " bytes/beat\n";
        std::cout << "  Max burst:  " << sim->engine().geometry().max_burst_bytes << " bytes\n";
        std::cout << "  Memory:     " << sim->memory().get_capacity() / 1024 << " KB\n";
    }

    RunResult result = run_transfers(*sim, opts);

    std::cout << "\n=== Results ===\n";
    std::cout << "Status:      " << (result.success ? "SUCCESS" : "FAILED") << "\n";
    if (result.success) {
        std::cout << "Cycles:      " << result.cycles << "\n";
        std::cout << "Bytes:       " << result.bytes << "\n";
        std::cout << "Time:        " << std::fixed << std::setprecision(3) << result.elapsed_ms << " ms\n";
    } else {
        std::cout << "Error:       " << result.error << "\n";
    }

    if (opts.verbose) {
        std::cout << "\n";
        sim->print_stats();
        sim->print_component_status();
    }

    if (!opts.trace_file.empty()) {
        if (sw::trace::export_logger_traces(opts.trace_file, opts.trace_format, logger)) {
            std::cout << "Trace:       " << logger.get_trace_count() << " entries written to "
                      << opts.trace_file << "\n";
        } else {
            std::cerr << "Failed to write trace file: " << opts.trace_file << "\n";
            return 1;
        }
    }

    return result.success ? 0 : 1;
}
