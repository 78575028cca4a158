#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <numeric>
#include <vector>

#include <sw/axidma/axi_dma_read_simulator.hpp>

namespace sw::test {

/**
 * @brief Get the directory for test output files
 *
 * Creates and returns a path to a temporary directory for test artifacts.
 * The directory is created under the system temp directory with an
 * "axidma_sim_test_output" subdirectory.
 *
 * @return Path to the test output directory
 */
inline std::filesystem::path get_test_output_dir() {
    auto temp_dir = std::filesystem::temp_directory_path() / "axidma_sim_test_output";

    // Create directory if it doesn't exist
    if (!std::filesystem::exists(temp_dir)) {
        std::filesystem::create_directories(temp_dir);
    }

    return temp_dir;
}

/**
 * @brief Get a full path for a test output file
 *
 * @param filename The filename (without path)
 * @return Full path in the test output directory
 */
inline std::string get_test_output_path(const std::string& filename) {
    return (get_test_output_dir() / filename).string();
}

// Fill the whole memory with an incrementing byte pattern
inline std::vector<uint8_t> fill_memory_pattern(sw::axidma::AxiDmaReadSimulator& sim, uint8_t start_value = 0) {
    std::vector<uint8_t> image(sim.memory().get_capacity());
    std::iota(image.begin(), image.end(), start_value);
    sim.write_memory(0, image.data(), image.size());
    return image;
}

// Bytes a descriptor should stream, addresses wrapping like the memory model
inline std::vector<uint8_t> expected_bytes(const std::vector<uint8_t>& image,
                                           sw::axidma::Address start, size_t length) {
    std::vector<uint8_t> bytes(length);
    for (size_t i = 0; i < length; ++i) {
        bytes[i] = image[(start + i) % image.size()];
    }
    return bytes;
}

} // namespace sw::test
