#pragma once

#include <cstdint>
#include <cstddef>

namespace sw::axidma {

// Fundamental simulator quantities
using Address = std::uint64_t;   // byte address on the AXI bus
using Size    = std::size_t;     // byte or element counts
using Cycle   = std::uint64_t;   // clock cycles since reset

} // namespace sw::axidma
