#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

#include <sw/axidma/components/axi_memory.hpp>

namespace sw::axidma {

AxiMemory::AxiMemory(const Config& config)
    : config_(config)
    , current_cycle_(0)
    , stall_pattern_(nullptr)
    , last_fault_(LastFault::NONE)
{
    if (config_.bus_bytes == 0 || (config_.bus_bytes & (config_.bus_bytes - 1)) != 0) {
        throw std::invalid_argument("AxiMemory bus width must be a power of two number of bytes");
    }
    if (config_.capacity_bytes == 0 || config_.capacity_bytes % config_.bus_bytes != 0) {
        throw std::invalid_argument("AxiMemory capacity must be a non-zero multiple of the bus width (got " +
                                    std::to_string(config_.capacity_bytes) + " bytes)");
    }
    if (config_.max_outstanding == 0) {
        throw std::invalid_argument("AxiMemory must accept at least one outstanding burst");
    }

    memory_model.resize(config_.capacity_bytes);
    std::fill(memory_model.begin(), memory_model.end(), uint8_t(0));
}

void AxiMemory::read(Address addr, void* data, Size size) const {
    if (size > config_.capacity_bytes || addr > config_.capacity_bytes - size) {
        throw std::out_of_range("AxiMemory read out of bounds");
    }
    std::memcpy(data, memory_model.data() + addr, size);
}

void AxiMemory::write(Address addr, const void* data, Size size) {
    if (size > config_.capacity_bytes || addr > config_.capacity_bytes - size) {
        throw std::out_of_range("AxiMemory write out of bounds");
    }
    std::memcpy(memory_model.data() + addr, data, size);
}

// Bus addresses wrap modulo the capacity
BeatData AxiMemory::read_beat(Address aligned_addr) const {
    BeatData beat(config_.bus_bytes);
    for (Size i = 0; i < config_.bus_bytes; ++i) {
        beat[i] = memory_model[(aligned_addr + i) % config_.capacity_bytes];
    }
    return beat;
}

void AxiMemory::evaluate(const ArChannel& ar, bool r_ready) {
    next_ = state_;

    // R channel: load the next beat once the current one is taken
    if (!state_.r.valid || r_ready) {
        next_.r.valid = false;

        if (!next_.pending.empty()) {
            PendingBurst& burst = next_.pending.front();
            const bool stalled = stall_pattern_ && stall_pattern_(current_cycle_);

            if (current_cycle_ >= burst.ready_cycle && !stalled) {
                bool last = burst.beats_left == 1;
                switch (last_fault_) {
                    case LastFault::NONE:
                        break;
                    case LastFault::MISSING:
                        last = false;
                        break;
                    case LastFault::EARLY:
                        if (burst.beats_total > 1) last = burst.beats_left == 2;
                        break;
                }

                next_.r.id = burst.id;
                next_.r.data = read_beat(burst.beat_addr);
                next_.r.resp = AxiResp::OKAY;
                next_.r.last = last;
                next_.r.valid = true;

                burst.beat_addr += config_.bus_bytes;
                if (--burst.beats_left == 0) {
                    next_.pending.pop_front();
                }
            }
        }
    }

    // AR channel
    if (state_.ar_ready && ar.valid) {
        PendingBurst burst;
        burst.id = ar.id;
        burst.beat_addr = ar.addr & ~static_cast<Address>(config_.bus_bytes - 1);
        burst.beats_total = ar.len + 1;
        burst.beats_left = burst.beats_total;
        burst.ready_cycle = current_cycle_ + config_.read_latency;
        next_.pending.push_back(burst);
    }
    next_.ar_ready = next_.pending.size() < config_.max_outstanding;
}

void AxiMemory::commit() {
    state_ = std::move(next_);
    ++current_cycle_;
}

void AxiMemory::reset() {
    state_.pending.clear();
    state_.r.valid = false;
    state_.ar_ready = false;
    next_ = state_;
    current_cycle_ = 0;
}

} // namespace sw::axidma
