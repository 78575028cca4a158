#include <stdexcept>

#include <sw/axidma/components/burst_issuer.hpp>

namespace sw::axidma {

BurstCommand plan_burst(const ReadEngineGeometry& geometry, Address address, Size remaining) {
    if (remaining == 0) {
        throw std::invalid_argument("plan_burst: nothing left to request");
    }

    const Address page_offset = address & (kAxiBoundary - 1);
    const Size word_offset = static_cast<Size>(address & geometry.offset_mask);
    const Size max_burst = geometry.max_burst_bytes;

    Size length;
    if (remaining <= max_burst - word_offset || max_burst >= kAxiBoundary) {
        // remainder fits in one burst
        if (((page_offset + (remaining & (kAxiBoundary - 1))) >> 12) != 0 || (remaining >> 12) != 0) {
            // crosses 4k boundary
            length = static_cast<Size>(kAxiBoundary - page_offset);
        } else {
            length = remaining;
        }
    } else {
        // remainder larger than max burst
        if (((page_offset + max_burst) >> 12) != 0) {
            // crosses 4k boundary
            length = static_cast<Size>(kAxiBoundary - page_offset);
        } else {
            length = max_burst - word_offset;
        }
    }

    BurstCommand burst;
    burst.address = address;
    burst.length = length;
    if (geometry.unaligned) {
        burst.arlen = static_cast<uint32_t>((length + word_offset - 1) >> geometry.burst_size);
    } else {
        burst.arlen = static_cast<uint32_t>((length - 1) >> geometry.burst_size);
    }
    return burst;
}

const char* to_string(BurstIssuer::Phase phase) {
    switch (phase) {
        case BurstIssuer::Phase::IDLE: return "IDLE";
        case BurstIssuer::Phase::START: return "START";
        default: return "UNKNOWN";
    }
}

BurstIssuer::BurstIssuer(const ReadEngineGeometry& geometry)
    : geometry_(geometry)
{
    state_.ar.size = static_cast<uint8_t>(geometry_.burst_size);
}

StreamCommand BurstIssuer::make_stream_command(const ReadDescriptor& desc, Address start_addr) const {
    StreamCommand cmd;
    cmd.tag = desc.tag;
    cmd.stream_id = desc.stream_id;
    cmd.stream_dest = desc.stream_dest;
    cmd.stream_user = desc.stream_user;
    cmd.last_offset = static_cast<uint32_t>(desc.length & geometry_.offset_mask);

    if (desc.length == 0) {
        cmd.zero_length = true;
        return cmd;
    }

    if (geometry_.unaligned) {
        const Size word_offset = static_cast<Size>(start_addr & geometry_.offset_mask);
        cmd.offset = static_cast<uint32_t>((geometry_.bus_bytes - word_offset) & geometry_.offset_mask);
        cmd.bubble_cycle = cmd.offset > 0;
        cmd.input_cycle_count = (desc.length + word_offset - 1) >> geometry_.burst_size;
    } else {
        cmd.offset = 0;
        cmd.bubble_cycle = false;
        cmd.input_cycle_count = (desc.length - 1) >> geometry_.burst_size;
    }
    cmd.output_cycle_count = (desc.length - 1) >> geometry_.burst_size;
    return cmd;
}

BurstIssuer::Step BurstIssuer::evaluate(const Inputs& in) const {
    const State& s = state_;
    Step step{s, false, std::nullopt};
    State& n = step.next;

    n.desc_ready = false;
    n.ar.valid = s.ar.valid && !in.ar_ready;
    n.cmd_valid = s.cmd_valid && !in.cmd_ready;

    switch (s.phase) {
        case Phase::IDLE:
            // load new descriptor
            n.desc_ready = !s.cmd_valid && in.enable;

            if (s.desc_ready && in.descriptor) {
                ReadDescriptor desc = *in.descriptor;
                desc.length &= geometry_.len_mask;
                desc.tag &= geometry_.tag_mask;
                desc.stream_id &= geometry_.id_mask;
                desc.stream_dest &= geometry_.dest_mask;
                desc.stream_user &= geometry_.user_mask;

                const Address start_addr = geometry_.unaligned
                    ? (desc.address & geometry_.addr_mask)
                    : (desc.address & geometry_.aligned_addr_mask);

                step.descriptor_accepted = true;
                n.cmd = make_stream_command(desc, start_addr);
                n.cmd.context.address = start_addr;
                n.cmd.context.length = desc.length;
                n.cmd_valid = true;
                n.desc_ready = false;

                if (desc.length == 0) {
                    // nothing to request, sequencer completes it directly
                    n.phase = Phase::IDLE;
                } else {
                    n.addr = start_addr;
                    n.op_word_count = desc.length;
                    n.phase = Phase::START;
                }
            }
            break;

        case Phase::START:
            // issue one burst per free AR slot
            if (!s.ar.valid) {
                BurstCommand burst = plan_burst(geometry_, s.addr, s.op_word_count);

                n.ar.id = 0;
                n.ar.addr = s.addr;
                n.ar.len = burst.arlen;
                n.ar.size = static_cast<uint8_t>(geometry_.burst_size);
                n.ar.valid = true;
                step.burst = burst;

                n.addr = (s.addr + burst.length) & geometry_.addr_mask;
                n.op_word_count = s.op_word_count - burst.length;

                if (n.op_word_count > 0) {
                    n.phase = Phase::START;
                } else {
                    n.desc_ready = !s.cmd_valid && in.enable;
                    n.phase = Phase::IDLE;
                }
            }
            break;
    }

    return step;
}

void BurstIssuer::reset() {
    state_.phase = Phase::IDLE;
    state_.desc_ready = false;
    state_.ar.valid = false;
    state_.cmd_valid = false;
}

} // namespace sw::axidma
