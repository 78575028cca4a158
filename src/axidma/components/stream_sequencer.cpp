#include <sw/axidma/components/stream_sequencer.hpp>

namespace sw::axidma {

const char* to_string(StreamSequencer::Phase phase) {
    switch (phase) {
        case StreamSequencer::Phase::IDLE: return "IDLE";
        case StreamSequencer::Phase::READ: return "READ";
        default: return "UNKNOWN";
    }
}

StreamSequencer::StreamSequencer(const ReadEngineGeometry& geometry)
    : geometry_(geometry)
{
    state_.save_rdata.assign(geometry_.bus_bytes, 0);
}

// {rdata, save} >> ((W - offset) words), W words when aligned
BeatData StreamSequencer::realign(const BeatData& rdata) const {
    const Size width = geometry_.bus_bytes;
    const Size shift = width - state_.offset;

    BeatData out(width, 0);
    for (Size i = 0; i < width; ++i) {
        const Size j = i + shift;
        if (j < width) {
            out[i] = state_.save_rdata[j];
        } else if (j - width < rdata.size()) {
            out[i] = rdata[j - width];
        }
    }
    return out;
}

StreamSequencer::Step StreamSequencer::evaluate(const Inputs& in) const {
    const State& s = state_;
    Step step;
    step.next = s;
    State& n = step.next;

    switch (s.phase) {
        case Phase::IDLE:
            if (!in.cmd) break;

            if (in.cmd->zero_length) {
                // complete in order: earlier beats must have left the output stage
                if (in.downstream_drained) {
                    step.cmd_ready = true;
                    step.direct_completion = CompletionStatus{in.cmd->tag};
                    step.direct_context = in.cmd->context;
                }
                break;
            }

            // load transfer parameters
            n.offset = geometry_.unaligned ? in.cmd->offset : 0;
            n.last_offset = in.cmd->last_offset;
            n.input_cycle_count = in.cmd->input_cycle_count;
            n.output_cycle_count = in.cmd->output_cycle_count;
            n.bubble_cycle = in.cmd->bubble_cycle;
            n.tag = in.cmd->tag;
            n.stream_id = in.cmd->stream_id;
            n.stream_dest = in.cmd->stream_dest;
            n.stream_user = in.cmd->stream_user;
            n.context = in.cmd->context;

            n.output_last_cycle = n.output_cycle_count == 0;
            n.input_active = true;
            n.output_active = true;
            n.first_cycle = true;

            step.cmd_ready = true;
            step.wants_input = true;
            n.phase = Phase::READ;
            break;

        case Phase::READ: {
            const bool in_xfer = s.rready && in.r && in.r->valid;
            step.wants_input = s.input_active;

            if (!in_xfer && !(!s.input_active && in.downstream_ready)) {
                break;
            }

            step.input_transfer = in_xfer;
            if (in_xfer) {
                n.save_rdata = in.r->data;
            }

            if (s.input_active) {
                n.input_cycle_count = s.input_cycle_count > 0 ? s.input_cycle_count - 1 : 0;
                n.input_active = s.input_cycle_count > 0;
            }
            n.bubble_cycle = false;
            n.first_cycle = false;

            if (s.bubble_cycle) {
                // priming cycle, no output
                step.wants_input = n.input_active;
                break;
            }

            if (s.output_active) {
                n.output_cycle_count = s.output_cycle_count > 0 ? s.output_cycle_count - 1 : 0;
                n.output_active = s.output_cycle_count > 0;
            }
            n.output_last_cycle = n.output_cycle_count == 0;

            StagedBeat staged;
            staged.beat.data = realign(in_xfer ? in.r->data : BeatData(geometry_.bus_bytes, 0));
            for (Size i = 0; i < geometry_.keep_width; ++i) staged.beat.keep.set(i);
            staged.beat.id = s.stream_id;
            staged.beat.dest = s.stream_dest;
            staged.beat.user = s.stream_user;
            staged.context = s.context;

            if (s.output_last_cycle) {
                // final beat of the descriptor
                if (s.last_offset) {
                    staged.beat.keep.reset();
                    for (Size i = 0; i < s.last_offset; ++i) staged.beat.keep.set(i);
                }
                staged.beat.last = true;
                staged.completion = CompletionStatus{s.tag};

                step.wants_input = false;
                n.phase = Phase::IDLE;
            } else {
                step.wants_input = n.input_active;
            }

            step.beat = std::move(staged);
            break;
        }
    }

    return step;
}

void StreamSequencer::reset() {
    state_.phase = Phase::IDLE;
    state_.input_active = false;
    state_.output_active = false;
    state_.rready = false;
}

} // namespace sw::axidma
