#pragma once

#include <optional>

namespace sw::axidma {

/**
 * @brief Two-slot output stage with registered backpressure
 *
 * The producer sees `input_ready()`, a register loaded from the early ready
 * of the previous cycle, so its ready never depends combinationally on the
 * consumer. When the consumer stalls while a beat is already in flight the
 * beat lands in the temp register and is forwarded once the output slot
 * drains.
 *
 * evaluate() is pure; commit() latches a step. Beat is any copyable payload.
 */
template <typename Beat>
class SkidBuffer {
public:
    struct State {
        Beat output{};
        bool output_valid = false;
        Beat temp{};
        bool temp_valid = false;
        bool input_ready = false;   // registered early ready
    };

    struct Step {
        State next;
        bool loaded_output = false;  // a valid beat moved into the output register
    };

    // Ready the producer may act on next cycle
    static bool ready_early(const State& s, bool sink_ready, bool input_valid) {
        return sink_ready || (!s.temp_valid && (!s.output_valid || !input_valid));
    }

    bool ready_early(bool sink_ready, bool input_valid) const {
        return ready_early(state_, sink_ready, input_valid);
    }

    Step evaluate(const std::optional<Beat>& input, bool sink_ready) const {
        const State& s = state_;
        Step step{s, false};
        State& n = step.next;

        if (s.input_ready) {
            if (sink_ready || !s.output_valid) {
                // output is ready or empty, input goes straight to output
                n.output_valid = input.has_value();
                if (input) {
                    n.output = *input;
                    step.loaded_output = true;
                }
            } else {
                // output stalled, park input in temp
                n.temp_valid = input.has_value();
                if (input) n.temp = *input;
            }
        } else if (sink_ready) {
            // input not ready, drain temp into output
            n.output_valid = s.temp_valid;
            n.temp_valid = false;
            if (s.temp_valid) {
                n.output = s.temp;
                step.loaded_output = true;
            }
        }

        n.input_ready = ready_early(s, sink_ready, input.has_value());
        return step;
    }

    void commit(const Step& step) { state_ = step.next; }

    // Clear validity; data registers keep their contents
    void reset() {
        state_.output_valid = false;
        state_.temp_valid = false;
        state_.input_ready = false;
    }

    const State& state() const { return state_; }
    bool input_ready() const { return state_.input_ready; }
    bool output_valid() const { return state_.output_valid; }
    const Beat& output() const { return state_.output; }
    bool is_empty() const { return !state_.output_valid && !state_.temp_valid; }
    int occupancy() const { return int(state_.output_valid) + int(state_.temp_valid); }

private:
    State state_;
};

} // namespace sw::axidma
