#include <string>
#include <sstream>

#include <sw/axidma/axi_dma_read_engine.hpp>

namespace sw::axidma {

// AxiDmaReadEngine implementation - two-phase clocked model of axi_dma_rd
AxiDmaReadEngine::AxiDmaReadEngine(const Config& config, size_t engine_id, double clock_freq_ghz)
    : geometry_(ReadEngineGeometry::from(config))
    , engine_id(engine_id)
    , issuer_(geometry_)
    , sequencer_(geometry_)
    , output_stage_()
    , status_()
    , status_valid_(false)
    , status_context_()
    , status_next_()
    , status_valid_next_(false)
    , status_context_next_()
    , evaluated_(false)
    , ar_burst_()
    , ar_context_()
    , ar_handshake_(false)
    , data_handshake_(false)
    , data_stalled_(false)
    , tracing_enabled_(false)
    , trace_logger_(&trace::TraceLogger::instance())
    , clock_freq_ghz_(clock_freq_ghz)
    , current_cycle_(0)
{
}

AxiDmaReadEngine::Outputs AxiDmaReadEngine::outputs() const {
    Outputs out;
    const auto& issuer_state = issuer_.state();

    out.desc_ready = issuer_state.desc_ready;
    out.ar = issuer_state.ar;
    out.r_ready = sequencer_.rready();

    out.data_valid = output_stage_.output_valid();
    out.data = output_stage_.output().beat;
    if (!geometry_.keep_enable) {
        out.data.keep.reset();
        for (Size i = 0; i < geometry_.keep_width; ++i) out.data.keep.set(i);
    }
    if (!geometry_.last_enable) {
        out.data.last = true;
    }

    out.status = status_;
    out.status_valid = status_valid_;
    return out;
}

void AxiDmaReadEngine::evaluate(const Inputs& in) {
    const auto& issuer_state = issuer_.state();

    // R channel to stream
    StreamSequencer::Inputs sequencer_in;
    sequencer_in.cmd = issuer_state.cmd_valid ? &issuer_state.cmd : nullptr;
    sequencer_in.r = &in.r;
    sequencer_in.downstream_ready = output_stage_.input_ready();
    sequencer_in.downstream_drained = output_stage_.is_empty();
    sequencer_step_ = sequencer_.evaluate(sequencer_in);

    // Output stage, then rready from its early ready
    output_step_ = output_stage_.evaluate(sequencer_step_.beat, in.data_ready);
    sequencer_step_.finalize(output_stage_.ready_early(in.data_ready, sequencer_step_.beat.has_value()));

    // AR channel
    BurstIssuer::Inputs issuer_in;
    issuer_in.descriptor = in.descriptor;
    issuer_in.enable = in.enable;
    issuer_in.ar_ready = in.ar_ready;
    issuer_in.cmd_ready = sequencer_step_.cmd_ready;
    issuer_step_ = issuer_.evaluate(issuer_in);

    // Completion status follows the final beat into the output register
    status_valid_next_ = false;
    if (output_step_.loaded_output && output_step_.next.output.completion) {
        status_next_ = *output_step_.next.output.completion;
        status_context_next_ = output_step_.next.output.context;
        status_valid_next_ = true;
    } else if (sequencer_step_.direct_completion) {
        status_next_ = *sequencer_step_.direct_completion;
        status_context_next_ = sequencer_step_.direct_context;
        status_valid_next_ = true;
    }

    ar_handshake_ = issuer_state.ar.valid && in.ar_ready;
    data_handshake_ = output_stage_.output_valid() && in.data_ready;
    data_stalled_ = output_stage_.output_valid() && !in.data_ready;

    // Protocol monitor: every R beat belongs to the oldest outstanding burst
    outstanding_next_ = outstanding_;
    burst_done_.reset();
    if (sequencer_.rready() && in.r.valid) {
        if (outstanding_next_.empty()) {
            if (geometry_.check_protocol) {
                throw ProtocolError("R beat accepted at cycle " + std::to_string(current_cycle_) +
                                    " with no outstanding AR burst");
            }
        } else {
            OutstandingBurst& front = outstanding_next_.front();
            --front.beats_left;
            const bool expect_last = front.beats_left == 0;
            if (in.r.last != expect_last && geometry_.check_protocol) {
                std::ostringstream oss;
                oss << "rlast " << (in.r.last ? "asserted" : "missing") << " at cycle " << current_cycle_
                    << " for burst @0x" << std::hex << front.burst.address << std::dec
                    << " (" << front.beats_left << " beats left of " << front.burst.arlen + 1 << ")";
                throw ProtocolError(oss.str());
            }
            if (expect_last) {
                burst_done_ = front;
                outstanding_next_.pop_front();
            }
        }
    }
    if (ar_handshake_ && ar_burst_) {
        outstanding_next_.push_back(OutstandingBurst{*ar_burst_, issuer_state.ar.len + 1, current_cycle_, ar_context_});
    }

    evaluated_ = true;
}

void AxiDmaReadEngine::commit() {
    if (!evaluated_) {
        throw std::logic_error("AxiDmaReadEngine::commit() called without evaluate()");
    }

    if (issuer_step_.descriptor_accepted) {
        TransferContext& context = issuer_step_.next.cmd.context;
        context.transaction_id = trace_logger_->next_transaction_id();
        context.accept_cycle = current_cycle_;
        in_flight_[context.transaction_id] = context;
        ++stats_.descriptors_accepted;
        trace_descriptor_accepted(issuer_step_.next.cmd);
    }

    if (issuer_step_.burst) {
        ar_burst_ = issuer_step_.burst;
        ar_context_ = issuer_.state().cmd.context;
    }

    if (ar_handshake_ && ar_burst_) {
        ++stats_.bursts_issued;
        trace_burst(outstanding_next_.back(), false);
    }
    if (burst_done_) {
        trace_burst(*burst_done_, true);
    }

    if (sequencer_step_.input_transfer) {
        ++stats_.beats_in;
        if (sequencer_.state().bubble_cycle) ++stats_.bubble_cycles;
    }
    if (data_handshake_ || data_stalled_) {
        const StagedBeat& staged = output_stage_.output();
        auto [it, inserted] = stream_progress_.try_emplace(
            staged.context.transaction_id, StreamProgress{current_cycle_, 0, 0, 0});
        StreamProgress& progress = it->second;

        if (data_stalled_) {
            ++stats_.stall_cycles;
            ++progress.stall_cycles;
        } else {
            const uint64_t bytes = geometry_.keep_enable ? staged.beat.keep.count() : geometry_.bus_bytes;
            ++stats_.beats_out;
            stats_.bytes_out += bytes;
            ++progress.beats;
            progress.bytes += bytes;
            if (staged.completion) {
                trace_stream(staged.context, progress);
                stream_progress_.erase(it);
            }
        }
    }

    if (status_valid_next_) {
        ++stats_.descriptors_completed;
        in_flight_.erase(status_context_next_.transaction_id);
        trace_completion(status_next_, status_context_next_);
    }

    issuer_.commit(issuer_step_);
    sequencer_.commit(sequencer_step_);
    output_stage_.commit(output_step_);

    status_ = status_next_;
    status_valid_ = status_valid_next_;
    status_context_ = status_context_next_;
    outstanding_ = std::move(outstanding_next_);

    ++current_cycle_;
    evaluated_ = false;
}

void AxiDmaReadEngine::reset() {
    if (tracing_enabled_ && trace_logger_) {
        for (const auto& [txn_id, context] : in_flight_) {
            trace::TraceEntry entry(
                context.accept_cycle,
                trace::ComponentType::READ_ENGINE,
                static_cast<uint32_t>(engine_id),
                trace::TransactionType::DESCRIPTOR,
                txn_id
            );
            entry.clock_freq_ghz = clock_freq_ghz_;
            entry.complete(current_cycle_, trace::TransactionStatus::CANCELLED);
            entry.description = "Descriptor aborted by reset";
            trace_logger_->log(std::move(entry));
        }

        trace::TraceEntry entry(
            current_cycle_,
            trace::ComponentType::READ_ENGINE,
            static_cast<uint32_t>(engine_id),
            trace::TransactionType::RESET,
            trace_logger_->next_transaction_id()
        );
        entry.clock_freq_ghz = clock_freq_ghz_;
        trace::ControlPayload payload;
        payload.command = "reset";
        payload.parameter = in_flight_.size();
        entry.payload = payload;
        entry.description = "Engine reset";
        trace_logger_->log(std::move(entry));
    }

    issuer_.reset();
    sequencer_.reset();
    output_stage_.reset();

    status_valid_ = false;
    status_valid_next_ = false;
    evaluated_ = false;

    ar_burst_.reset();
    outstanding_.clear();
    outstanding_next_.clear();
    burst_done_.reset();
    ar_handshake_ = false;
    data_handshake_ = false;
    data_stalled_ = false;

    in_flight_.clear();
    stream_progress_.clear();
    stats_ = Stats{};
    current_cycle_ = 0;
}

bool AxiDmaReadEngine::is_busy() const {
    return !issuer_.is_idle() || !sequencer_.is_idle() || !output_stage_.is_empty() ||
           status_valid_ || !outstanding_.empty();
}

// ===========================================
// Tracing
// ===========================================

void AxiDmaReadEngine::trace_descriptor_accepted(const StreamCommand& cmd) {
    if (!tracing_enabled_ || !trace_logger_) return;

    trace::TraceEntry entry(
        current_cycle_,
        trace::ComponentType::READ_ENGINE,
        static_cast<uint32_t>(engine_id),
        trace::TransactionType::DESCRIPTOR,
        cmd.context.transaction_id
    );
    entry.clock_freq_ghz = clock_freq_ghz_;

    trace::DescriptorPayload payload;
    payload.address = cmd.context.address;
    payload.length = cmd.context.length;
    payload.tag = cmd.tag;
    payload.stream_id = cmd.stream_id;
    payload.stream_dest = cmd.stream_dest;
    payload.stream_user = cmd.stream_user;
    entry.payload = payload;
    entry.description = "Read descriptor accepted";

    trace_logger_->log(std::move(entry));
}

void AxiDmaReadEngine::trace_burst(const OutstandingBurst& burst, bool completed) {
    if (!tracing_enabled_ || !trace_logger_) return;

    trace::TraceEntry entry(
        burst.issue_cycle,
        trace::ComponentType::BURST_ISSUER,
        static_cast<uint32_t>(engine_id),
        trace::TransactionType::BURST_READ,
        burst.context.transaction_id
    );
    entry.clock_freq_ghz = clock_freq_ghz_;
    if (completed) {
        entry.complete(current_cycle_, trace::TransactionStatus::COMPLETED);
    }

    trace::BurstPayload payload;
    payload.address = burst.burst.address;
    payload.length = burst.burst.length;
    payload.beats = burst.burst.arlen + 1;
    payload.beat_bytes = static_cast<uint32_t>(geometry_.bus_bytes);
    entry.payload = payload;
    entry.description = completed ? "AXI read burst completed" : "AXI read burst issued";

    trace_logger_->log(std::move(entry));
}

void AxiDmaReadEngine::trace_completion(const CompletionStatus& status, const TransferContext& context) {
    if (!tracing_enabled_ || !trace_logger_) return;

    trace::TraceEntry entry(
        context.accept_cycle,
        trace::ComponentType::READ_ENGINE,
        static_cast<uint32_t>(engine_id),
        trace::TransactionType::DESCRIPTOR,
        context.transaction_id
    );
    entry.clock_freq_ghz = clock_freq_ghz_;
    // status is visible from the next cycle
    entry.complete(current_cycle_ + 1, trace::TransactionStatus::COMPLETED);

    trace::DescriptorPayload payload;
    payload.address = context.address;
    payload.length = context.length;
    payload.tag = status.tag;
    entry.payload = payload;
    entry.description = "Read descriptor completed";

    trace_logger_->log(std::move(entry));
}

void AxiDmaReadEngine::trace_stream(const TransferContext& context, const StreamProgress& progress) {
    if (!tracing_enabled_ || !trace_logger_) return;

    trace::TraceEntry entry(
        progress.first_cycle,
        trace::ComponentType::SKID_BUFFER,
        static_cast<uint32_t>(engine_id),
        trace::TransactionType::STREAM,
        context.transaction_id
    );
    entry.clock_freq_ghz = clock_freq_ghz_;
    // last beat taken by the sink this cycle
    entry.complete(current_cycle_ + 1, trace::TransactionStatus::COMPLETED);

    trace::StreamPayload payload;
    payload.beats = progress.beats;
    payload.bytes = progress.bytes;
    payload.stall_cycles = progress.stall_cycles;
    entry.payload = payload;
    entry.description = "AXI stream packet delivered";

    trace_logger_->log(std::move(entry));
}

} // namespace sw::axidma
