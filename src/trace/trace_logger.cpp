#include <sw/trace/trace_logger.hpp>

namespace sw::trace {

TraceLogger& TraceLogger::instance() {
    static TraceLogger logger;
    return logger;
}

void TraceLogger::log(TraceEntry entry) {
    if (!enabled_.load()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.emplace_back(std::move(entry));
}

std::vector<TraceEntry> TraceLogger::get_all_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

std::vector<TraceEntry> TraceLogger::get_component_traces(ComponentType type, uint32_t component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceEntry> result;
    for (const auto& entry : traces_) {
        if (entry.component_type == type && entry.component_id == component_id) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<TraceEntry> TraceLogger::get_transaction_traces(uint64_t transaction_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceEntry> result;
    for (const auto& entry : traces_) {
        if (entry.transaction_id == transaction_id) {
            result.push_back(entry);
        }
    }
    return result;
}

size_t TraceLogger::get_trace_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_.size();
}

void TraceLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

} // namespace sw::trace
