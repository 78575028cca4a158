#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

#include <sw/trace/trace_entry.hpp>

// Windows/MSVC compatibility
#ifdef _MSC_VER
    #pragma warning(push)
    #pragma warning(disable: 4251)
    #ifdef BUILDING_AXIDMA_SIMULATOR
        #define AXIDMA_API __declspec(dllexport)
    #else
        #define AXIDMA_API __declspec(dllimport)
    #endif
#else
    #define AXIDMA_API
#endif

namespace sw::trace {

/**
 * @brief Process-wide collector of cycle-stamped transaction records
 *
 * Components hold a pointer to the logger (the singleton by default) and
 * append entries while tracing is enabled. Transaction IDs are handed out
 * even when logging is disabled so that correlation stays stable when
 * tracing is switched on mid-run.
 */
class AXIDMA_API TraceLogger {
public:
    static TraceLogger& instance();

    TraceLogger() = default;
    TraceLogger(const TraceLogger&) = delete;
    TraceLogger& operator=(const TraceLogger&) = delete;

    void set_enabled(bool enabled) { enabled_.store(enabled); }
    bool is_enabled() const { return enabled_.load(); }

    // Append an entry (dropped while disabled)
    void log(TraceEntry entry);

    uint64_t next_transaction_id() { return next_transaction_id_.fetch_add(1); }

    // Queries return copies so callers never observe concurrent appends
    std::vector<TraceEntry> get_all_traces() const;
    std::vector<TraceEntry> get_component_traces(ComponentType type, uint32_t component_id) const;
    std::vector<TraceEntry> get_transaction_traces(uint64_t transaction_id) const;
    size_t get_trace_count() const;

    // Drop all entries; transaction IDs keep counting
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<TraceEntry> traces_;
    std::atomic<bool> enabled_{false};
    std::atomic<uint64_t> next_transaction_id_{1};
};

} // namespace sw::trace

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
