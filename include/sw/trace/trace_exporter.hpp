#pragma once

#include <sw/trace/trace_logger.hpp>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

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

// Helper to convert payload to string for export
inline std::string payload_to_string(const PayloadData& payload) {
    std::ostringstream oss;

    if (std::holds_alternative<DescriptorPayload>(payload)) {
        const auto& desc = std::get<DescriptorPayload>(payload);
        oss << "Desc[@0x" << std::hex << desc.address << std::dec
            << " len:" << desc.length
            << " tag:" << desc.tag
            << " id:" << desc.stream_id
            << " dest:" << desc.stream_dest
            << " user:" << desc.stream_user << "]";
    }
    else if (std::holds_alternative<BurstPayload>(payload)) {
        const auto& burst = std::get<BurstPayload>(payload);
        oss << "Burst[@0x" << std::hex << burst.address << std::dec
            << " len:" << burst.length
            << " beats:" << burst.beats << "x" << burst.beat_bytes << "B]";
    }
    else if (std::holds_alternative<StreamPayload>(payload)) {
        const auto& stream = std::get<StreamPayload>(payload);
        oss << "Stream[beats:" << stream.beats
            << " bytes:" << stream.bytes
            << " stalls:" << stream.stall_cycles << "]";
    }
    else if (std::holds_alternative<ControlPayload>(payload)) {
        const auto& ctrl = std::get<ControlPayload>(payload);
        oss << "Control[" << ctrl.command << " param:" << ctrl.parameter << "]";
    }
    else {
        oss << "NoPayload";
    }

    return oss.str();
}

// CSV Export
class AXIDMA_API CSVExporter {
public:
    static bool export_traces(const std::string& filename, const std::vector<TraceEntry>& traces) {
        std::ofstream file(filename);
        if (!file.is_open()) return false;

        file << "TransactionID,ComponentType,ComponentID,TransactionType,Status,"
             << "CycleIssue,CycleComplete,DurationCycles,"
             << "TimeIssueNs,TimeCompleteNs,DurationNs,"
             << "Payload,Description\n";

        for (const auto& entry : traces) {
            file << entry.transaction_id << ","
                 << to_string(entry.component_type) << ","
                 << entry.component_id << ","
                 << to_string(entry.transaction_type) << ","
                 << to_string(entry.status) << ","
                 << entry.cycle_issue << ","
                 << entry.cycle_complete << ","
                 << entry.get_duration_cycles() << ","
                 << std::fixed << std::setprecision(3) << entry.get_issue_time_ns() << ","
                 << entry.get_complete_time_ns() << ","
                 << entry.get_duration_ns() << ","
                 << "\"" << payload_to_string(entry.payload) << "\","
                 << "\"" << entry.description << "\"\n";
        }

        file.close();
        return true;
    }
};

// JSON Export
class AXIDMA_API JSONExporter {
public:
    static bool export_traces(const std::string& filename, const std::vector<TraceEntry>& traces) {
        std::ofstream file(filename);
        if (!file.is_open()) return false;

        file << "{\n";
        file << "  \"traces\": [\n";

        for (size_t i = 0; i < traces.size(); ++i) {
            const auto& entry = traces[i];

            file << "    {\n";
            file << "      \"transaction_id\": " << entry.transaction_id << ",\n";
            file << "      \"component_type\": \"" << to_string(entry.component_type) << "\",\n";
            file << "      \"component_id\": " << entry.component_id << ",\n";
            file << "      \"transaction_type\": \"" << to_string(entry.transaction_type) << "\",\n";
            file << "      \"status\": \"" << to_string(entry.status) << "\",\n";
            file << "      \"cycle_issue\": " << entry.cycle_issue << ",\n";
            file << "      \"cycle_complete\": " << entry.cycle_complete << ",\n";
            file << "      \"duration_cycles\": " << entry.get_duration_cycles() << ",\n";

            if (entry.clock_freq_ghz.has_value()) {
                file << "      \"clock_freq_ghz\": " << std::fixed << std::setprecision(3)
                     << entry.clock_freq_ghz.value() << ",\n";
                file << "      \"time_issue_ns\": " << entry.get_issue_time_ns() << ",\n";
                file << "      \"time_complete_ns\": " << entry.get_complete_time_ns() << ",\n";
                file << "      \"duration_ns\": " << entry.get_duration_ns() << ",\n";
            }

            file << "      \"payload\": \"" << payload_to_string(entry.payload) << "\",\n";
            file << "      \"description\": \"" << entry.description << "\"\n";
            file << "    }" << (i < traces.size() - 1 ? "," : "") << "\n";
        }

        file << "  ]\n";
        file << "}\n";

        file.close();
        return true;
    }
};

// Chrome Trace Event Format Export (for chrome://tracing visualization)
class AXIDMA_API ChromeTraceExporter {
private:
    // Display order follows the datapath: descriptors in, stream out
    static uint32_t get_display_pid(ComponentType type) {
        switch (type) {
            case ComponentType::DESCRIPTOR_SOURCE: return 1;
            case ComponentType::READ_ENGINE:       return 2;
            case ComponentType::BURST_ISSUER:      return 3;
            case ComponentType::AXI_MEMORY:        return 4;
            case ComponentType::STREAM_SEQUENCER:  return 5;
            case ComponentType::SKID_BUFFER:       return 6;
            case ComponentType::STREAM_SINK:       return 7;
            default: return 99;
        }
    }

public:
    static bool export_traces(const std::string& filename, const std::vector<TraceEntry>& traces,
                             double default_freq_ghz = 1.0) {
        std::ofstream file(filename);
        if (!file.is_open()) return false;

        file << "[\n";

        std::map<uint32_t, std::string> process_names;
        std::map<std::pair<uint32_t, uint32_t>, std::string> thread_names;

        for (const auto& entry : traces) {
            uint32_t pid = get_display_pid(entry.component_type);
            uint32_t tid = entry.component_id;

            // Prefix with display order so the viewer sorts rows along the datapath
            std::ostringstream process_name_stream;
            process_name_stream << std::setfill('0') << std::setw(2) << pid << "-" << to_string(entry.component_type);
            process_names[pid] = process_name_stream.str();

            std::ostringstream thread_name;
            thread_name << to_string(entry.component_type) << " #" << tid;
            thread_names[{pid, tid}] = thread_name.str();
        }

        bool first_event = true;
        for (const auto& [pid, name] : process_names) {
            if (!first_event) file << ",\n";
            file << "  {\"name\": \"process_name\", \"ph\": \"M\", \"pid\": " << pid
                 << ", \"args\": {\"name\": \"" << name << "\"}}";
            first_event = false;
        }

        for (const auto& [pid_tid, name] : thread_names) {
            if (!first_event) file << ",\n";
            file << "  {\"name\": \"thread_name\", \"ph\": \"M\", \"pid\": " << pid_tid.first
                 << ", \"tid\": " << pid_tid.second
                 << ", \"args\": {\"name\": \"" << name << "\"}}";
            first_event = false;
        }

        for (const auto& entry : traces) {
            if (!first_event) file << ",\n";
            first_event = false;

            double freq = entry.clock_freq_ghz.value_or(default_freq_ghz);

            // chrome trace expects microseconds
            double ts_us = static_cast<double>(entry.cycle_issue) / freq / 1000.0;
            double dur_us = static_cast<double>(entry.get_duration_cycles()) / freq / 1000.0;

            std::string category = to_string(entry.component_type);
            uint32_t pid = get_display_pid(entry.component_type);
            uint32_t tid = entry.component_id;

            file << "  {\"name\": \"" << to_string(entry.transaction_type) << "\",";
            file << " \"cat\": \"" << category << "\",";
            if (entry.cycle_complete > 0) {
                file << " \"ph\": \"X\",";  // Complete event
                file << " \"ts\": " << std::fixed << std::setprecision(3) << ts_us << ",";
                file << " \"dur\": " << dur_us << ",";
            } else {
                file << " \"ph\": \"i\",";  // Instant event
                file << " \"ts\": " << std::fixed << std::setprecision(3) << ts_us << ",";
                file << " \"s\": \"t\",";
            }
            file << " \"pid\": " << pid << ",";
            file << " \"tid\": " << tid << ",";
            file << " \"args\": {";
            file << "\"txn_id\": " << entry.transaction_id << ",";
            file << "\"status\": \"" << to_string(entry.status) << "\",";
            file << "\"cycle_issue\": " << entry.cycle_issue << ",";
            file << "\"cycle_complete\": " << entry.cycle_complete << ",";
            file << "\"payload\": \"" << payload_to_string(entry.payload) << "\"";
            if (!entry.description.empty()) {
                file << ",\"desc\": \"" << entry.description << "\"";
            }
            file << "}}";
        }

        file << "\n]\n";

        file.close();
        return true;
    }
};

// Convenience function to export from logger
inline bool export_logger_traces(const std::string& filename,
                                 const std::string& format = "csv",
                                 TraceLogger& logger = TraceLogger::instance()) {
    auto traces = logger.get_all_traces();

    if (format == "csv") {
        return CSVExporter::export_traces(filename, traces);
    }
    else if (format == "json") {
        return JSONExporter::export_traces(filename, traces);
    }
    else if (format == "chrome" || format == "trace") {
        return ChromeTraceExporter::export_traces(filename, traces);
    }

    return false;
}

} // namespace sw::trace

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
