#include <sw/trace/trace_entry.hpp>

namespace sw::trace {

const char* to_string(ComponentType type) {
    switch (type) {
        case ComponentType::DESCRIPTOR_SOURCE: return "DESCRIPTOR_SOURCE";
        case ComponentType::READ_ENGINE: return "READ_ENGINE";
        case ComponentType::BURST_ISSUER: return "BURST_ISSUER";
        case ComponentType::STREAM_SEQUENCER: return "STREAM_SEQUENCER";
        case ComponentType::SKID_BUFFER: return "SKID_BUFFER";
        case ComponentType::AXI_MEMORY: return "AXI_MEMORY";
        case ComponentType::STREAM_SINK: return "STREAM_SINK";
        case ComponentType::UNKNOWN: return "UNKNOWN";
        default: return "INVALID";
    }
}

const char* to_string(TransactionType type) {
    switch (type) {
        case TransactionType::DESCRIPTOR: return "DESCRIPTOR";
        case TransactionType::BURST_READ: return "BURST_READ";
        case TransactionType::STREAM: return "STREAM";
        case TransactionType::CONFIGURE: return "CONFIGURE";
        case TransactionType::RESET: return "RESET";
        case TransactionType::UNKNOWN: return "UNKNOWN";
        default: return "INVALID";
    }
}

const char* to_string(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::ISSUED: return "ISSUED";
        case TransactionStatus::IN_PROGRESS: return "IN_PROGRESS";
        case TransactionStatus::COMPLETED: return "COMPLETED";
        case TransactionStatus::FAILED: return "FAILED";
        case TransactionStatus::CANCELLED: return "CANCELLED";
        default: return "INVALID";
    }
}

} // namespace sw::trace
