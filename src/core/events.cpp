#include "photomosaic/core/events.hpp"
#include "photomosaic/core/utils.hpp"

namespace photomosaic::core {

namespace {

void merge_extra(json& event, const json& extra) {
    if (!extra.empty() && extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
}

} // namespace

EventEmitter::EventEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    std::string line = event.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << "\n";
    out_.flush();

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, const json& extra) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, int current,
                                  int total, const std::string& message) {
    json event = base_event("phase_progress", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 1.0f;
    if (!message.empty()) {
        event["substep"] = message;
    }
    emit(event);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           const json& extra) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out) {
    json event = {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    out << event.dump() << "\n";
    out.flush();
}

} // namespace photomosaic::core
