#include "ridge_texture/core/events.hpp"
#include "ridge_texture/core/utils.hpp"

namespace ridge_texture::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra,
                           std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Stage stage, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = stage_to_int(stage);
    event["phase_name"] = stage_to_string(stage);
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Stage stage,
                             const std::string& status, const json& extra,
                             std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = stage_to_int(stage);
    event["phase_name"] = stage_to_string(stage);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace ridge_texture::core
