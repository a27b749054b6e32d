#include "psr_analyzer/core/events.hpp"
#include "psr_analyzer/core/utils.hpp"

#include <utility>

namespace psr_analyzer::core {

EventEmitter::EventEmitter(std::ostream* out, std::string run_id)
    : out_(out), run_id_(std::move(run_id)) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    if (!out_) return;
    (*out_) << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    emit(event);
}

void EventEmitter::phase_start(Phase phase) {
    json event = base_event("phase_start");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event);
}

void EventEmitter::phase_end(Phase phase, const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::warning(const std::string& stage, const std::string& message) {
    json event = base_event("warning");
    event["stage"] = stage;
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    emit(event);
}

} // namespace psr_analyzer::core
