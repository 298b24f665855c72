#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace ridge_texture::core {

using json = nlohmann::json;

// JSON-lines event log shared by concurrent runs. Each call writes one line.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra, std::ostream& out);

    void phase_start(const std::string& run_id, Stage stage, std::ostream& out);
    void phase_end(const std::string& run_id, Stage stage, const std::string& status,
                   const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    std::mutex mutex_;
};

} // namespace ridge_texture::core
