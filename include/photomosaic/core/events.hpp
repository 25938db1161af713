#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace photomosaic::core {

using json = nlohmann::json;

/**
 * Structured run log.
 * Every event is one JSON object per line on `out`, mirrored into the
 * optional log file. Safe to call from several batch workers.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ofstream* log_file = nullptr);

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra = json::object());

    void phase_start(const std::string& run_id, Phase phase, const json& extra = json::object());
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& message = "");
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra = json::object());

    void warning(const std::string& run_id, const std::string& message,
                 const json& extra = json::object());
    void error(const std::string& run_id, const std::string& message);

    void emit(const json& event);

private:
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream& out_;
    std::ofstream* log_file_;
    std::mutex mutex_;
};

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out);

} // namespace photomosaic::core
