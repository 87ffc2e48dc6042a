#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace diffmap::core {

using json = nlohmann::json;

/**
 * JSON-lines event stream for one diff run.
 * Every event carries type, run_id and an ISO-8601 timestamp.
 */
class EventEmitter {
public:
    EventEmitter(std::ostream& out, std::string run_id);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status);

    void phase_start(Phase phase);
    void phase_end(Phase phase, const std::string& status,
                   const json& extra = json::object());

    void warning(const std::string& message);
    void error(const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::ostream& out_;
    std::string run_id_;
};

} // namespace diffmap::core
