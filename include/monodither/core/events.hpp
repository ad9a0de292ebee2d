#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace monodither::core {

using json = nlohmann::json;

// Emits one JSON object per line. Not synchronized: callers that emit from
// several threads serialize access themselves.
class EventEmitter {
public:
    EventEmitter() = default;
    
    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra, std::ostream& out);
    
    void phase_start(const std::string& run_id, Phase phase, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);
    
    void file_processed(const std::string& run_id, const FileResult& result,
                        std::ostream& out);
    
    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);
    
private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace monodither::core
