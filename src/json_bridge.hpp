#pragma once

#include "../include/vocab/config.hpp"
#include "../include/vocab/session_engine.hpp"

namespace vocab::bridge {

nlohmann::json to_json(const Word& word);
Word word_from_json(const nlohmann::json& json_word);

nlohmann::json to_json(const ProgressRecord& record);
ProgressRecord progress_record_from_json(const nlohmann::json& json_record);

nlohmann::json to_json(const UserLanguageSettings& settings);
UserLanguageSettings settings_from_json(const nlohmann::json& json_settings);

nlohmann::json to_json(const SessionState& state);
SessionState session_state_from_json(const nlohmann::json& json_state);

nlohmann::json to_json(const StudyCard& card);

nlohmann::json to_json(const SessionCompleted& completed);
SessionCompleted session_completed_from_json(const nlohmann::json& json_completed);

nlohmann::json to_json(const SessionEngine::Current& current);

nlohmann::json to_json(const ProgressSummary& summary);

nlohmann::json to_json(const EngineConfig& config);
EngineConfig engine_config_from_json(const nlohmann::json& json_config);

} // namespace vocab::bridge
