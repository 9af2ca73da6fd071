#include "json_bridge.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace vocab::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

void require_object(const nlohmann::json& value, std::string_view what) {
  if (!value.is_object()) {
    throw std::invalid_argument("Expected object for " + std::string(what));
  }
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    return static_cast<int>(std::lround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    return static_cast<std::int64_t>(std::llround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::string required_string(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key)) {
    throw std::invalid_argument(std::string("Missing field '") + key + "'");
  }
  return json_to_string(obj[key], key);
}

Date json_to_date(const nlohmann::json& value, std::string_view key) {
  return Date::parse(json_to_string(value, key));
}

Timestamp json_to_timestamp(const nlohmann::json& value, std::string_view key) {
  return from_unix_seconds(json_to_int64(value, key));
}

HintType json_to_hint_type(const nlohmann::json& value, std::string_view key) {
  return hint_type_from_string(json_to_string(value, key));
}

nlohmann::json optional_string(const std::optional<std::string>& value) {
  return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json hints_to_json(const std::vector<HintType>& hints) {
  nlohmann::json arr = nlohmann::json::array();
  for (HintType type : hints) {
    arr.push_back(to_string(type));
  }
  return arr;
}

} // namespace

nlohmann::json to_json(const Word& word) {
  nlohmann::json j = nlohmann::json::object();
  j["id"] = word.id;
  j["language_id"] = word.language_id;
  j["word_foreign"] = word.word_foreign;
  j["translation"] = word.translation;
  j["transcription"] = word.transcription;
  j["word_number"] = word.word_number;
  j["sound_file_path"] = optional_string(word.sound_file_path);
  return j;
}

Word word_from_json(const nlohmann::json& json_word) {
  require_object(json_word, "word");
  Word word;
  word.id = required_string(json_word, "id");
  word.language_id = required_string(json_word, "language_id");
  assign_if_present(json_word, "word_foreign", [&](const nlohmann::json& value) {
    word.word_foreign = json_to_string(value, "word_foreign");
  });
  assign_if_present(json_word, "translation", [&](const nlohmann::json& value) {
    word.translation = json_to_string(value, "translation");
  });
  assign_if_present(json_word, "transcription", [&](const nlohmann::json& value) {
    word.transcription = json_to_string(value, "transcription");
  });
  assign_if_present(json_word, "word_number", [&](const nlohmann::json& value) {
    word.word_number = json_to_int(value, "word_number");
  });
  assign_if_present(json_word, "sound_file_path", [&](const nlohmann::json& value) {
    word.sound_file_path = json_to_string(value, "sound_file_path");
  });
  return word;
}

nlohmann::json to_json(const ProgressRecord& record) {
  nlohmann::json j = nlohmann::json::object();
  j["user_id"] = record.user_id;
  j["word_id"] = record.word_id;
  j["language_id"] = record.language_id;
  j["score"] = record.score;
  j["is_skipped"] = record.is_skipped;
  j["check_interval"] = record.check_interval;
  j["next_check_date"] = record.next_check_date.has_value()
                             ? nlohmann::json(record.next_check_date->to_string())
                             : nlohmann::json(nullptr);
  for (HintType type : all_hint_types()) {
    j["hint_" + to_string(type)] = optional_string(record.hint(type));
  }
  j["created_at"] = to_unix_seconds(record.created_at);
  j["updated_at"] = to_unix_seconds(record.updated_at);
  return j;
}

ProgressRecord progress_record_from_json(const nlohmann::json& json_record) {
  require_object(json_record, "progress record");
  ProgressRecord record;
  record.user_id = required_string(json_record, "user_id");
  record.word_id = required_string(json_record, "word_id");
  assign_if_present(json_record, "language_id", [&](const nlohmann::json& value) {
    record.language_id = json_to_string(value, "language_id");
  });
  assign_if_present(json_record, "score", [&](const nlohmann::json& value) {
    record.score = json_to_int(value, "score");
    if (record.score != 0 && record.score != 1) {
      throw std::invalid_argument("score must be 0 or 1");
    }
  });
  assign_if_present(json_record, "is_skipped", [&](const nlohmann::json& value) {
    record.is_skipped = json_to_bool(value, "is_skipped");
  });
  assign_if_present(json_record, "check_interval", [&](const nlohmann::json& value) {
    record.check_interval = json_to_int(value, "check_interval");
    if (record.check_interval < 0) {
      throw std::invalid_argument("check_interval must not be negative");
    }
  });
  assign_if_present(json_record, "next_check_date", [&](const nlohmann::json& value) {
    record.next_check_date = json_to_date(value, "next_check_date");
  });
  for (HintType type : all_hint_types()) {
    const std::string key = "hint_" + to_string(type);
    assign_if_present(json_record, key.c_str(), [&](const nlohmann::json& value) {
      record.hint(type) = json_to_string(value, key);
    });
  }
  assign_if_present(json_record, "created_at", [&](const nlohmann::json& value) {
    record.created_at = json_to_timestamp(value, "created_at");
  });
  assign_if_present(json_record, "updated_at", [&](const nlohmann::json& value) {
    record.updated_at = json_to_timestamp(value, "updated_at");
  });
  return record;
}

nlohmann::json to_json(const UserLanguageSettings& settings) {
  nlohmann::json j = nlohmann::json::object();
  j["user_id"] = settings.user_id;
  j["language_id"] = settings.language_id;
  j["start_word"] = settings.start_word;
  j["skip_marked"] = settings.skip_marked;
  j["use_check_date"] = settings.use_check_date;
  j["show_hint_meaning"] = settings.show_hint_meaning;
  j["show_hint_phoneticsound"] = settings.show_hint_phoneticsound;
  j["show_hint_phoneticassociation"] = settings.show_hint_phoneticassociation;
  j["show_hint_writing"] = settings.show_hint_writing;
  j["show_debug"] = settings.show_debug;
  return j;
}

UserLanguageSettings settings_from_json(const nlohmann::json& json_settings) {
  require_object(json_settings, "settings");
  UserLanguageSettings settings;
  assign_if_present(json_settings, "user_id", [&](const nlohmann::json& value) {
    settings.user_id = json_to_string(value, "user_id");
  });
  assign_if_present(json_settings, "language_id", [&](const nlohmann::json& value) {
    settings.language_id = json_to_string(value, "language_id");
  });
  assign_if_present(json_settings, "start_word", [&](const nlohmann::json& value) {
    settings.start_word = json_to_int(value, "start_word");
  });
  assign_if_present(json_settings, "skip_marked", [&](const nlohmann::json& value) {
    settings.skip_marked = json_to_bool(value, "skip_marked");
  });
  assign_if_present(json_settings, "use_check_date", [&](const nlohmann::json& value) {
    settings.use_check_date = json_to_bool(value, "use_check_date");
  });
  assign_if_present(json_settings, "show_hint_meaning", [&](const nlohmann::json& value) {
    settings.show_hint_meaning = json_to_bool(value, "show_hint_meaning");
  });
  assign_if_present(json_settings, "show_hint_phoneticsound", [&](const nlohmann::json& value) {
    settings.show_hint_phoneticsound = json_to_bool(value, "show_hint_phoneticsound");
  });
  assign_if_present(json_settings, "show_hint_phoneticassociation",
                    [&](const nlohmann::json& value) {
                      settings.show_hint_phoneticassociation =
                          json_to_bool(value, "show_hint_phoneticassociation");
                    });
  assign_if_present(json_settings, "show_hint_writing", [&](const nlohmann::json& value) {
    settings.show_hint_writing = json_to_bool(value, "show_hint_writing");
  });
  assign_if_present(json_settings, "show_debug", [&](const nlohmann::json& value) {
    settings.show_debug = json_to_bool(value, "show_debug");
  });
  settings.validate();
  return settings;
}

nlohmann::json to_json(const SessionState& state) {
  nlohmann::json j = nlohmann::json::object();
  j["session_id"] = state.session_id;
  j["user_id"] = state.user_id;
  j["language_id"] = state.language_id;
  j["settings"] = to_json(state.settings);
  j["phase"] = to_string(state.phase);
  j["current_word"] =
      state.current_word.has_value() ? to_json(*state.current_word) : nlohmann::json(nullptr);
  j["word_shown"] = state.word_shown;
  nlohmann::json used = nlohmann::json::array();
  for (HintType type : state.used_hints) {
    used.push_back(to_string(type));
  }
  j["used_hints"] = used;
  j["cursor"] = state.cursor.has_value() ? nlohmann::json(*state.cursor) : nlohmann::json(nullptr);
  j["hint_target"] = state.hint_target.has_value() ? nlohmann::json(to_string(*state.hint_target))
                                                   : nlohmann::json(nullptr);
  j["hint_return_phase"] = state.hint_return_phase.has_value()
                               ? nlohmann::json(to_string(*state.hint_return_phase))
                               : nlohmann::json(nullptr);
  j["words_answered"] = state.words_answered;
  j["words_known"] = state.words_known;
  j["answers_with_hints"] = state.answers_with_hints;
  return j;
}

SessionState session_state_from_json(const nlohmann::json& json_state) {
  require_object(json_state, "session state");
  SessionState state;
  state.session_id = required_string(json_state, "session_id");
  state.user_id = required_string(json_state, "user_id");
  state.language_id = required_string(json_state, "language_id");
  assign_if_present(json_state, "settings", [&](const nlohmann::json& value) {
    state.settings = settings_from_json(value);
  });
  assign_if_present(json_state, "phase", [&](const nlohmann::json& value) {
    state.phase = session_phase_from_string(json_to_string(value, "phase"));
  });
  assign_if_present(json_state, "current_word", [&](const nlohmann::json& value) {
    state.current_word = word_from_json(value);
  });
  assign_if_present(json_state, "word_shown", [&](const nlohmann::json& value) {
    state.word_shown = json_to_bool(value, "word_shown");
  });
  assign_if_present(json_state, "used_hints", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array for field 'used_hints'");
    }
    for (const auto& entry : value) {
      state.used_hints.insert(json_to_hint_type(entry, "used_hints"));
    }
  });
  assign_if_present(json_state, "cursor", [&](const nlohmann::json& value) {
    state.cursor = json_to_int(value, "cursor");
  });
  assign_if_present(json_state, "hint_target", [&](const nlohmann::json& value) {
    state.hint_target = json_to_hint_type(value, "hint_target");
  });
  assign_if_present(json_state, "hint_return_phase", [&](const nlohmann::json& value) {
    state.hint_return_phase =
        session_phase_from_string(json_to_string(value, "hint_return_phase"));
  });
  assign_if_present(json_state, "words_answered", [&](const nlohmann::json& value) {
    state.words_answered = json_to_int(value, "words_answered");
  });
  assign_if_present(json_state, "words_known", [&](const nlohmann::json& value) {
    state.words_known = json_to_int(value, "words_known");
  });
  assign_if_present(json_state, "answers_with_hints", [&](const nlohmann::json& value) {
    state.answers_with_hints = json_to_int(value, "answers_with_hints");
  });
  return state;
}

nlohmann::json to_json(const StudyCard& card) {
  nlohmann::json j = nlohmann::json::object();
  j["type"] = "study_card";
  j["session_id"] = card.session_id;
  j["word"] = to_json(card.word);
  j["progress"] = card.progress.has_value() ? to_json(*card.progress) : nlohmann::json(nullptr);
  j["phase"] = to_string(card.phase);
  j["word_shown"] = card.word_shown;
  j["used_hints"] = hints_to_json(card.used_hints);
  j["available_hints"] = hints_to_json(card.available_hints);
  j["hint_target"] = card.hint_target.has_value() ? nlohmann::json(to_string(*card.hint_target))
                                                  : nlohmann::json(nullptr);
  j["show_debug"] = card.show_debug;
  return j;
}

nlohmann::json to_json(const SessionCompleted& completed) {
  nlohmann::json j = nlohmann::json::object();
  j["type"] = "completed";
  j["session_id"] = completed.session_id;
  j["user_id"] = completed.user_id;
  j["language_id"] = completed.language_id;
  j["words_answered"] = completed.words_answered;
  j["words_known"] = completed.words_known;
  j["answers_with_hints"] = completed.answers_with_hints;
  return j;
}

SessionCompleted session_completed_from_json(const nlohmann::json& json_completed) {
  require_object(json_completed, "session summary");
  SessionCompleted completed;
  completed.session_id = required_string(json_completed, "session_id");
  assign_if_present(json_completed, "user_id", [&](const nlohmann::json& value) {
    completed.user_id = json_to_string(value, "user_id");
  });
  assign_if_present(json_completed, "language_id", [&](const nlohmann::json& value) {
    completed.language_id = json_to_string(value, "language_id");
  });
  assign_if_present(json_completed, "words_answered", [&](const nlohmann::json& value) {
    completed.words_answered = json_to_int(value, "words_answered");
  });
  assign_if_present(json_completed, "words_known", [&](const nlohmann::json& value) {
    completed.words_known = json_to_int(value, "words_known");
  });
  assign_if_present(json_completed, "answers_with_hints", [&](const nlohmann::json& value) {
    completed.answers_with_hints = json_to_int(value, "answers_with_hints");
  });
  return completed;
}

nlohmann::json to_json(const SessionEngine::Current& current) {
  return std::visit([](const auto& value) { return to_json(value); }, current);
}

nlohmann::json to_json(const ProgressSummary& summary) {
  nlohmann::json j = nlohmann::json::object();
  j["user_id"] = summary.user_id;
  j["language_id"] = summary.language_id;
  j["total"] = summary.total;
  j["studied"] = summary.studied;
  j["known"] = summary.known;
  j["skipped"] = summary.skipped;
  j["percentage"] = summary.percentage;
  j["last_study_date"] = summary.last_study_date.has_value()
                             ? nlohmann::json(to_unix_seconds(*summary.last_study_date))
                             : nlohmann::json(nullptr);
  return j;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json j = nlohmann::json::object();
  j["max_interval_days"] = config.max_interval_days;
  j["page_size"] = static_cast<std::int64_t>(config.page_size);
  j["database_path"] = config.database_path;
  j["log_level"] = config.log_level;
  return j;
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config) {
  require_object(json_config, "engine config");
  EngineConfig config;
  assign_if_present(json_config, "max_interval_days", [&](const nlohmann::json& value) {
    config.max_interval_days = json_to_int(value, "max_interval_days");
  });
  assign_if_present(json_config, "page_size", [&](const nlohmann::json& value) {
    const auto size = json_to_int64(value, "page_size");
    if (size <= 0) {
      throw std::invalid_argument("page_size must be positive");
    }
    config.page_size = static_cast<std::size_t>(size);
  });
  assign_if_present(json_config, "database_path", [&](const nlohmann::json& value) {
    config.database_path = json_to_string(value, "database_path");
  });
  assign_if_present(json_config, "log_level", [&](const nlohmann::json& value) {
    config.log_level = json_to_string(value, "log_level");
  });
  config.validate();
  return config;
}

} // namespace vocab::bridge
