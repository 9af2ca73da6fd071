#pragma once

#include "date.hpp"
#include "errors.hpp"

#include <array>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace vocab {

enum class HintType {
  Meaning,
  PhoneticSound,
  PhoneticAssociation,
  Writing
};

inline std::string to_string(HintType type) {
  switch (type) {
    case HintType::Meaning: return "meaning";
    case HintType::PhoneticSound: return "phoneticsound";
    case HintType::PhoneticAssociation: return "phoneticassociation";
    case HintType::Writing: return "writing";
  }
  return "meaning";
}

inline HintType hint_type_from_string(const std::string& value) {
  if (value == "meaning") {
    return HintType::Meaning;
  }
  if (value == "phoneticsound") {
    return HintType::PhoneticSound;
  }
  if (value == "phoneticassociation") {
    return HintType::PhoneticAssociation;
  }
  if (value == "writing") {
    return HintType::Writing;
  }
  throw std::invalid_argument("Unknown hint type: " + value);
}

// Display order used by the bot keyboards.
inline const std::array<HintType, 4>& all_hint_types() {
  static const std::array<HintType, 4> types = {
      HintType::Meaning,
      HintType::PhoneticAssociation,
      HintType::PhoneticSound,
      HintType::Writing,
  };
  return types;
}

struct Word {
  std::string id;
  std::string language_id;
  std::string word_foreign;
  std::string translation;
  std::string transcription;
  int word_number = 0;
  std::optional<std::string> sound_file_path;
};

struct ProgressRecord {
  std::string user_id;
  std::string word_id;
  std::string language_id;
  int score = 0;
  bool is_skipped = false;
  int check_interval = 0;
  std::optional<Date> next_check_date;
  std::optional<std::string> hint_meaning;
  std::optional<std::string> hint_phoneticsound;
  std::optional<std::string> hint_phoneticassociation;
  std::optional<std::string> hint_writing;
  Timestamp created_at{};
  Timestamp updated_at{};

  const std::optional<std::string>& hint(HintType type) const {
    switch (type) {
      case HintType::Meaning: return hint_meaning;
      case HintType::PhoneticSound: return hint_phoneticsound;
      case HintType::PhoneticAssociation: return hint_phoneticassociation;
      case HintType::Writing: return hint_writing;
    }
    return hint_meaning;
  }

  std::optional<std::string>& hint(HintType type) {
    switch (type) {
      case HintType::Meaning: return hint_meaning;
      case HintType::PhoneticSound: return hint_phoneticsound;
      case HintType::PhoneticAssociation: return hint_phoneticassociation;
      case HintType::Writing: return hint_writing;
    }
    return hint_meaning;
  }

  bool has_hint(HintType type) const {
    const auto& text = hint(type);
    return text.has_value() && !text->empty();
  }
};

// Partial update merged into a ProgressRecord by ProgressStore::upsert.
// An empty hint text clears the stored hint.
struct ProgressPatch {
  std::optional<int> score;
  std::optional<bool> is_skipped;
  std::optional<int> check_interval;
  std::optional<Date> next_check_date;
  std::map<HintType, std::string> hints;

  bool empty() const {
    return !score && !is_skipped && !check_interval && !next_check_date && hints.empty();
  }
};

struct UserLanguageSettings {
  std::string user_id;
  std::string language_id;
  int start_word = 1;
  bool skip_marked = false;
  bool use_check_date = true;
  bool show_hint_meaning = true;
  bool show_hint_phoneticsound = true;
  bool show_hint_phoneticassociation = true;
  bool show_hint_writing = true;
  bool show_debug = false;

  bool hint_visible(HintType type) const {
    switch (type) {
      case HintType::Meaning: return show_hint_meaning;
      case HintType::PhoneticSound: return show_hint_phoneticsound;
      case HintType::PhoneticAssociation: return show_hint_phoneticassociation;
      case HintType::Writing: return show_hint_writing;
    }
    return false;
  }

  void validate() const {
    if (start_word < 1) {
      throw SettingsInvalid("start_word must be at least 1, got " + std::to_string(start_word));
    }
  }
};

struct ProgressSummary {
  std::string user_id;
  std::string language_id;
  int total = 0;
  int studied = 0;
  int known = 0;
  int skipped = 0;
  double percentage = 0.0;
  std::optional<Timestamp> last_study_date;
};

} // namespace vocab
