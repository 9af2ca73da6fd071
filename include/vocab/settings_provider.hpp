#pragma once

#include "types.hpp"

#include <string>

namespace vocab {

// Read-only per (user, language) study settings. Implementations return the
// defaults of UserLanguageSettings when nothing is stored.
class SettingsProvider {
public:
  virtual ~SettingsProvider() = default;

  virtual UserLanguageSettings get(const std::string& user_id,
                                   const std::string& language_id) const = 0;
};

} // namespace vocab
