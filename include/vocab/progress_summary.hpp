#pragma once

#include "progress_store.hpp"
#include "word_catalog.hpp"

#include <string>

namespace vocab {

// Totals for one user and language. Throws NotFound for an unknown language.
ProgressSummary summarize_progress(const WordCatalog& catalog, const ProgressStore& store,
                                   const std::string& user_id, const std::string& language_id);

} // namespace vocab
