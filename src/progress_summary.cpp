#include "vocab/progress_summary.hpp"

#include <cmath>

namespace vocab {

ProgressSummary summarize_progress(const WordCatalog& catalog, const ProgressStore& store,
                                   const std::string& user_id, const std::string& language_id) {
  if (!catalog.has_language(language_id)) {
    throw NotFound("Unknown language id: " + language_id);
  }

  ProgressSummary summary;
  summary.user_id = user_id;
  summary.language_id = language_id;
  summary.total = static_cast<int>(catalog.count(language_id));

  const auto records = store.records_for(user_id, language_id);
  summary.studied = static_cast<int>(records.size());
  for (const auto& record : records) {
    if (record.score == 1) {
      ++summary.known;
    }
    if (record.is_skipped) {
      ++summary.skipped;
    }
    if (!summary.last_study_date.has_value() || record.updated_at > *summary.last_study_date) {
      summary.last_study_date = record.updated_at;
    }
  }

  if (summary.total > 0) {
    const double raw = static_cast<double>(summary.known) / summary.total * 100.0;
    summary.percentage = std::round(raw * 100.0) / 100.0;
  }
  return summary;
}

} // namespace vocab
