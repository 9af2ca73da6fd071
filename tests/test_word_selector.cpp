#include "../include/vocab/memory_backend.hpp"
#include "../selection/word_selector.hpp"

#include "test_support.hpp"

#include <string>
#include <vector>

namespace {

using vocab_test::TestSuite;

const vocab::Date kToday = vocab::Date::from_ymd(2024, 6, 1);

std::vector<int> drain(vocab::selection::CandidateStream& stream) {
  std::vector<int> numbers;
  while (auto candidate = stream.next()) {
    numbers.push_back(candidate->word.word_number);
  }
  return numbers;
}

std::string join(const std::vector<int>& numbers) {
  std::string out;
  for (int n : numbers) {
    if (!out.empty()) {
      out += ",";
    }
    out += std::to_string(n);
  }
  return out;
}

void set_record(vocab::MemoryProgressStore& store, int number, std::optional<vocab::Date> next,
                bool skipped) {
  vocab::ProgressPatch patch;
  if (next.has_value()) {
    patch.score = 1;
    patch.check_interval = 1;
    patch.next_check_date = next;
  }
  patch.is_skipped = skipped;
  store.upsert("u1", "en-w" + std::to_string(number), "en", patch, vocab::start_of(kToday));
}

vocab::UserLanguageSettings settings_for(int start_word) {
  vocab::UserLanguageSettings settings;
  settings.user_id = "u1";
  settings.language_id = "en";
  settings.start_word = start_word;
  return settings;
}

void test_start_word_and_skip_scenario(TestSuite& suite) {
  vocab::MemoryWordCatalog catalog;
  vocab::MemoryProgressStore store;
  vocab_test::seed_words(catalog, "en", 1, 10);
  set_record(store, 7, std::nullopt, true);
  set_record(store, 3, kToday + 5, false);

  auto settings = settings_for(5);
  settings.skip_marked = true;

  vocab::selection::WordSelector selector(catalog, store, 3);
  auto stream = selector.next_candidates("u1", "en", settings, kToday);
  const auto numbers = drain(stream);
  suite.require(join(numbers) == "5,6,8,9,10",
                "start_word=5 with word 7 skipped should yield 5,6,8,9,10, got " + join(numbers));
  suite.require(stream.examined() == 6, "stream examines only words from start_word on");

  stream.restart();
  suite.require(join(drain(stream)) == "5,6,8,9,10", "restart replays the same sequence");

  stream.resume_after(6);
  suite.require(join(drain(stream)) == "8,9,10", "resume after the cursor skips earlier words");

  stream.resume_after(2);
  suite.require(join(drain(stream)) == "5,6,8,9,10", "resume never goes below start_word");

  settings.skip_marked = false;
  auto unskipped = selector.next_candidates("u1", "en", settings, kToday);
  suite.require(join(drain(unskipped)) == "5,6,7,8,9,10",
                "skipped words are offered when skip_marked is off");
}

void test_determinism(TestSuite& suite) {
  vocab::MemoryWordCatalog catalog;
  vocab::MemoryProgressStore store;
  vocab_test::seed_words(catalog, "en", 1, 25);
  for (int n = 2; n <= 25; n += 3) {
    set_record(store, n, kToday + (n % 2), n % 5 == 0);
  }
  auto settings = settings_for(1);
  settings.skip_marked = true;

  vocab::selection::WordSelector small_pages(catalog, store, 4);
  vocab::selection::WordSelector large_pages(catalog, store, 100);
  auto first = small_pages.next_candidates("u1", "en", settings, kToday);
  auto second = small_pages.next_candidates("u1", "en", settings, kToday);
  auto third = large_pages.next_candidates("u1", "en", settings, kToday);
  const auto a = drain(first);
  const auto b = drain(second);
  const auto c = drain(third);
  suite.require(a == b, "same snapshot and settings yield the same sequence");
  suite.require(a == c, "page size does not change the sequence");
  bool ascending = true;
  for (std::size_t i = 1; i < a.size(); ++i) {
    ascending = ascending && a[i - 1] < a[i];
  }
  suite.require(ascending, "candidates come in ascending word_number order");
}

void test_due_boundary(TestSuite& suite) {
  vocab::MemoryWordCatalog catalog;
  vocab::MemoryProgressStore store;
  vocab_test::seed_words(catalog, "en", 1, 4);
  set_record(store, 1, kToday, false);
  set_record(store, 2, kToday + 1, false);
  set_record(store, 3, kToday - 3, false);
  set_record(store, 4, std::nullopt, false);

  vocab::selection::WordSelector selector(catalog, store);
  auto settings = settings_for(1);
  auto stream = selector.next_candidates("u1", "en", settings, kToday);
  suite.require(join(drain(stream)) == "1,3,4",
                "due today and overdue words are eligible, tomorrow's is not");

  auto next_day = selector.next_candidates("u1", "en", settings, kToday + 1);
  suite.require(join(drain(next_day)) == "1,2,3,4", "word becomes eligible on its check date");

  settings.use_check_date = false;
  auto ignoring_dates = selector.next_candidates("u1", "en", settings, kToday);
  suite.require(join(drain(ignoring_dates)) == "1,2,3,4",
                "use_check_date=false ignores next_check_date");
}

void test_eligibility_rule(TestSuite& suite) {
  auto settings = settings_for(1);
  suite.require(vocab::selection::is_eligible(std::nullopt, settings, kToday),
                "words without a record are new and eligible");

  vocab::ProgressRecord record;
  record.is_skipped = true;
  settings.skip_marked = true;
  suite.require(!vocab::selection::is_eligible(record, settings, kToday),
                "skipped record excluded when skip_marked");
  settings.use_check_date = false;
  suite.require(!vocab::selection::is_eligible(record, settings, kToday),
                "skip check applies before the check-date switch");
}

void test_errors(TestSuite& suite) {
  vocab::MemoryWordCatalog catalog;
  vocab::MemoryProgressStore store;
  vocab_test::seed_words(catalog, "en", 1, 3);
  vocab::selection::WordSelector selector(catalog, store);

  suite.require_throws<vocab::SettingsInvalid>(
      [&] { selector.next_candidates("u1", "en", settings_for(0), kToday); },
      "start_word 0 rejected");
  suite.require_throws<vocab::NotFound>(
      [&] { selector.next_candidates("u1", "xx", settings_for(1), kToday); },
      "unknown language rejected");
  suite.require_throws<std::invalid_argument>(
      [&] { vocab::selection::WordSelector(catalog, store, 0); }, "zero page size rejected");

  auto past_end = selector.next_candidates("u1", "en", settings_for(50), kToday);
  suite.require(!past_end.next().has_value(), "start_word past the catalog yields nothing");
}

} // namespace

int main() {
  TestSuite suite;
  test_start_word_and_skip_scenario(suite);
  test_determinism(suite);
  test_due_boundary(suite);
  test_eligibility_rule(suite);
  test_errors(suite);
  if (!suite.ok) {
    return 1;
  }
  std::cout << "word selector tests passed" << std::endl;
  return 0;
}
