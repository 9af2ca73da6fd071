#pragma once

#include "../include/vocab/types.hpp"
#include "../include/vocab/word_catalog.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace vocab_test {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }

  template <typename Exception, typename Fn>
  void require_throws(Fn&& fn, const std::string& message) {
    try {
      fn();
    } catch (const Exception&) {
      return;
    } catch (const std::exception& ex) {
      std::cerr << "[FAIL] " << message << " (unexpected exception: " << ex.what() << ")"
                << std::endl;
      ok = false;
      return;
    }
    std::cerr << "[FAIL] " << message << " (no exception)" << std::endl;
    ok = false;
  }
};

inline vocab::Word make_word(const std::string& language_id, int number) {
  vocab::Word word;
  word.id = language_id + "-w" + std::to_string(number);
  word.language_id = language_id;
  word.word_foreign = "foreign-" + std::to_string(number);
  word.translation = "translation-" + std::to_string(number);
  word.transcription = "[" + std::to_string(number) + "]";
  word.word_number = number;
  return word;
}

// Adds words first..last to any catalog exposing add_word.
template <typename Catalog>
void seed_words(Catalog& catalog, const std::string& language_id, int first, int last) {
  catalog.add_language(language_id);
  for (int number = first; number <= last; ++number) {
    catalog.add_word(make_word(language_id, number));
  }
}

} // namespace vocab_test
