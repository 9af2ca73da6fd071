#include "vocab/session_engine.hpp"

#include "json_bridge.hpp"
#include "log.hpp"
#include "vocab/progress_summary.hpp"
#include "vocab/session_machine.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace vocab {
namespace {

SessionCompleted make_completed(const SessionState& state) {
  SessionCompleted completed;
  completed.session_id = state.session_id;
  completed.user_id = state.user_id;
  completed.language_id = state.language_id;
  completed.words_answered = state.words_answered;
  completed.words_known = state.words_known;
  completed.answers_with_hints = state.answers_with_hints;
  return completed;
}

// Distinguishes handles issued by different engine instances, so a handle
// kept from before a restart never names a session started afterwards.
std::string make_instance_tag() {
  std::random_device device;
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(8) << device();
  return oss.str();
}

} // namespace

class SessionEngineImpl : public SessionEngine {
public:
  SessionEngineImpl(EngineDeps deps, EngineConfig config)
      : deps_(deps),
        config_(std::move(config)),
        machine_(deps.catalog, deps.progress, deps.settings, deps.clock, config_),
        instance_tag_(make_instance_tag()) {}

  std::string begin_session(const std::string& user_id,
                            const std::string& language_id) override {
    auto session_id = generate_session_id(user_id);
    auto state = machine_.start(session_id, user_id, language_id);
    if (auto previous = deps_.sessions.find_for_user(user_id)) {
      logging::logger()->debug("session {} replaced by {}", previous->session_id, session_id);
      deps_.sessions.erase(previous->session_id);
    }
    deps_.sessions.save(state);
    return session_id;
  }

  Current current_word(const std::string& session_id) override {
    return render(get_session(session_id));
  }

  Current reveal(const std::string& session_id) override {
    return mutate(session_id, [this](SessionState& state) { machine_.reveal(state); });
  }

  Current record_answer(const std::string& session_id, int score) override {
    return mutate(session_id,
                  [this, score](SessionState& state) { machine_.answer(state, score); });
  }

  Current record_hint_use(const std::string& session_id, HintType type) override {
    return mutate(session_id,
                  [this, type](SessionState& state) { machine_.use_hint(state, type); });
  }

  Current begin_hint(const std::string& session_id, HintType type) override {
    return mutate(session_id,
                  [this, type](SessionState& state) { machine_.begin_hint(state, type); });
  }

  Current submit_hint(const std::string& session_id, const std::string& text) override {
    return mutate(session_id,
                  [this, &text](SessionState& state) { machine_.submit_hint(state, text); });
  }

  Current cancel_hint(const std::string& session_id) override {
    return mutate(session_id, [this](SessionState& state) { machine_.cancel_hint(state); });
  }

  Current toggle_skip(const std::string& session_id) override {
    return mutate(session_id, [this](SessionState& state) { machine_.toggle_skip(state); });
  }

  SessionCompleted end_session(const std::string& session_id) override {
    auto state = get_session(session_id);
    deps_.sessions.erase(session_id);
    logging::logger()->info("session {} ended: answered={} known={} with_hints={}", session_id,
                            state.words_answered, state.words_known, state.answers_with_hints);
    return make_completed(state);
  }

  std::optional<std::string> session_for_user(const std::string& user_id) const override {
    auto state = deps_.sessions.find_for_user(user_id);
    if (!state.has_value()) {
      return std::nullopt;
    }
    return state->session_id;
  }

  ProgressSummary progress_summary(const std::string& user_id,
                                   const std::string& language_id) const override {
    return summarize_progress(deps_.catalog, deps_.progress, user_id, language_id);
  }

  nlohmann::json debug_state(const std::string& session_id) override {
    auto state = get_session(session_id);
    nlohmann::json info = nlohmann::json::object();
    info["session"] = bridge::to_json(state);
    info["today"] = deps_.clock.today().to_string();
    info["max_interval_days"] = config_.max_interval_days;
    info["page_size"] = static_cast<int>(config_.page_size);
    if (auto record = machine_.current_progress(state)) {
      info["progress"] = bridge::to_json(*record);
    } else {
      info["progress"] = nullptr;
    }
    return info;
  }

private:
  template <typename Fn>
  Current mutate(const std::string& session_id, Fn&& fn) {
    auto state = get_session(session_id);
    const auto before = state.phase;
    fn(state);
    deps_.sessions.save(state);
    if (before != state.phase && logging::debug_session_enabled()) {
      logging::logger()->debug("session {} {} -> {}", session_id, to_string(before),
                               to_string(state.phase));
    }
    return render(state);
  }

  Current render(const SessionState& state) const {
    if (state.phase == SessionPhase::Completed || !state.current_word.has_value()) {
      return make_completed(state);
    }
    StudyCard card;
    card.session_id = state.session_id;
    card.word = *state.current_word;
    card.progress = machine_.current_progress(state);
    card.phase = state.phase;
    card.word_shown = state.word_shown;
    card.used_hints.assign(state.used_hints.begin(), state.used_hints.end());
    card.available_hints = machine_.available_hints(state);
    card.hint_target = state.hint_target;
    card.show_debug = state.settings.show_debug;
    return card;
  }

  SessionState get_session(const std::string& session_id) const {
    auto state = deps_.sessions.load(session_id);
    if (!state.has_value()) {
      throw InvalidSessionState("Unknown session id: " + session_id);
    }
    return std::move(*state);
  }

  std::string generate_session_id(const std::string& user_id) {
    std::ostringstream oss;
    oss << "sess-" << user_id << "-" << instance_tag_ << "-" << (++session_counter_);
    return oss.str();
  }

  EngineDeps deps_;
  EngineConfig config_;
  SessionMachine machine_;
  std::string instance_tag_;
  std::uint64_t session_counter_ = 0;
};

std::unique_ptr<SessionEngine> make_engine(EngineDeps deps, EngineConfig config) {
  config.validate();
  return std::make_unique<SessionEngineImpl>(deps, std::move(config));
}

} // namespace vocab
