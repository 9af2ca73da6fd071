#include "../include/vocab/session_engine.hpp"
#include "../include/vocab/sqlite_backend.hpp"

#include "json_bridge.hpp"
#include "log.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::invalid_argument("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

// Owns the SQLite backend and the engine for the bot process. Session state
// stays in memory; a restart drops open sessions but no progress.
class PyVocabEngine {
public:
  explicit PyVocabEngine(const vocab::EngineConfig& config)
      : config_(config),
        db_(config_.database_path),
        catalog_(db_),
        progress_(db_),
        settings_(db_),
        engine_(vocab::make_engine(
            vocab::EngineDeps{catalog_, progress_, settings_, sessions_, clock_}, config_)) {
    vocab::logging::set_level(config_.log_level);
  }

  void add_word(py::object word_obj) {
    catalog_.add_word(vocab::bridge::word_from_json(py_to_json(word_obj)));
  }

  void add_language(const std::string& language_id) { catalog_.add_language(language_id); }

  py::object get_settings(const std::string& user_id, const std::string& language_id) const {
    return json_to_py(vocab::bridge::to_json(settings_.get(user_id, language_id)));
  }

  void put_settings(py::object settings_obj) {
    settings_.put(vocab::bridge::settings_from_json(py_to_json(settings_obj)));
  }

  std::string begin_session(const std::string& user_id, const std::string& language_id) {
    return engine_->begin_session(user_id, language_id);
  }

  py::object session_for_user(const std::string& user_id) const {
    auto session_id = engine_->session_for_user(user_id);
    if (!session_id.has_value()) {
      return py::none();
    }
    return py::str(*session_id);
  }

  py::object current_word(const std::string& session_id) {
    return render(engine_->current_word(session_id));
  }

  py::object reveal(const std::string& session_id) { return render(engine_->reveal(session_id)); }

  py::object record_answer(const std::string& session_id, int score) {
    return render(engine_->record_answer(session_id, score));
  }

  py::object record_hint_use(const std::string& session_id, const std::string& hint) {
    return render(engine_->record_hint_use(session_id, vocab::hint_type_from_string(hint)));
  }

  py::object begin_hint(const std::string& session_id, const std::string& hint) {
    return render(engine_->begin_hint(session_id, vocab::hint_type_from_string(hint)));
  }

  py::object submit_hint(const std::string& session_id, const std::string& text) {
    return render(engine_->submit_hint(session_id, text));
  }

  py::object cancel_hint(const std::string& session_id) {
    return render(engine_->cancel_hint(session_id));
  }

  py::object toggle_skip(const std::string& session_id) {
    return render(engine_->toggle_skip(session_id));
  }

  py::object end_session(const std::string& session_id) {
    return json_to_py(vocab::bridge::to_json(engine_->end_session(session_id)));
  }

  py::object progress_summary(const std::string& user_id, const std::string& language_id) const {
    return json_to_py(vocab::bridge::to_json(engine_->progress_summary(user_id, language_id)));
  }

  py::object debug_state(const std::string& session_id) {
    return json_to_py(engine_->debug_state(session_id));
  }

  py::object config() const { return json_to_py(vocab::bridge::to_json(config_)); }

private:
  static py::object render(const vocab::SessionEngine::Current& current) {
    return json_to_py(vocab::bridge::to_json(current));
  }

  vocab::EngineConfig config_;
  vocab::SqliteDatabase db_;
  vocab::SqliteWordCatalog catalog_;
  vocab::SqliteProgressStore progress_;
  vocab::SqliteSettingsProvider settings_;
  vocab::MemorySessionStateStore sessions_;
  vocab::SystemClock clock_;
  std::unique_ptr<vocab::SessionEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_vocabcore, m) {
  auto& base_error = py::register_exception<vocab::Error>(m, "VocabError");
  py::register_exception<vocab::NotFound>(m, "NotFound", base_error.ptr());
  py::register_exception<vocab::InvalidSessionState>(m, "InvalidSessionState", base_error.ptr());
  py::register_exception<vocab::StoreUnavailable>(m, "StoreUnavailable", base_error.ptr());
  py::register_exception<vocab::SettingsInvalid>(m, "SettingsInvalid", base_error.ptr());

  m.def("load_config", [](const std::string& path) {
    return json_to_py(vocab::bridge::to_json(vocab::load_engine_config(path)));
  });

  py::class_<PyVocabEngine>(m, "VocabEngine")
      .def(py::init([](py::object config_obj) {
             vocab::EngineConfig config;
             if (!config_obj.is_none()) {
               config = vocab::bridge::engine_config_from_json(py_to_json(config_obj));
             }
             return std::make_unique<PyVocabEngine>(config);
           }),
           py::arg("config") = py::none())
      .def("add_language", &PyVocabEngine::add_language)
      .def("add_word", &PyVocabEngine::add_word)
      .def("get_settings", &PyVocabEngine::get_settings)
      .def("put_settings", &PyVocabEngine::put_settings)
      .def("begin_session", &PyVocabEngine::begin_session)
      .def("session_for_user", &PyVocabEngine::session_for_user)
      .def("current_word", &PyVocabEngine::current_word)
      .def("reveal", &PyVocabEngine::reveal)
      .def("record_answer", &PyVocabEngine::record_answer)
      .def("record_hint_use", &PyVocabEngine::record_hint_use)
      .def("begin_hint", &PyVocabEngine::begin_hint)
      .def("submit_hint", &PyVocabEngine::submit_hint)
      .def("cancel_hint", &PyVocabEngine::cancel_hint)
      .def("toggle_skip", &PyVocabEngine::toggle_skip)
      .def("end_session", &PyVocabEngine::end_session)
      .def("progress_summary", &PyVocabEngine::progress_summary)
      .def("debug_state", &PyVocabEngine::debug_state)
      .def("config", &PyVocabEngine::config);
}
