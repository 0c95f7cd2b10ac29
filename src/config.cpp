#include "lectern/config.hpp"

#include <cstdlib>
#include <variant>

#include "lectern/jsonlite.hpp"

namespace lectern {

namespace {

void note(std::optional<ErrorInfo>* error, ErrorCode code, const std::string& message) {
  if (error && !*error) *error = ErrorInfo{code, message};
}

void read_int(const jsonlite::Object& obj, const std::string& key, int min_value, int& field,
              std::optional<ErrorInfo>* error) {
  auto it = obj.find(key);
  if (it == obj.end()) return;
  if (!std::holds_alternative<std::uint64_t>(it->second.v)) {
    note(error, ErrorCode::invalid_config, key + " must be a non-negative integer");
    return;
  }
  const std::uint64_t v = std::get<std::uint64_t>(it->second.v);
  if (v < static_cast<std::uint64_t>(min_value) || v > 1000000u) {
    note(error, ErrorCode::invalid_config, key + " out of range: " + std::to_string(v));
    return;
  }
  field = static_cast<int>(v);
}

void read_positive_double(const jsonlite::Object& obj, const std::string& key, double& field,
                          std::optional<ErrorInfo>* error) {
  if (!jsonlite::has_key(obj, key)) return;
  const double v = jsonlite::get_double(obj, key, -1.0);
  if (!(v > 0.0)) {
    note(error, ErrorCode::invalid_config, key + " must be a positive number");
    return;
  }
  field = v;
}

void read_unit_double(const jsonlite::Object& obj, const std::string& key, double& field,
                      std::optional<ErrorInfo>* error) {
  if (!jsonlite::has_key(obj, key)) return;
  const double v = jsonlite::get_double(obj, key, -1.0);
  if (!(v >= 0.0 && v <= 1.0)) {
    note(error, ErrorCode::invalid_config, key + " must be between 0 and 1");
    return;
  }
  field = v;
}

void read_bool(const jsonlite::Object& obj, const std::string& key, bool& field,
               std::optional<ErrorInfo>* error) {
  auto it = obj.find(key);
  if (it == obj.end()) return;
  if (!std::holds_alternative<bool>(it->second.v)) {
    note(error, ErrorCode::invalid_config, key + " must be true or false");
    return;
  }
  field = jsonlite::get_bool(obj, key, field);
}

std::optional<int> env_int(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw || !raw[0]) return std::nullopt;
  char* end = nullptr;
  const long v = std::strtol(raw, &end, 10);
  if (!end || *end != '\0' || v < 0 || v > 1000000) return std::nullopt;
  return static_cast<int>(v);
}

void env_override(const char* name, int min_value, int& field, std::optional<ErrorInfo>* error) {
  const char* raw = std::getenv(name);
  if (!raw || !raw[0]) return;
  auto v = env_int(name);
  if (!v || *v < min_value) {
    note(error, ErrorCode::invalid_config, std::string(name) + " ignored: '" + raw + "'");
    return;
  }
  field = *v;
}

}  // namespace

std::string ReaderConfig::to_json() const {
  std::string out = "{";
  out += "\"backward_cooldown_ms\":" + std::to_string(backward_cooldown_ms);
  out += ",\"backward_preload_threshold\":" + jsonlite::format_double(backward_preload_threshold);
  out += ",\"chapters_per_window\":" + std::to_string(chapters_per_window);
  out += ",\"edge_threshold_pages\":" + std::to_string(edge_threshold_pages);
  out += ",\"font_size_tolerance\":" + jsonlite::format_double(font_size_tolerance);
  out += ",\"forward_preload_threshold\":" + jsonlite::format_double(forward_preload_threshold);
  out += ",\"include_non_linear\":" + std::string(include_non_linear ? "true" : "false");
  out += ",\"preview_context_chars\":" + std::to_string(preview_context_chars);
  out += ",\"preview_max_length\":" + std::to_string(preview_max_length);
  out += ",\"working_set_radius\":" + std::to_string(working_set_radius);
  out += "}";
  return out;
}

ReaderConfig reader_config_from_json(const std::string& text, std::optional<ErrorInfo>* error) {
  ReaderConfig cfg;
  std::optional<jsonlite::JsonError> json_err;
  const auto obj = jsonlite::parse(text, &json_err);
  if (json_err) {
    note(error, ErrorCode::parse_error, json_err->code + ": " + json_err->message);
    return cfg;
  }
  read_int(obj, "chapters_per_window", 1, cfg.chapters_per_window, error);
  read_int(obj, "working_set_radius", 0, cfg.working_set_radius, error);
  read_int(obj, "edge_threshold_pages", 1, cfg.edge_threshold_pages, error);
  read_int(obj, "backward_cooldown_ms", 0, cfg.backward_cooldown_ms, error);
  read_positive_double(obj, "font_size_tolerance", cfg.font_size_tolerance, error);
  read_int(obj, "preview_context_chars", 1, cfg.preview_context_chars, error);
  read_int(obj, "preview_max_length", 4, cfg.preview_max_length, error);
  read_unit_double(obj, "forward_preload_threshold", cfg.forward_preload_threshold, error);
  read_unit_double(obj, "backward_preload_threshold", cfg.backward_preload_threshold, error);
  read_bool(obj, "include_non_linear", cfg.include_non_linear, error);
  return cfg;
}

void apply_env_overrides(ReaderConfig& cfg, std::optional<ErrorInfo>* error) {
  env_override("LECTERN_CHAPTERS_PER_WINDOW", 1, cfg.chapters_per_window, error);
  env_override("LECTERN_WORKING_SET_RADIUS", 0, cfg.working_set_radius, error);
  env_override("LECTERN_BACKWARD_COOLDOWN_MS", 0, cfg.backward_cooldown_ms, error);
}

std::optional<ErrorInfo> validate(const ReaderConfig& cfg) {
  if (cfg.chapters_per_window <= 0) {
    return ErrorInfo{ErrorCode::invalid_config, "chapters_per_window must be positive"};
  }
  if (cfg.working_set_radius < 0) {
    return ErrorInfo{ErrorCode::invalid_config, "working_set_radius must not be negative"};
  }
  if (cfg.edge_threshold_pages < 1) {
    return ErrorInfo{ErrorCode::invalid_config, "edge_threshold_pages must be at least 1"};
  }
  if (cfg.backward_cooldown_ms < 0) {
    return ErrorInfo{ErrorCode::invalid_config, "backward_cooldown_ms must not be negative"};
  }
  if (!(cfg.font_size_tolerance > 0.0)) {
    return ErrorInfo{ErrorCode::invalid_config, "font_size_tolerance must be positive"};
  }
  if (cfg.preview_context_chars < 1 || cfg.preview_max_length < 4) {
    return ErrorInfo{ErrorCode::invalid_config, "preview limits too small"};
  }
  if (!(cfg.forward_preload_threshold >= 0.0 && cfg.forward_preload_threshold <= 1.0) ||
      !(cfg.backward_preload_threshold >= 0.0 && cfg.backward_preload_threshold <= 1.0)) {
    return ErrorInfo{ErrorCode::invalid_config, "preload thresholds must be between 0 and 1"};
  }
  return std::nullopt;
}

}  // namespace lectern
