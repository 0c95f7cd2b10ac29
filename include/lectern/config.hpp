#pragma once

// lectern/config.hpp - Reader engine tuning, loaded from JSON and environment.
//
// Precedence: defaults < JSON file < LECTERN_* environment variables.
// The conveyor's buffer size (5) and center slot (2) are structural constants
// of WindowBufferManager, not configuration.

#include <optional>
#include <string>

#include "lectern/types.hpp"

namespace lectern {

struct ReaderConfig {
  int chapters_per_window{5};
  int working_set_radius{2};
  int edge_threshold_pages{2};
  int backward_cooldown_ms{300};
  double font_size_tolerance{0.1};
  int preview_context_chars{50};
  int preview_max_length{100};
  double forward_preload_threshold{0.75};
  double backward_preload_threshold{0.25};
  bool include_non_linear{false};

  std::string to_json() const;
};

// Unknown keys are ignored. Malformed JSON -> parse_error and all defaults.
// A present-but-invalid value -> invalid_config; that key keeps its default and
// the remaining keys still apply. *error receives the first problem found.
ReaderConfig reader_config_from_json(const std::string& text, std::optional<ErrorInfo>* error);

// Applies LECTERN_CHAPTERS_PER_WINDOW, LECTERN_WORKING_SET_RADIUS and
// LECTERN_BACKWARD_COOLDOWN_MS. Unparseable or out-of-range values are ignored
// and reported through *error.
void apply_env_overrides(ReaderConfig& cfg, std::optional<ErrorInfo>* error);

// First violated constraint, or nullopt when the config is usable.
std::optional<ErrorInfo> validate(const ReaderConfig& cfg);

}  // namespace lectern
