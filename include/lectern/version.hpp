#pragma once

// lectern/version.hpp - Version manifest for every persisted or exchanged format.
//
// INVARIANT:
//   Any change to the position-record JSON fields, the window HTML structure
//   (window-root / chapter-section markup) or the event-log line schema bumps
//   the matching constant here.

#include <cstdint>
#include <string>

namespace lectern {
namespace version {

// Fields of PositionRecord::to_json().
constexpr uint32_t POSITION_RECORD_VERSION = 1;

// Markup emitted by ProviderWindowAssembler.
constexpr uint32_t WINDOW_MARKUP_VERSION = 1;

// One JSON object per line in LECTERN_EVENT_LOG.
constexpr uint32_t EVENT_LOG_VERSION = 1;

// Version 1 = BLAKE3-256, hex-encoded, with "doc:" / "win:" domain prefixes.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t position_record{POSITION_RECORD_VERSION};
  uint32_t window_markup{WINDOW_MARKUP_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace lectern
