#include "lectern/version.hpp"

#include <sstream>

#ifndef LECTERN_VERSION
#define LECTERN_VERSION "0.3.0"
#endif

namespace lectern {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? LECTERN_VERSION : semver;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"position_record\":" << m.position_record
    << ",\"window_markup\":" << m.window_markup
    << ",\"event_log\":" << m.event_log
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace lectern
