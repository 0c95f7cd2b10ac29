#include "lectern/types.hpp"

namespace lectern {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_index: return "invalid_index";
    case ErrorCode::invalid_config: return "invalid_config";
    case ErrorCode::not_loaded: return "not_loaded";
    case ErrorCode::parse_error: return "parse_error";
  }
  return "";
}

std::string to_string(ChapterKind kind) {
  switch (kind) {
    case ChapterKind::content: return "content";
    case ChapterKind::front_matter: return "front_matter";
    case ChapterKind::cover: return "cover";
    case ChapterKind::nav: return "nav";
    case ChapterKind::non_linear: return "non_linear";
  }
  return "content";
}

EngineError::EngineError(ErrorCode code, const std::string& message)
    : std::runtime_error(to_string(code) + ": " + message), code_(code) {}

}  // namespace lectern
