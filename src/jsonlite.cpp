#include "lectern/jsonlite.hpp"

// DETERMINISM:
//   format_double() always prints "%.6f" and trims trailing zeros, so position
//   records and config dumps are byte-identical across IEEE 754 platforms.
//   std::stod() is locale-sensitive and only ever sees parser input.

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace lectern::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value read_document() {
    Value root = read_value(0);
    skip_ws();
    if (!err_ && pos_ != text_.size()) fail("trailing data");
    return root;
  }

  const std::optional<JsonError>& error() const { return err_; }

 private:
  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }
  bool is_digit_at(size_t p) const {
    return p < text_.size() && std::isdigit(static_cast<unsigned char>(text_[p]));
  }

  void skip_ws() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  bool consume_word(const char* word, size_t len) {
    if (text_.compare(pos_, len, word) != 0) return false;
    pos_ += len;
    return true;
  }

  void fail(const std::string& message, const char* code = "json_parse_error") {
    if (!err_) err_ = JsonError{code, message + " at offset " + std::to_string(pos_)};
  }

  Value read_value(int depth) {
    if (depth > kMaxDepth) {
      fail("nesting too deep");
      return {};
    }
    skip_ws();
    switch (peek()) {
      case '\0': fail("unexpected end of input"); return {};
      case '{': return Value{read_object(depth)};
      case '[': return Value{read_array(depth)};
      case '"': return Value{read_string()};
      default: break;
    }
    if (consume_word("true", 4)) return Value{true};
    if (consume_word("false", 5)) return Value{false};
    if (consume_word("null", 4)) return Value{nullptr};
    return read_number();
  }

  Object read_object(int depth) {
    Object out;
    ++pos_;  // '{'
    if (consume('}')) return out;
    while (!err_) {
      skip_ws();
      std::string key = read_string();
      if (err_) break;
      if (out.contains(key)) {
        fail("duplicate key: " + key, "json_duplicate_key");
        break;
      }
      if (!consume(':')) {
        fail("expected ':'");
        break;
      }
      Value v = read_value(depth + 1);
      if (err_) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) break;
      if (!consume(',')) fail("expected ',' or '}'");
    }
    return out;
  }

  Array read_array(int depth) {
    Array out;
    ++pos_;  // '['
    if (consume(']')) return out;
    while (!err_) {
      out.push_back(read_value(depth + 1));
      if (err_) break;
      if (consume(']')) break;
      if (!consume(',')) fail("expected ',' or ']'");
    }
    return out;
  }

  bool read_hex4(unsigned& cp) {
    if (pos_ + 4 > text_.size()) {
      fail("truncated \\u escape");
      return false;
    }
    cp = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = text_[pos_++];
      unsigned digit = 0;
      if (h >= '0' && h <= '9') digit = static_cast<unsigned>(h - '0');
      else if (h >= 'a' && h <= 'f') digit = static_cast<unsigned>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') digit = static_cast<unsigned>(h - 'A' + 10);
      else {
        fail("invalid \\u escape");
        return false;
      }
      cp = (cp << 4) | digit;
    }
    return true;
  }

  // \uXXXX, or a \uD8xx\uDCxx surrogate pair, appended as UTF-8.
  void read_code_point(std::string& out) {
    unsigned cp = 0;
    if (!read_hex4(cp)) return;
    if (cp >= 0xDC00 && cp <= 0xDFFF) {
      fail("unpaired low surrogate");
      return;
    }
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      if (text_.compare(pos_, 2, "\\u") != 0) {
        fail("unpaired high surrogate");
        return;
      }
      pos_ += 2;
      unsigned low = 0;
      if (!read_hex4(low)) return;
      if (low < 0xDC00 || low > 0xDFFF) {
        fail("unpaired high surrogate");
        return;
      }
      cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    }

    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string read_string() {
    std::string out;
    if (peek() != '"') {
      fail("expected string");
      return out;
    }
    ++pos_;
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) break;
      const char e = text_[pos_++];
      switch (e) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'u': read_code_point(out); break;
        default: out += e; break;  // \" \\ \/
      }
      if (err_) return {};
    }
    fail("unterminated string");
    return {};
  }

  Value read_number() {
    const size_t start = pos_;
    if (consume_word("NaN", 3) || consume_word("Infinity", 8) || consume_word("-Infinity", 9)) {
      pos_ = start;
      fail("NaN/Infinity unsupported");
      return {};
    }
    if (peek() == '-') ++pos_;
    if (!is_digit_at(pos_)) {
      pos_ = start;
      fail("unexpected token");
      return {};
    }
    while (is_digit_at(pos_)) ++pos_;

    bool integral = true;
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!is_digit_at(pos_)) {
        fail("digit expected after '.'");
        return {};
      }
      while (is_digit_at(pos_)) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!is_digit_at(pos_)) {
        fail("digit expected in exponent");
        return {};
      }
      while (is_digit_at(pos_)) ++pos_;
    }

    const std::string literal = text_.substr(start, pos_ - start);
    try {
      if (integral && literal[0] != '-') {
        return Value{static_cast<std::uint64_t>(std::stoull(literal))};
      }
      return Value{std::stod(literal)};
    } catch (const std::exception&) {
      fail("number out of range: " + literal);
      return {};
    }
  }

  const std::string& text_;
  size_t pos_{0};
  std::optional<JsonError> err_;
};

template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<T>(&it->second.v);
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value root = reader.read_document();
  std::optional<JsonError> err = reader.error();
  if (!err && !std::holds_alternative<Object>(root.v)) {
    err = JsonError{"json_parse_error", "top-level value is not an object"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(root.v));
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = find_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = find_as<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* n = find_as<std::uint64_t>(obj, key);
  return n ? *n : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const auto* d = find_as<double>(obj, key)) return *d;
  if (const auto* n = find_as<std::uint64_t>(obj, key)) return static_cast<double>(*n);
  return def;
}

bool has_key(const Object& obj, const std::string& key) { return obj.contains(key); }

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string out(buf, static_cast<size_t>(n));
  const size_t last = out.find_last_not_of('0');
  out.erase(last + 1);
  if (out.back() == '.') out += '0';
  return out;
}

}  // namespace lectern::jsonlite
