#include "chaosmagnet/jsonlite.hpp"

// NUMBERS:
//   Unsigned integers without fraction or exponent stay exact as uint64; every
//   other number (negative integers included) becomes a double. Both directions
//   go through <charconv>, so the process locale never changes a digest.

#include <charconv>
#include <cmath>
#include <cstdio>
#include <string_view>
#include <system_error>

namespace chaosmagnet::jsonlite {

namespace {

// Config documents and frames nest three levels deep at most.
constexpr int kMaxDepth = 32;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

void append_utf8(std::uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Recursive-descent reader over one document. The first error wins; every
// production returns early once err_ is set.
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value document() {
    Value v = value(0);
    skip_ws();
    if (!err_ && pos_ != text_.size()) fail("json_parse_error", "trailing data");
    return v;
  }

  const std::optional<JsonError>& error() const { return err_; }

 private:
  void fail(const char* code, const std::string& what) {
    if (!err_) err_ = JsonError{code, what + " at offset " + std::to_string(pos_)};
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  void skip_ws() {
    while (!at_end()) {
      const char c = text_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++pos_;
    }
  }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(std::string_view word) {
    if (text_.compare(pos_, word.size(), word) != 0) return false;
    pos_ += word.size();
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) {
      fail("json_parse_error", "nesting too deep");
      return {};
    }
    skip_ws();
    switch (peek()) {
      case '{': return Value{object(depth + 1)};
      case '[': return Value{array(depth + 1)};
      case '"': return Value{string()};
      case 't': if (literal("true")) return Value{true}; break;
      case 'f': if (literal("false")) return Value{false}; break;
      case 'n': if (literal("null")) return Value{nullptr}; break;
      default:
        if (peek() == '-' || is_digit(peek())) return number();
        break;
    }
    // NaN and Infinity land here too.
    fail("json_parse_error", at_end() ? "unexpected end of input" : "unexpected token");
    return {};
  }

  void digits() {
    while (is_digit(peek())) ++pos_;
  }

  Value number() {
    const std::size_t start = pos_;
    bool integral = true;
    if (peek() == '-') {
      ++pos_;
      integral = false;
    }
    if (!is_digit(peek())) {
      fail("json_parse_error", "invalid number");
      return {};
    }
    if (peek() == '0' && pos_ + 1 < text_.size() && is_digit(text_[pos_ + 1])) {
      fail("json_parse_error", "leading zero");
      return {};
    }
    digits();
    if (peek() == '.') {
      ++pos_;
      integral = false;
      if (!is_digit(peek())) {
        fail("json_parse_error", "invalid fraction");
        return {};
      }
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      integral = false;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "invalid exponent");
        return {};
      }
      digits();
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    if (integral) {
      std::uint64_t u = 0;
      const auto res = std::from_chars(first, last, u);
      if (res.ec != std::errc() || res.ptr != last) {
        fail("json_parse_error", "integer out of range");
        return {};
      }
      return Value{u};
    }
    double d = 0.0;
    const auto res = std::from_chars(first, last, d);
    if (res.ec != std::errc() || res.ptr != last || !std::isfinite(d)) {
      fail("json_parse_error", "number out of range");
      return {};
    }
    return Value{d};
  }

  bool hex4(std::uint32_t* out) {
    if (text_.size() - pos_ < 4) {
      fail("json_parse_error", "truncated \\u escape");
      return false;
    }
    std::uint32_t v = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = text_[pos_++];
      v <<= 4;
      if (c >= '0' && c <= '9') v |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') v |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') v |= static_cast<std::uint32_t>(c - 'A' + 10);
      else {
        fail("json_parse_error", "invalid \\u escape");
        return false;
      }
    }
    *out = v;
    return true;
  }

  bool unicode_escape(std::string* out) {
    std::uint32_t cp = 0;
    if (!hex4(&cp)) return false;
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      std::uint32_t low = 0;
      if (!literal("\\u") || !hex4(&low) || low < 0xDC00 || low > 0xDFFF) {
        fail("json_parse_error", "unpaired surrogate");
        return false;
      }
      cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
      fail("json_parse_error", "unpaired surrogate");
      return false;
    }
    append_utf8(cp, out);
    return true;
  }

  std::string string() {
    std::string out;
    if (!consume('"')) {
      fail("json_parse_error", "expected string");
      return out;
    }
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "control character in string");
        return out;
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (at_end()) break;
      const char e = text_[pos_++];
      switch (e) {
        case '"':
        case '\\':
        case '/': out.push_back(e); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u':
          if (!unicode_escape(&out)) return out;
          break;
        default:
          fail("json_parse_error", "invalid escape");
          return out;
      }
    }
    fail("json_parse_error", "unterminated string");
    return out;
  }

  Object object(int depth) {
    Object out;
    consume('{');
    if (consume('}')) return out;
    do {
      skip_ws();
      if (peek() != '"') {
        fail("json_parse_error", "expected object key");
        return out;
      }
      std::string key = string();
      if (err_) return out;
      if (out.count(key) != 0) {
        fail("json_duplicate_key", "duplicate key '" + key + "'");
        return out;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':'");
        return out;
      }
      Value v = value(depth);
      if (err_) return out;
      out.emplace(std::move(key), std::move(v));
    } while (consume(','));
    if (!consume('}')) fail("json_parse_error", "expected ',' or '}'");
    return out;
  }

  Array array(int depth) {
    Array out;
    consume('[');
    if (consume(']')) return out;
    do {
      Value v = value(depth);
      if (err_) return out;
      out.push_back(std::move(v));
    } while (consume(','));
    if (!consume(']')) fail("json_parse_error", "expected ',' or ']'");
    return out;
  }

  const std::string& text_;
  std::size_t pos_{0};
  std::optional<JsonError> err_;
};

void append_escaped(std::string_view s, std::string* out) {
  for (const char c : s) {
    switch (c) {
      case '"': out->append("\\\""); break;
      case '\\': out->append("\\\\"); break;
      case '\b': out->append("\\b"); break;
      case '\f': out->append("\\f"); break;
      case '\n': out->append("\\n"); break;
      case '\r': out->append("\\r"); break;
      case '\t': out->append("\\t"); break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out->append(buf);
        } else {
          out->push_back(c);
        }
    }
  }
}

void write_string(std::string_view s, std::string* out) {
  out->push_back('"');
  append_escaped(s, out);
  out->push_back('"');
}

void write_value(const Value& v, std::string* out) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) {
    out->append("null");
  } else if (const bool* b = std::get_if<bool>(&v.v)) {
    out->append(*b ? "true" : "false");
  } else if (const std::uint64_t* u = std::get_if<std::uint64_t>(&v.v)) {
    out->append(std::to_string(*u));
  } else if (const double* d = std::get_if<double>(&v.v)) {
    out->append(format_double(*d));
  } else if (const std::string* s = std::get_if<std::string>(&v.v)) {
    write_string(*s, out);
  } else if (const Object* o = std::get_if<Object>(&v.v)) {
    out->push_back('{');
    bool first = true;
    for (const auto& [key, item] : *o) {
      if (!first) out->push_back(',');
      first = false;
      write_string(key, out);
      out->push_back(':');
      write_value(item, out);
    }
    out->push_back('}');
  } else {
    out->push_back('[');
    bool first = true;
    for (const auto& item : std::get<Array>(v.v)) {
      if (!first) out->push_back(',');
      first = false;
      write_value(item, out);
    }
    out->push_back(']');
  }
}

template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

std::string format_double(double d) {
  if (!std::isfinite(d)) return "0.0";
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed, 6);
  if (res.ec != std::errc()) return "0.0";
  std::string out(buf, res.ptr);
  while (!out.empty() && out.back() == '0') out.pop_back();
  if (!out.empty() && out.back() == '.') out.push_back('0');
  if (out == "-0.0") out = "0.0";
  return out;
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  append_escaped(s, &out);
  return out;
}

std::string to_json(const Value& v) {
  std::string out;
  write_value(v, &out);
  return out;
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Reader reader(text);
  reader.document();
  return reader.error();
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  const Value v = reader.document();
  if (error) *error = reader.error();
  return reader.error() ? std::string() : to_json(v);
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v = reader.document();
  std::optional<JsonError> err = reader.error();
  if (!err && !std::holds_alternative<Object>(v.v)) {
    err = JsonError{"json_parse_error", "top-level value is not an object"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::move(std::get<Object>(v.v));
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const std::string* s = find_as<std::string>(obj, key);
  return s ? *s : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const std::uint64_t* u = find_as<std::uint64_t>(obj, key);
  return u ? *u : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const double* d = find_as<double>(obj, key)) return *d;
  if (const std::uint64_t* u = find_as<std::uint64_t>(obj, key)) return static_cast<double>(*u);
  return def;
}

const Object* get_object(const Object& obj, const std::string& key) { return find_as<Object>(obj, key); }

bool has_key(const Object& obj, const std::string& key) { return obj.count(key) != 0; }

bool is_number(const Object& obj, const std::string& key) {
  return find_as<double>(obj, key) != nullptr || find_as<std::uint64_t>(obj, key) != nullptr;
}

}  // namespace chaosmagnet::jsonlite
