#include "cra/jsonlite.hpp"

// jsonlite internals.
//
// DETERMINISM GUARANTEES:
//   - write() walks Object in std::map order, so keys come out sorted. This is
//     the byte form the TRACE chain hashes.
//   - Numbers are read with std::from_chars and written with std::to_chars or
//     format_double(). Neither consults the locale.
//   - Integer literals keep integer type: a leading '-' gives int64, anything
//     else uint64. Only a fraction or exponent produces a double.
//
// LIMITS:
//   Nesting deeper than kMaxDepth is a parse error. Atlas manifests and event
//   payloads stay far below it; the limit keeps hostile input off the stack.

#include <charconv>
#include <cstdio>
#include <cstdint>
#include <system_error>
#include <type_traits>

namespace cra::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

void put_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  // Parses one document and rejects anything after it.
  Value document() {
    Value v = value(0);
    skip_ws();
    if (!err_ && pos_ != text_.size()) fail("trailing data at offset " + std::to_string(pos_));
    return err_ ? Value{} : v;
  }

  const std::optional<JsonError>& error() const { return err_; }

 private:
  void fail(std::string message, const char* code = "json_parse_error") {
    if (!err_) err_ = JsonError{code, std::move(message)};
  }

  void skip_ws() {
    while (pos_ < text_.size() && is_space(text_[pos_])) ++pos_;
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return text_[pos_]; }

  bool consume(char c) {
    skip_ws();
    if (!at_end() && peek() == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool literal(const char* word, std::size_t len) {
    if (text_.compare(pos_, len, word) != 0) return false;
    pos_ += len;
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) {
      fail("nesting deeper than " + std::to_string(kMaxDepth));
      return {};
    }
    skip_ws();
    if (at_end()) {
      fail("unexpected end of input");
      return {};
    }
    switch (peek()) {
      case '{': return object(depth);
      case '[': return array(depth);
      case '"': return string();
      case 't': if (literal("true", 4)) return true; break;
      case 'f': if (literal("false", 5)) return false; break;
      case 'n': if (literal("null", 4)) return nullptr; break;
      default:
        if (peek() == '-' || is_digit(peek())) return number();
        break;
    }
    fail("unexpected token at offset " + std::to_string(pos_));
    return {};
  }

  Value object(int depth) {
    Object out;
    ++pos_;  // '{'
    if (consume('}')) return out;
    for (;;) {
      skip_ws();
      if (at_end() || peek() != '"') {
        fail("expected object key");
        return {};
      }
      std::string key = string_body();
      if (err_) return {};
      if (out.contains(key)) {
        fail("duplicate key: " + key, "json_duplicate_key");
        return {};
      }
      if (!consume(':')) {
        fail("expected ':' after key " + key);
        return {};
      }
      Value v = value(depth + 1);
      if (err_) return {};
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) return out;
      if (!consume(',')) {
        fail("expected ',' or '}' in object");
        return {};
      }
    }
  }

  Value array(int depth) {
    Array out;
    ++pos_;  // '['
    if (consume(']')) return out;
    for (;;) {
      out.push_back(value(depth + 1));
      if (err_) return {};
      if (consume(']')) return out;
      if (!consume(',')) {
        fail("expected ',' or ']' in array");
        return {};
      }
    }
  }

  Value string() {
    std::string s = string_body();
    if (err_) return {};
    return s;
  }

  std::optional<std::uint32_t> hex4() {
    if (pos_ + 4 > text_.size()) return std::nullopt;
    std::uint32_t cp = 0;
    const char* first = text_.data() + pos_;
    auto [ptr, ec] = std::from_chars(first, first + 4, cp, 16);
    if (ec != std::errc{} || ptr != first + 4) return std::nullopt;
    pos_ += 4;
    return cp;
  }

  std::string string_body() {
    std::string out;
    ++pos_;  // opening quote
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("control character in string");
        return {};
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (at_end()) break;
      const char e = text_[pos_++];
      switch (e) {
        case '"':  out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/'); break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case 'u': {
          auto cp = hex4();
          if (!cp) {
            fail("invalid \\u escape");
            return {};
          }
          // Surrogates only appear as a high/low pair; either half alone is malformed.
          if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
            fail("unpaired surrogate in \\u escape");
            return {};
          }
          if (*cp >= 0xD800 && *cp <= 0xDBFF) {
            if (text_.compare(pos_, 2, "\\u") != 0) {
              fail("unpaired surrogate in \\u escape");
              return {};
            }
            pos_ += 2;
            auto low = hex4();
            if (!low || *low < 0xDC00 || *low > 0xDFFF) {
              fail("unpaired surrogate in \\u escape");
              return {};
            }
            *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
          }
          put_utf8(out, *cp);
          break;
        }
        default:
          fail(std::string("invalid escape \\") + e);
          return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  Value number() {
    const std::size_t start = pos_;
    if (peek() == '-') ++pos_;
    if (at_end() || !is_digit(peek())) {
      fail("invalid number");
      return {};
    }
    while (!at_end() && is_digit(peek())) ++pos_;
    bool integral = true;
    if (!at_end() && peek() == '.') {
      integral = false;
      ++pos_;
      if (at_end() || !is_digit(peek())) {
        fail("digit expected after decimal point");
        return {};
      }
      while (!at_end() && is_digit(peek())) ++pos_;
    }
    if (!at_end() && (peek() == 'e' || peek() == 'E')) {
      integral = false;
      ++pos_;
      if (!at_end() && (peek() == '+' || peek() == '-')) ++pos_;
      if (at_end() || !is_digit(peek())) {
        fail("digit expected in exponent");
        return {};
      }
      while (!at_end() && is_digit(peek())) ++pos_;
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    std::from_chars_result r{};
    Value out;
    if (!integral) {
      double d = 0;
      r = std::from_chars(first, last, d);
      out = d;
    } else if (*first == '-') {
      std::int64_t i = 0;
      r = std::from_chars(first, last, i);
      out = i;
    } else {
      std::uint64_t u = 0;
      r = std::from_chars(first, last, u);
      out = u;
    }
    if (r.ec != std::errc{} || r.ptr != last) {
      fail("number out of range: " + std::string(first, last));
      return {};
    }
    return out;
  }

  const std::string&       text_;
  std::size_t              pos_{0};
  std::optional<JsonError> err_;
};

// MICRO_OPT: strings with nothing to escape (ids, digests, most goals) are
// appended in one call.
void write_string(std::string& out, const std::string& s) {
  out.push_back('"');
  std::size_t run = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c != '"' && c != '\\' && c >= 0x20) continue;
    out.append(s, run, i - run);
    run = i + 1;
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
        out += buf;
      }
    }
  }
  out.append(s, run, std::string::npos);
  out.push_back('"');
}

template <typename Int>
void write_int(std::string& out, Int v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void write(std::string& out, const Value& v) {
  std::visit(
      [&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>) {
          write_int(out, x);
        } else if constexpr (std::is_same_v<T, double>) {
          out += format_double(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          write_string(out, x);
        } else if constexpr (std::is_same_v<T, Object>) {
          out.push_back('{');
          bool first = true;
          for (const auto& [k, child] : x) {
            if (!first) out.push_back(',');
            first = false;
            write_string(out, k);
            out.push_back(':');
            write(out, child);
          }
          out.push_back('}');
        } else {
          out.push_back('[');
          for (std::size_t i = 0; i < x.size(); ++i) {
            if (i) out.push_back(',');
            write(out, x[i]);
          }
          out.push_back(']');
        }
      },
      v.v);
}

template <typename T>
const T* lookup(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string s(buf, static_cast<std::size_t>(n));
  s.erase(s.find_last_not_of('0') + 1);
  if (s.back() == '.') s.push_back('0');
  return s;
}

std::string to_json(const Value& v) {
  std::string out;
  write(out, v);
  return out;
}

std::string escape(const std::string& s) {
  std::string quoted;
  write_string(quoted, s);
  return quoted.substr(1, quoted.size() - 2);
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Reader r(text);
  r.document();
  return r.error();
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader r(text);
  Value v = r.document();
  if (error) *error = r.error();
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  if (!err && !v.is_object()) err = JsonError{"json_parse_error", "document root must be an object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  if (error) *error = err;
  return err ? std::string{} : to_json(v);
}

Array string_array(const std::vector<std::string>& items) {
  return Array(items.begin(), items.end());
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = lookup<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = lookup<bool>(obj, key);
  return b ? *b : def;
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  if (const auto* u = lookup<std::uint64_t>(obj, key)) return *u;
  // Values built in code from plain ints are int64; accept them when non-negative.
  if (const auto* i = lookup<std::int64_t>(obj, key); i && *i >= 0) return static_cast<std::uint64_t>(*i);
  return def;
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  if (const auto* i = lookup<std::int64_t>(obj, key)) return *i;
  if (const auto* u = lookup<std::uint64_t>(obj, key)) return static_cast<std::int64_t>(*u);
  return def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const auto* d = lookup<double>(obj, key)) return *d;
  if (const auto* u = lookup<std::uint64_t>(obj, key)) return static_cast<double>(*u);
  if (const auto* i = lookup<std::int64_t>(obj, key)) return static_cast<double>(*i);
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = lookup<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  if (const auto* o = lookup<Object>(obj, key)) {
    for (const auto& [k, v] : *o) {
      if (const auto* s = std::get_if<std::string>(&v.v)) out.emplace(k, *s);
    }
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) { return lookup<Object>(obj, key); }

const Array* get_array(const Object& obj, const std::string& key) { return lookup<Array>(obj, key); }

}  // namespace cra::jsonlite
