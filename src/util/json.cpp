#include "gatewatch/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace gatewatch::json {
namespace {

struct Parser {
  const std::string& s;
  std::size_t i{0};

  char peek() const { return i < s.size() ? s[i] : '\0'; }
  char get() { return i < s.size() ? s[i++] : '\0'; }

  void skip_ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    const std::size_t pos = std::min(i, s.size());
    int line = 1;
    int col = 1;
    std::size_t line_start = 0;
    for (std::size_t k = 0; k < pos; ++k) {
      if (s[k] == '\n') {
        ++line;
        col = 1;
        line_start = k + 1;
      } else if (s[k] != '\r') {
        ++col;
      }
    }
    std::size_t line_end = line_start;
    while (line_end < s.size() && s[line_end] != '\n' && s[line_end] != '\r') ++line_end;

    std::ostringstream ss;
    ss << "JSON parse error (line " << line << ", col " << col << "): " << msg;
    if (line_end > line_start) {
      ss << "\n" << s.substr(line_start, line_end - line_start) << "\n"
         << std::string(static_cast<std::size_t>(col - 1), ' ') << "^";
    }
    throw std::runtime_error(ss.str());
  }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++i;
    return true;
  }

  void expect(char c) {
    skip_ws();
    if (peek() != c) fail(std::string("expected '") + c + "'");
    ++i;
  }

  Value parse_value() {
    skip_ws();
    const char c = peek();
    if (c == 'n') return parse_literal("null", nullptr);
    if (c == 't') return parse_literal("true", true);
    if (c == 'f') return parse_literal("false", false);
    if (c == '"') return parse_string();
    if (c == '[') return parse_array();
    if (c == '{') return parse_object();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
    if (c == '\0') fail("unexpected end of input");
    fail("unexpected character");
  }

  Value parse_literal(const char* lit, Value v) {
    for (const char* p = lit; *p; ++p) {
      if (get() != *p) fail("invalid literal");
    }
    return v;
  }

  Value parse_number() {
    const std::size_t start = i;
    if (peek() == '-') ++i;
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    if (peek() == '.') {
      ++i;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number fraction");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid exponent");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    }
    std::istringstream num(s.substr(start, i - start));
    num.imbue(std::locale::classic());
    double d = 0.0;
    num >> d;
    if (num.fail()) fail("failed to parse number");
    return d;
  }

  unsigned parse_hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = get();
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code += static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code += static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code += static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("bad unicode escape");
      }
    }
    return code;
  }

  // Basic multilingual plane only; content files are ASCII in practice.
  static void append_utf8(unsigned cp, std::string& out) {
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string parse_string_raw() {
    expect('"');
    std::string out;
    for (;;) {
      if (i >= s.size()) fail("unterminated string");
      const char c = get();
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = get();
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': append_utf8(parse_hex4(), out); break;
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value parse_string() { return parse_string_raw(); }

  Value parse_array() {
    expect('[');
    Array arr;
    if (consume(']')) return arr;
    for (;;) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      expect(',');
    }
    return arr;
  }

  Value parse_object() {
    expect('{');
    Object obj;
    if (consume('}')) return obj;
    for (;;) {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = parse_string_raw();
      expect(':');
      obj[std::move(key)] = parse_value();
      if (consume('}')) break;
      expect(',');
    }
    return obj;
  }
};

void write_escaped(const std::string& in, std::ostringstream& out) {
  out << '"';
  for (char c : in) {
    switch (c) {
      case '"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
        } else {
          out << c;
        }
    }
  }
  out << '"';
}

void write_value(const Value& v, std::ostringstream& out, int indent, int depth) {
  const auto newline = [&](int d) {
    if (indent <= 0) return;
    out << '\n' << std::string(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out << "null";
  } else if (v.is_bool()) {
    out << (std::get<bool>(v) ? "true" : "false");
  } else if (v.is_number()) {
    const double d = std::get<double>(v);
    if (std::fabs(d - std::round(d)) < 1e-9 && std::fabs(d) < 9.0e15) {
      out << static_cast<std::int64_t>(std::llround(d));
    } else {
      out << std::setprecision(17) << d;
    }
  } else if (v.is_string()) {
    write_escaped(std::get<std::string>(v), out);
  } else if (v.is_array()) {
    const auto& a = std::get<Array>(v);
    out << '[';
    for (std::size_t k = 0; k < a.size(); ++k) {
      newline(depth + 1);
      write_value(a[k], out, indent, depth + 1);
      if (k + 1 < a.size()) out << ',';
    }
    if (!a.empty()) newline(depth);
    out << ']';
  } else {
    const auto& o = std::get<Object>(v);
    out << '{';
    std::size_t n = 0;
    for (const auto& [k, val] : o) {
      newline(depth + 1);
      write_escaped(k, out);
      out << (indent > 0 ? ": " : ":");
      write_value(val, out, indent, depth + 1);
      if (++n < o.size()) out << ',';
    }
    if (!o.empty()) newline(depth);
    out << '}';
  }
}

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

const Value* Value::find(const std::string& key) const {
  const auto* o = as_object();
  if (!o) return nullptr;
  auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

const Value& Value::at(const std::string& key) const {
  const auto* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  auto it = o->find(key);
  if (it == o->end()) throw std::runtime_error("JSON object missing key: " + key);
  return it->second;
}

bool Value::bool_value(bool def) const {
  if (const auto* p = std::get_if<bool>(this)) return *p;
  return def;
}

double Value::number_value(double def) const {
  if (const auto* p = std::get_if<double>(this)) return *p;
  return def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  if (const auto* p = std::get_if<double>(this)) return static_cast<std::int64_t>(std::llround(*p));
  return def;
}

std::string Value::string_value(const std::string& def) const {
  if (const auto* p = std::get_if<std::string>(this)) return *p;
  return def;
}

const Object& Value::object() const {
  const auto* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const auto* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) {
  Parser p{text};
  // Tolerate a UTF-8 BOM.
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
    p.i = 3;
  }
  Value v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("trailing characters after JSON document");
  return v;
}

std::string stringify(const Value& v, int indent) {
  std::ostringstream out;
  write_value(v, out, indent, 0);
  return out.str();
}

} // namespace gatewatch::json
