/**
 * @file json_helpers.h
 * @brief Minimal JSON writer and flat-object parser for CLI options and reports.
 */

#ifndef SCOREPLAY_CORE_JSON_HELPERS_H
#define SCOREPLAY_CORE_JSON_HELPERS_H

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <ostream>
#include <string>

namespace scoreplay {
namespace json {

/**
 * @brief Escapes special characters in a string for JSON output.
 *
 * Quote, backslash, newline, carriage return and tab use their short
 * escapes; other control characters are written as \\u00XX.
 *
 * @param s The input string to escape.
 * @return The escaped string safe for JSON output.
 */
inline std::string escape(const std::string& s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          result += buf;
        } else {
          result += c;
        }
        break;
    }
  }
  return result;
}

/**
 * @brief A streaming JSON writer with optional pretty-print support.
 *
 * Fluent API with automatic comma handling:
 * ```cpp
 * json::Writer w(std::cout, true);
 * w.beginObject().write("format", 1).beginArray("tracks").value(3).endArray().endObject();
 * ```
 */
class Writer {
 public:
  /**
   * @brief Constructs a JSON writer.
   * @param os The output stream to write JSON to.
   * @param pretty If true, output is formatted with newlines and indentation.
   * @param indent_size Number of spaces per indentation level (default: 2).
   */
  explicit Writer(std::ostream& os, bool pretty = false, int indent_size = 2)
      : os_(os), pretty_(pretty), indent_size_(indent_size) {}

  /// @brief Begins a JSON object, keyed when nested inside another object.
  Writer& beginObject(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) {
      writeKey(key);
    } else if (depth_ > 0) {
      writeNewlineIndent();
    }
    os_ << "{";
    pushContext();
    return *this;
  }

  /// @brief Ends the current JSON object.
  Writer& endObject() {
    popContext();
    writeNewlineIndent();
    os_ << "}";
    return *this;
  }

  /// @brief Begins a JSON array, keyed when nested inside an object.
  Writer& beginArray(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) {
      writeKey(key);
    } else if (depth_ > 0) {
      writeNewlineIndent();
    }
    os_ << "[";
    pushContext();
    return *this;
  }

  /// @brief Ends the current JSON array.
  Writer& endArray() {
    popContext();
    writeNewlineIndent();
    os_ << "]";
    return *this;
  }

  /**
   * @brief Writes a numeric key-value pair to the current object.
   * @tparam T Numeric type; 8-bit integers must be widened by the caller.
   */
  template <typename T>
  Writer& write(const char* key, T value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << value;
    return *this;
  }

  Writer& write(const char* key, bool value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << (value ? "true" : "false");
    return *this;
  }

  Writer& write(const char* key, const std::string& value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "\"" << escape(value) << "\"";
    return *this;
  }

  Writer& write(const char* key, const char* value) { return write(key, std::string(value)); }

  /// @brief Writes a numeric value to the current array.
  template <typename T>
  Writer& value(T v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << v;
    return *this;
  }

  Writer& value(const std::string& v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "\"" << escape(v) << "\"";
    return *this;
  }

  Writer& value(const char* v) { return value(std::string(v)); }

 private:
  void writeKey(const char* key) {
    writeNewlineIndent();
    os_ << "\"" << key << "\":";
    if (pretty_) os_ << " ";
  }

  void writeCommaIfNeeded() {
    if (!first_) os_ << ",";
    first_ = false;
  }

  void writeNewlineIndent() {
    if (pretty_) {
      os_ << "\n";
      for (int i = 0; i < depth_ * indent_size_; ++i) os_ << " ";
    }
  }

  void pushContext() {
    ++depth_;
    first_ = true;
  }

  void popContext() {
    --depth_;
    first_ = false;
  }

  std::ostream& os_;
  bool pretty_;
  int indent_size_;
  int depth_ = 0;
  bool first_ = true;
};

/**
 * @brief RAII helper: beginObject() on construction, endObject() on destruction.
 */
class ObjectScope {
 public:
  ObjectScope(Writer& w, const char* key = nullptr) : w_(w) { w_.beginObject(key); }
  ~ObjectScope() { w_.endObject(); }

  ObjectScope(const ObjectScope&) = delete;
  ObjectScope& operator=(const ObjectScope&) = delete;

  Writer& writer() { return w_; }

 private:
  Writer& w_;
};

/**
 * @brief RAII helper: beginArray() on construction, endArray() on destruction.
 */
class ArrayScope {
 public:
  ArrayScope(Writer& w, const char* key = nullptr) : w_(w) { w_.beginArray(key); }
  ~ArrayScope() { w_.endArray(); }

  ArrayScope(const ArrayScope&) = delete;
  ArrayScope& operator=(const ArrayScope&) = delete;

  Writer& writer() { return w_; }

 private:
  Writer& w_;
};

// ============================================================================
// Flat JSON Parser for option files
// ============================================================================

/**
 * @brief Parser for a single flat JSON object of string, number and boolean values.
 *
 * Nested objects and arrays are skipped. Values are read back as unsigned
 * integers or booleans; values that do not convert yield the supplied default.
 *
 * ```cpp
 * json::Parser p(R"({"expressive":true,"humanize_seed":42})");
 * p.getBool("expressive");     // true
 * p.getUint("humanize_seed");  // 42
 * ```
 */
class Parser {
 public:
  explicit Parser(const std::string& json) : json_(json) { parse(); }

  /// @brief True if the input started with a JSON object.
  bool isObject() const { return is_object_; }

  bool has(const std::string& key) const { return values_.find(key) != values_.end(); }

  uint32_t getUint(const std::string& key, uint32_t default_val = 0) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty() || it->second[0] == '-') return default_val;
    char* end = nullptr;
    unsigned long parsed = std::strtoul(it->second.c_str(), &end, 10);
    if (*end != '\0') return default_val;
    return static_cast<uint32_t>(parsed);
  }

  bool getBool(const std::string& key, bool default_val = false) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    if (it->second == "true") return true;
    if (it->second == "false") return false;
    return default_val;
  }

 private:
  void parse() {
    size_t pos = 0;
    skipWhitespace(pos);
    if (pos >= json_.size() || json_[pos] != '{') return;
    is_object_ = true;
    ++pos;

    while (pos < json_.size()) {
      skipWhitespace(pos);
      if (pos >= json_.size() || json_[pos] == '}') break;
      if (json_[pos] == ',') {
        ++pos;
        continue;
      }

      // Parse key
      std::string key = parseString(pos);
      if (key.empty()) break;

      skipWhitespace(pos);
      if (pos >= json_.size() || json_[pos] != ':') break;
      ++pos;
      skipWhitespace(pos);

      values_[key] = parseValue(pos);
    }
  }

  void skipWhitespace(size_t& pos) const {
    while (pos < json_.size() &&
           (json_[pos] == ' ' || json_[pos] == '\t' || json_[pos] == '\n' || json_[pos] == '\r')) {
      ++pos;
    }
  }

  std::string parseString(size_t& pos) const {
    if (pos >= json_.size() || json_[pos] != '"') return "";
    ++pos;
    std::string result;
    while (pos < json_.size() && json_[pos] != '"') {
      if (json_[pos] == '\\' && pos + 1 < json_.size()) {
        ++pos;
        switch (json_[pos]) {
          case 'n': result += '\n'; break;
          case 'r': result += '\r'; break;
          case 't': result += '\t'; break;
          default: result += json_[pos]; break;
        }
      } else {
        result += json_[pos];
      }
      ++pos;
    }
    if (pos < json_.size()) ++pos;  // Skip closing quote
    return result;
  }

  std::string parseValue(size_t& pos) const {
    skipWhitespace(pos);
    if (pos >= json_.size()) return "";

    if (json_[pos] == '"') {
      return parseString(pos);
    }
    if (json_[pos] == '{') {
      skipNested(pos, '{', '}');
      return "";
    }
    if (json_[pos] == '[') {
      skipNested(pos, '[', ']');
      return "";
    }

    // Number, boolean, or null
    std::string value;
    while (pos < json_.size() && json_[pos] != ',' && json_[pos] != '}' && json_[pos] != ' ' &&
           json_[pos] != '\t' && json_[pos] != '\n' && json_[pos] != '\r') {
      value += json_[pos];
      ++pos;
    }
    return value;
  }

  void skipNested(size_t& pos, char open, char close) const {
    int depth = 0;
    while (pos < json_.size()) {
      char c = json_[pos];
      if (c == '"') {
        parseString(pos);
        continue;
      }
      ++pos;
      if (c == open) {
        ++depth;
      } else if (c == close && --depth == 0) {
        return;
      }
    }
  }

  std::string json_;
  bool is_object_ = false;
  std::map<std::string, std::string> values_;
};

}  // namespace json
}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_JSON_HELPERS_H
