#ifndef NETSTACK_CORE_JSON_UTILS_HPP_
#define NETSTACK_CORE_JSON_UTILS_HPP_

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace netstack::core {

// Shared JSON string escaping for snapshots, reports and sim state files.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Streaming JSON emitter with optional pretty printing.
//
// `indent > 0` produces the same layout as Python's `json.dumps(indent=N)`
// (one member per line, `"key": value`, empty containers as `{}` / `[]`), so
// snapshot files stay diffable against exports produced by other tooling.
// `indent == 0` emits compact single-line JSON.
//
// The writer does not validate nesting beyond what is needed to place commas;
// callers are expected to balance Begin/End calls.
class JsonWriter {
public:
  explicit JsonWriter(int indent = 2) : indent_(indent < 0 ? 0 : indent) {}

  JsonWriter& BeginObject() {
    BeforeValue();
    out_ << '{';
    stack_.push_back({.is_object = true, .has_items = false});
    return *this;
  }

  JsonWriter& EndObject() {
    return CloseContainer('}');
  }

  JsonWriter& BeginArray() {
    BeforeValue();
    out_ << '[';
    stack_.push_back({.is_object = false, .has_items = false});
    return *this;
  }

  JsonWriter& EndArray() {
    return CloseContainer(']');
  }

  JsonWriter& Key(std::string_view key) {
    if (!stack_.empty()) {
      Frame& frame = stack_.back();
      if (frame.has_items) {
        out_ << ',';
      }
      frame.has_items = true;
      NewLine(stack_.size());
    }
    out_ << '"' << EscapeJson(key) << '"' << (indent_ > 0 ? ": " : ":");
    after_key_ = true;
    return *this;
  }

  JsonWriter& String(std::string_view value) {
    BeforeValue();
    out_ << '"' << EscapeJson(value) << '"';
    return *this;
  }

  JsonWriter& Bool(bool value) {
    BeforeValue();
    out_ << (value ? "true" : "false");
    return *this;
  }

  JsonWriter& Int(std::int64_t value) {
    BeforeValue();
    out_ << value;
    return *this;
  }

  JsonWriter& UInt(std::uint64_t value) {
    BeforeValue();
    out_ << value;
    return *this;
  }

  JsonWriter& Null() {
    BeforeValue();
    out_ << "null";
    return *this;
  }

  JsonWriter& StringField(std::string_view key, std::string_view value) {
    return Key(key).String(value);
  }

  JsonWriter& BoolField(std::string_view key, bool value) {
    return Key(key).Bool(value);
  }

  JsonWriter& IntField(std::string_view key, std::int64_t value) {
    return Key(key).Int(value);
  }

  JsonWriter& UIntField(std::string_view key, std::uint64_t value) {
    return Key(key).UInt(value);
  }

  JsonWriter& StringArrayField(std::string_view key, const std::vector<std::string>& values) {
    Key(key).BeginArray();
    for (const auto& value : values) {
      String(value);
    }
    return EndArray();
  }

  std::string str() const {
    return out_.str();
  }

private:
  struct Frame {
    bool is_object = false;
    bool has_items = false;
  };

  void BeforeValue() {
    if (after_key_) {
      after_key_ = false;
      return;
    }
    if (stack_.empty()) {
      return;
    }
    Frame& frame = stack_.back();
    if (frame.has_items) {
      out_ << ',';
    }
    frame.has_items = true;
    NewLine(stack_.size());
  }

  JsonWriter& CloseContainer(char closing) {
    if (stack_.empty()) {
      return *this;
    }
    const bool had_items = stack_.back().has_items;
    stack_.pop_back();
    if (had_items) {
      NewLine(stack_.size());
    }
    out_ << closing;
    return *this;
  }

  void NewLine(std::size_t depth) {
    if (indent_ == 0) {
      return;
    }
    out_ << '\n' << std::string(depth * static_cast<std::size_t>(indent_), ' ');
  }

  int indent_ = 2;
  bool after_key_ = false;
  std::vector<Frame> stack_;
  std::ostringstream out_;
};

} // namespace netstack::core

#endif // NETSTACK_CORE_JSON_UTILS_HPP_
