// Minimal JSON serialization writer (no external dependencies).
//
// Records a token stream and renders it compactly or indented. Used for the
// session traces written by lanefall_cli --json.

#ifndef LANEFALL_CORE_JSON_HELPERS_H
#define LANEFALL_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lanefall {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("score");
///   writer.value(12);
///   writer.key("lane");
///   writer.value("green");
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"score":12,"lane":"green"}
/// @endcode
///
/// Commas are inserted automatically. Structure is not validated: the caller
/// matches begin/end pairs.
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(int64_t val);
  void value(uint32_t val);

  /// @brief Write a floating-point value. NaN and infinity become null.
  void value(double val);

  void value(bool val);

  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const { return render(-1); }

  /// @brief Get the accumulated JSON string with indentation.
  /// @param indent_size Number of spaces per nesting level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// One structural element of the document, in write order.
  struct Token {
    enum Kind : uint8_t { Open, Close, Key, Scalar };
    Kind kind;
    std::string text;  ///< Bracket, escaped key, or rendered scalar.
  };

  void push(Token::Kind kind, std::string text);

  /// Render the token stream. indent_size < 0 renders compactly.
  std::string render(int indent_size) const;

  static std::string escape(std::string_view input);

  std::vector<Token> tokens_;
};

}  // namespace lanefall

#endif  // LANEFALL_CORE_JSON_HELPERS_H
