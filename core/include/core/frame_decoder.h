#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fanout::core {

/// Incremental UTF-8 decoder. A multi-byte sequence cut by a chunk boundary
/// is held back until the rest arrives; invalid bytes become U+FFFD.
class Utf8Decoder {
public:
  /// Decode the next chunk. Output never ends inside a code point.
  std::string decode(std::string_view bytes);

  /// End of input: a dangling partial sequence becomes U+FFFD.
  std::string finish();

  [[nodiscard]] std::size_t pending_bytes() const noexcept {
    return pending_.size();
  }

private:
  std::string pending_;
};

enum class DecodeMode {
  Line, // split on a configurable delimiter
  Event // server-sent events: "data:" lines grouped by a blank line
};

enum class RecordKind { Line, Event, Malformed, EndOfStream };

const char *to_string(RecordKind kind);

struct DecodedRecord {
  RecordKind kind = RecordKind::EndOfStream;
  std::string text;  // line text, event payload, or malformed raw input
  std::string event; // SSE "event:" field, empty if absent
  std::string id;    // last SSE "id:" seen on the stream

  static DecodedRecord Line(std::string text) {
    return {RecordKind::Line, std::move(text), {}, {}};
  }
  static DecodedRecord Event(std::string payload, std::string event = {},
                             std::string id = {}) {
    return {RecordKind::Event, std::move(payload), std::move(event),
            std::move(id)};
  }
  static DecodedRecord Malformed(std::string raw) {
    return {RecordKind::Malformed, std::move(raw), {}, {}};
  }
  static DecodedRecord EndOfStream() { return {}; }
};

bool operator==(const DecodedRecord &lhs, const DecodedRecord &rhs);
inline bool operator!=(const DecodedRecord &lhs, const DecodedRecord &rhs) {
  return !(lhs == rhs);
}
std::ostream &operator<<(std::ostream &os, const DecodedRecord &record);

struct DecoderConfig {
  DecodeMode mode = DecodeMode::Line;

  // Line mode
  std::string delimiter = "\n"; // any length; empty falls back to "\n"
  bool strip_cr = true;         // with "\n", drop a trailing '\r'
  bool skip_empty_lines = false;

  // Event mode
  std::string sentinel = "[DONE]"; // empty disables sentinel handling
  /// Optional payload check; a rejected payload becomes Malformed.
  std::function<bool(const std::string &)> payload_validator;
};

/// Turns an arbitrarily chunked byte stream into complete records.
///
/// One instance per stream. feed() returns whatever records the chunk
/// completed and keeps the undelimited tail buffered. flush() is called once
/// at end of stream: it emits the tail (if any) and exactly one EndOfStream.
/// After an event stream hits the sentinel, nothing more is emitted.
/// Malformed input yields Malformed records; the decoder never throws on
/// stream content.
class FrameDecoder {
public:
  explicit FrameDecoder(DecoderConfig config = {});

  std::vector<DecodedRecord> feed(std::string_view chunk);
  std::vector<DecodedRecord> flush();

  /// True once EndOfStream has been emitted.
  [[nodiscard]] bool finished() const noexcept { return finished_; }

  /// Decoded text plus undecoded UTF-8 bytes still waiting for a delimiter.
  [[nodiscard]] std::size_t buffered_bytes() const noexcept {
    return buffer_.size() + utf8_.pending_bytes();
  }

  [[nodiscard]] const DecoderConfig &config() const noexcept { return config_; }

private:
  void drain_lines(std::size_t scan_from, std::vector<DecodedRecord> &out);
  void emit_line(std::string line, std::vector<DecodedRecord> &out) const;

  void drain_event_lines(std::size_t scan_from, std::vector<DecodedRecord> &out);
  void handle_event_line(std::string_view line, std::vector<DecodedRecord> &out);
  void dispatch_event(std::vector<DecodedRecord> &out);

  DecoderConfig config_;
  Utf8Decoder utf8_;
  std::string buffer_;

  // Event mode state
  bool pending_cr_ = false; // previous chunk ended on '\r'
  std::vector<std::string> data_lines_;
  std::string event_name_;
  std::string last_event_id_;

  bool finished_ = false;
  bool flushed_ = false;
};

} // namespace fanout::core
