#include "core/frame_decoder.h"

namespace fanout::core {
namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD"; // U+FFFD

bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

/// Expected length of a sequence starting with `lead`, 0 if `lead` can
/// never start one.
std::size_t sequence_length(unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 2;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    return 4;
  }
  return 0;
}

/// Second byte ranges that exclude overlongs, surrogates and > U+10FFFF.
bool valid_second(unsigned char lead, unsigned char b) {
  switch (lead) {
  case 0xE0:
    return b >= 0xA0 && b <= 0xBF;
  case 0xED:
    return b >= 0x80 && b <= 0x9F;
  case 0xF0:
    return b >= 0x90 && b <= 0xBF;
  case 0xF4:
    return b >= 0x80 && b <= 0x8F;
  default:
    return is_continuation(b);
  }
}

} // namespace

// ============================================================
// Utf8Decoder
// ============================================================

std::string Utf8Decoder::decode(std::string_view bytes) {
  std::string input;
  std::string_view view = bytes;
  if (!pending_.empty()) {
    input = std::move(pending_);
    pending_.clear();
    input.append(bytes.data(), bytes.size());
    view = input;
  }

  std::string out;
  out.reserve(view.size());
  std::size_t i = 0;
  while (i < view.size()) {
    const auto lead = static_cast<unsigned char>(view[i]);
    const std::size_t len = sequence_length(lead);
    if (len == 1) {
      out.push_back(view[i]);
      ++i;
      continue;
    }
    if (len == 0) {
      out.append(kReplacement);
      ++i;
      continue;
    }

    // Validate as many trailing bytes as this chunk holds.
    std::size_t have = 1;
    bool invalid = false;
    while (have < len && i + have < view.size()) {
      const auto b = static_cast<unsigned char>(view[i + have]);
      const bool ok = have == 1 ? valid_second(lead, b) : is_continuation(b);
      if (!ok) {
        invalid = true;
        break;
      }
      ++have;
    }

    if (invalid) {
      // Replace the broken prefix; the offending byte is re-examined.
      out.append(kReplacement);
      i += have;
      continue;
    }
    if (have < len) {
      // Cut by the chunk boundary: resume on the next decode().
      pending_.assign(view.data() + i, have);
      break;
    }
    out.append(view.data() + i, len);
    i += len;
  }
  return out;
}

std::string Utf8Decoder::finish() {
  if (pending_.empty()) {
    return {};
  }
  pending_.clear();
  return std::string(kReplacement);
}

// ============================================================
// DecodedRecord
// ============================================================

const char *to_string(RecordKind kind) {
  switch (kind) {
  case RecordKind::Line:
    return "Line";
  case RecordKind::Event:
    return "Event";
  case RecordKind::Malformed:
    return "Malformed";
  case RecordKind::EndOfStream:
    return "EndOfStream";
  }
  return "Unknown";
}

bool operator==(const DecodedRecord &lhs, const DecodedRecord &rhs) {
  return lhs.kind == rhs.kind && lhs.text == rhs.text &&
         lhs.event == rhs.event && lhs.id == rhs.id;
}

std::ostream &operator<<(std::ostream &os, const DecodedRecord &record) {
  os << to_string(record.kind);
  if (record.kind != RecordKind::EndOfStream) {
    os << "{\"" << record.text << "\"";
    if (!record.event.empty()) {
      os << " event=" << record.event;
    }
    if (!record.id.empty()) {
      os << " id=" << record.id;
    }
    os << '}';
  }
  return os;
}

// ============================================================
// FrameDecoder
// ============================================================

FrameDecoder::FrameDecoder(DecoderConfig config) : config_(std::move(config)) {
  if (config_.delimiter.empty()) {
    config_.delimiter = "\n";
  }
}

std::vector<DecodedRecord> FrameDecoder::feed(std::string_view chunk) {
  std::vector<DecodedRecord> out;
  if (finished_ || flushed_) {
    return out;
  }

  const std::string text = utf8_.decode(chunk);
  if (text.empty()) {
    return out;
  }

  const std::size_t old_size = buffer_.size();
  buffer_ += text;

  if (config_.mode == DecodeMode::Line) {
    // A delimiter may straddle the old tail and the new text.
    const std::size_t overlap = config_.delimiter.size() - 1;
    drain_lines(old_size > overlap ? old_size - overlap : 0, out);
  } else {
    drain_event_lines(old_size, out);
  }
  return out;
}

std::vector<DecodedRecord> FrameDecoder::flush() {
  std::vector<DecodedRecord> out;
  if (flushed_) {
    return out;
  }
  flushed_ = true;
  if (finished_) {
    return out;
  }

  buffer_ += utf8_.finish();

  if (config_.mode == DecodeMode::Line) {
    if (!buffer_.empty()) {
      emit_line(std::move(buffer_), out);
    }
  } else {
    if (!buffer_.empty()) {
      handle_event_line(buffer_, out);
    }
    if (!finished_) {
      dispatch_event(out);
    }
  }
  buffer_.clear();

  if (!finished_) {
    out.push_back(DecodedRecord::EndOfStream());
    finished_ = true;
  }
  return out;
}

void FrameDecoder::drain_lines(std::size_t scan_from,
                               std::vector<DecodedRecord> &out) {
  const std::string &delim = config_.delimiter;
  std::size_t start = 0;
  std::size_t pos = buffer_.find(delim, scan_from);
  while (pos != std::string::npos) {
    emit_line(buffer_.substr(start, pos - start), out);
    start = pos + delim.size();
    pos = buffer_.find(delim, start);
  }
  buffer_.erase(0, start);
}

void FrameDecoder::emit_line(std::string line,
                             std::vector<DecodedRecord> &out) const {
  if (config_.strip_cr && config_.delimiter == "\n" && !line.empty() &&
      line.back() == '\r') {
    line.pop_back();
  }
  if (config_.skip_empty_lines && line.empty()) {
    return;
  }
  out.push_back(DecodedRecord::Line(std::move(line)));
}

void FrameDecoder::drain_event_lines(std::size_t scan_from,
                                     std::vector<DecodedRecord> &out) {
  std::size_t start = 0;
  std::size_t i = scan_from;

  // "\r" at the end of the previous chunk and "\n" here are one terminator.
  // The buffer is always fully drained when that happens.
  if (pending_cr_) {
    pending_cr_ = false;
    if (!buffer_.empty() && buffer_.front() == '\n') {
      start = i = 1;
    }
  }

  for (; i < buffer_.size(); ++i) {
    const char c = buffer_[i];
    if (c != '\n' && c != '\r') {
      continue;
    }

    handle_event_line(std::string_view(buffer_).substr(start, i - start), out);
    if (finished_) {
      buffer_.clear();
      return;
    }

    if (c == '\r') {
      if (i + 1 < buffer_.size()) {
        if (buffer_[i + 1] == '\n') {
          ++i;
        }
      } else {
        pending_cr_ = true;
      }
    }
    start = i + 1;
  }
  buffer_.erase(0, start);
}

void FrameDecoder::handle_event_line(std::string_view line,
                                     std::vector<DecodedRecord> &out) {
  if (line.empty()) {
    dispatch_event(out);
    return;
  }
  if (line.front() == ':') {
    return; // comment / keep-alive
  }

  const auto colon = line.find(':');
  if (colon == std::string_view::npos) {
    out.push_back(DecodedRecord::Malformed(std::string(line)));
    return;
  }

  const std::string_view field = line.substr(0, colon);
  std::string_view value = line.substr(colon + 1);
  if (!value.empty() && value.front() == ' ') {
    value.remove_prefix(1);
  }

  if (field == "data") {
    data_lines_.emplace_back(value);
  } else if (field == "event") {
    event_name_.assign(value);
  } else if (field == "id") {
    if (value.find('\0') == std::string_view::npos) {
      last_event_id_.assign(value);
    }
  }
  // "retry" and unknown fields carry nothing for the consumer.
}

void FrameDecoder::dispatch_event(std::vector<DecodedRecord> &out) {
  if (data_lines_.empty()) {
    event_name_.clear();
    return;
  }

  std::string payload;
  for (std::size_t i = 0; i < data_lines_.size(); ++i) {
    if (i > 0) {
      payload.push_back('\n');
    }
    payload += data_lines_[i];
  }
  data_lines_.clear();
  std::string name = std::move(event_name_);
  event_name_.clear();

  if (!config_.sentinel.empty() && payload == config_.sentinel) {
    out.push_back(DecodedRecord::EndOfStream());
    finished_ = true;
    return;
  }
  if (config_.payload_validator && !config_.payload_validator(payload)) {
    out.push_back(DecodedRecord::Malformed(std::move(payload)));
    return;
  }
  out.push_back(DecodedRecord::Event(std::move(payload), std::move(name),
                                     last_event_id_));
}

} // namespace fanout::core
