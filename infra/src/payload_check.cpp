#include "infra/payload_check.h"

#include <vector>

namespace fanout::infra {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace

bool looks_like_json_document(std::string_view payload) {
  std::size_t begin = 0;
  std::size_t end = payload.size();
  while (begin < end && is_space(payload[begin])) {
    ++begin;
  }
  while (end > begin && is_space(payload[end - 1])) {
    --end;
  }
  if (begin == end || (payload[begin] != '{' && payload[begin] != '[')) {
    return false;
  }

  std::vector<char> open;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = begin; i < end; ++i) {
    const char c = payload[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    switch (c) {
    case '"':
      in_string = true;
      break;
    case '{':
    case '[':
      open.push_back(c);
      break;
    case '}':
    case ']':
      if (open.empty() || open.back() != (c == '}' ? '{' : '[')) {
        return false;
      }
      open.pop_back();
      // Anything after the outermost close is trailing garbage.
      if (open.empty() && i + 1 != end) {
        return false;
      }
      break;
    default:
      break;
    }
  }
  return !in_string && open.empty();
}

} // namespace fanout::infra
