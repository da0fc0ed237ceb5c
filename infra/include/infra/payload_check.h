#pragma once

#include <string_view>

namespace fanout::infra {

/// Structural check for event payloads: one JSON object or array with
/// balanced brackets and terminated strings, surrounded only by whitespace.
/// Scalars and values are not validated.
bool looks_like_json_document(std::string_view payload);

} // namespace fanout::infra
