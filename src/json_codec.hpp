#pragma once

#include "protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace stavily::codec {

// Maximum accepted line length, newline excluded
constexpr size_t kMaxLineSize = 1024u * 1024u;

/// Decode one request line. Throws ProtocolError on malformed input.
RequestEnvelope decode_request(const std::string& line);

/// Encode a response as a single line without the trailing newline.
/// Never throws: unserializable payloads become an InternalError response.
std::string encode_response(const ResponseEnvelope& response);

/// Same, but throws ProtocolError when a value cannot be written as JSON text.
std::string encode_response_checked(const ResponseEnvelope& response);

/// Replace byte sequences that are not valid UTF-8 with U+FFFD.
std::string to_valid_utf8(const std::string& text);

std::string encode_request(const RequestEnvelope& request);

/// Decode one response line. Throws ProtocolError on malformed input.
ResponseEnvelope decode_response(const std::string& line);

const Json* find_key(const Json& map_obj, const std::string& key);
std::string as_string(const Json& obj, const std::string& fallback = "");
int64_t as_int64(const Json& obj, int64_t fallback = 0);
bool as_bool(const Json& obj, bool fallback = false);
double as_double(const Json& obj, double fallback = 0.0);

} // namespace stavily::codec
