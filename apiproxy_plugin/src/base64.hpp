#pragma once

#include <string>

namespace apiproxy::codec {

std::string base64_encode(const std::string& bytes);

/// Decodes standard (RFC 4648) base64 with padding. Returns false on malformed input.
bool base64_decode(const std::string& text, std::string& out);

} // namespace apiproxy::codec
