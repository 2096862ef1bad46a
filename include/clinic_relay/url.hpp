#pragma once

#include <string>

namespace clinic_relay {

/// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& value);

} // namespace clinic_relay
