#pragma once

#include <string>

namespace clinic_relay {

/// Send side of one client connection. Implementations must be safe to call
/// from any thread and must drop frames once the connection is gone.
class Outbound {
public:
    virtual ~Outbound() = default;
    virtual void send_text(const std::string& frame) = 0;
};

} // namespace clinic_relay
