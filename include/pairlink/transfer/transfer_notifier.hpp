#pragma once

#include <string>

namespace pairlink::transfer {

// Outbound side of the transport. Implementations send a single best-effort
// cancel message to the paired device; no acknowledgment is expected.
class TransferNotifier {
public:
    virtual ~TransferNotifier() = default;
    
    virtual void notify_cancel(const std::string& transfer_id) = 0;
};

} // namespace pairlink::transfer
