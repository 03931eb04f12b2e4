#pragma once

#include "hsync/core/result.hpp"
#include "hsync/sync/protocol.hpp"

#include <chrono>

namespace hsync::sync {

/**
 * @brief One request/response round trip with the remote authority
 *
 * Implementations do not retry. They report:
 * - Timeout             no response within `timeout`
 * - Offline             no connectivity at all
 * - TransientTransport  connection dropped, 5xx, unreadable response
 * - PermanentRejection  the authority refused the request as a whole (4xx)
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<DeltaResponse> exchange(const DeltaRequest& request, std::chrono::milliseconds timeout) = 0;
};

} // namespace hsync::sync
