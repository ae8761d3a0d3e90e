#pragma once

#include "sync/outbox.hpp"
#include <optional>
#include <string>

namespace almanac::sync {

/**
 * RemoteLink - boundary to the remote authority.
 *
 * The store never talks to the network itself; the application supplies an
 * implementation that ships one outbox entry at a time.
 */
class RemoteLink {
public:
    virtual ~RemoteLink() = default;

    /**
     * Deliver `entry`. On success, returns the remote id the authority
     * assigned (nullopt when it did not assign one, e.g. for deletes).
     */
    [[nodiscard]] virtual Result<std::optional<std::string>, Error> apply(const OutboxEntry& entry) = 0;
};

} // namespace almanac::sync
