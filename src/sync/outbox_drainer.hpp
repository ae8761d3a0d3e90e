#pragma once

#include "storage/store.hpp"
#include "sync/connectivity.hpp"
#include "sync/remote_link.hpp"
#include <QObject>
#include <string>
#include <vector>

namespace almanac::sync {

struct DrainResult {
    int synced{0};
    int failed{0};
    int skipped{0};       // left queued because the link went offline mid-drain
    bool offline{false};  // nothing attempted
    std::vector<std::string> errors;
};

/**
 * OutboxDrainer - delivers queued mutations through a RemoteLink.
 *
 * Oldest first. A delivered entry is removed; once an entity has no entries
 * left it is acknowledged as synced. A failed delivery counts an attempt
 * against the entry. Nothing is attempted while offline; coming back online
 * starts a drain.
 */
class OutboxDrainer : public QObject {
    Q_OBJECT

public:
    OutboxDrainer(storage::Store& store, RemoteLink& link, ConnectivityMonitor& connectivity,
                  QObject* parent = nullptr);

    DrainResult drainOnce(int limit = 0);

    [[nodiscard]] bool isDraining() const { return in_progress_; }

    /**
     * Drain automatically whenever connectivity returns.
     */
    void setAutoDrain(bool enabled) { auto_drain_ = enabled; }

signals:
    void drained(int synced, int failed);

private:
    void onOnlineChanged(bool online);
    Result<void, Error> acknowledge(const OutboxEntry& entry,
                                    const std::optional<std::string>& remote_id);

    storage::Store& store_;
    RemoteLink& link_;
    ConnectivityMonitor& connectivity_;
    bool in_progress_ = false;
    bool auto_drain_ = true;
};

} // namespace almanac::sync
