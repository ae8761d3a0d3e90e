#include "sync/connectivity.hpp"
#include "core/logging.hpp"

namespace almanac::sync {

ConnectivityMonitor::ConnectivityMonitor(bool initially_online, QObject* parent)
    : QObject(parent)
    , online_(initially_online) {}

void ConnectivityMonitor::setOnline(bool online) {
    if (online_ == online) {
        return;
    }
    online_ = online;
    qCInfo(almanacSyncLog) << "Connectivity:" << (online ? "online" : "offline");
    emit onlineChanged(online);
}

QMetaObject::Connection ConnectivityMonitor::subscribe(std::function<void(bool)> callback) {
    return connect(this, &ConnectivityMonitor::onlineChanged, this, std::move(callback));
}

} // namespace almanac::sync
