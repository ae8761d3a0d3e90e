#pragma once

#include <QObject>
#include <functional>

namespace almanac::sync {

/**
 * ConnectivityMonitor - tracks whether the remote is reachable.
 *
 * An owned service object: whoever wires the application constructs one
 * and hands it to the components that care. The platform layer reports
 * changes through setOnline().
 */
class ConnectivityMonitor : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool online READ isOnline WRITE setOnline NOTIFY onlineChanged)

public:
    explicit ConnectivityMonitor(bool initially_online = true, QObject* parent = nullptr);

    [[nodiscard]] bool isOnline() const { return online_; }

    /**
     * Record the current state. onlineChanged fires only on an actual change.
     */
    void setOnline(bool online);

    /**
     * Call `callback` on every change until the returned connection is
     * disconnected (QObject::disconnect) or the monitor is destroyed.
     */
    QMetaObject::Connection subscribe(std::function<void(bool)> callback);

signals:
    void onlineChanged(bool online);

private:
    bool online_;
};

} // namespace almanac::sync
