#pragma once

#include <QDebug>
#include <QLoggingCategory>
#include <QString>

#include <string_view>

Q_DECLARE_LOGGING_CATEGORY(almanacStoreLog)
Q_DECLARE_LOGGING_CATEGORY(almanacSyncLog)
Q_DECLARE_LOGGING_CATEGORY(almanacBulkLog)
Q_DECLARE_LOGGING_CATEGORY(almanacCacheLog)
Q_DECLARE_LOGGING_CATEGORY(almanacBackupLog)

namespace almanac {

// Installs a Qt message handler that appends every message to a log file
// (and still writes it to stderr). An empty path means default_log_file_path().
void install_file_logging(const QString& path = {});

// $ALMANAC_LOG_DIR/almanac.log, or almanac.log in the system temp dir.
QString default_log_file_path();

inline QString to_qstring(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

} // namespace almanac
