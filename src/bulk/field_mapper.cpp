#include "bulk/field_mapper.hpp"
#include "core/record_json.hpp"
#include <QDateTime>

namespace almanac::bulk {

namespace {

const char* const TIME_KEYS[] = {"startTime", "endTime"};

} // namespace

Result<Event, Error> CanonicalFieldMapper::map(const QJsonObject& source) const {
    return event_from_json(source);
}

Result<Event, Error> AliasFieldMapper::map(const QJsonObject& source) const {
    QJsonObject canonical;
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto alias = aliases_.find(it.key().toStdString());
        const QString key = alias == aliases_.end() ? it.key()
                                                    : QString::fromStdString(alias->second);
        canonical.insert(key, it.value());
    }

    for (const char* time_key : TIME_KEYS) {
        const QString key = QString::fromLatin1(time_key);
        const auto value = canonical.value(key);
        if (!value.isString()) {
            continue;
        }
        const auto parsed = QDateTime::fromString(value.toString(), Qt::ISODate);
        if (!parsed.isValid()) {
            return Result<Event, Error>::err(Error{
                ErrorKind::Format,
                std::string(time_key) + " is not an ISO 8601 date: " + value.toString().toStdString()});
        }
        canonical.insert(key, static_cast<qint64>(parsed.toMSecsSinceEpoch()));
    }

    return event_from_json(canonical);
}

} // namespace almanac::bulk
