#include "backup/backup_format.hpp"
#include "core/record_json.hpp"
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <algorithm>

namespace almanac::backup {

namespace {

QString key(const char* k) {
    return QString::fromLatin1(k);
}

QJsonObject stats_to_json(const BackupStats& s) {
    QJsonObject obj;
    obj.insert(key("totalRecords"), static_cast<qint64>(s.total_records));
    obj.insert(key("eventCount"), static_cast<qint64>(s.event_count));
    obj.insert(key("categoryCount"), static_cast<qint64>(s.category_count));
    obj.insert(key("calendarCount"), static_cast<qint64>(s.calendar_count));
    return obj;
}

Result<BackupStats, Error> stats_from_json(const QJsonValue& value) {
    if (!value.isObject()) {
        return Result<BackupStats, Error>::err(Error{ErrorKind::Format, "backup stats must be an object"});
    }
    const auto obj = value.toObject();
    for (const char* field : {"totalRecords", "eventCount", "categoryCount", "calendarCount"}) {
        if (!obj.value(key(field)).isDouble()) {
            return Result<BackupStats, Error>::err(
                Error{ErrorKind::Format, std::string("backup stats.") + field + " must be a number"});
        }
    }
    return Result<BackupStats, Error>::ok(BackupStats{
        .total_records = obj.value(key("totalRecords")).toInteger(),
        .event_count = obj.value(key("eventCount")).toInteger(),
        .category_count = obj.value(key("categoryCount")).toInteger(),
        .calendar_count = obj.value(key("calendarCount")).toInteger()
    });
}

template<typename T, typename ToJson>
QJsonArray records_to_array(const std::vector<T>& records, ToJson to_json_fn) {
    QJsonArray arr;
    for (const auto& r : records) {
        arr.append(to_json_fn(r));
    }
    return arr;
}

template<typename T, typename FromJson>
Result<std::vector<T>, Error> records_from_array(const QJsonObject& data, const char* name,
                                                 FromJson from_json_fn) {
    using R = Result<std::vector<T>, Error>;
    const auto value = data.value(key(name));
    if (value.isUndefined() || value.isNull()) {
        return R::ok({});
    }
    if (!value.isArray()) {
        return R::err(Error{ErrorKind::Format, std::string("backup data.") + name + " must be an array"});
    }

    std::vector<T> records;
    const auto arr = value.toArray();
    records.reserve(static_cast<size_t>(arr.size()));
    for (qsizetype i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).isObject()) {
            return R::err(Error{ErrorKind::Format,
                                std::string("backup data.") + name + "[" + std::to_string(i) + "] is not an object"});
        }
        auto record = from_json_fn(arr.at(i).toObject());
        if (record.is_err()) {
            auto error = record.unwrap_err();
            error.message = std::string(name) + "[" + std::to_string(i) + "]: " + error.message;
            return R::err(std::move(error));
        }
        records.push_back(std::move(record).unwrap());
    }
    return R::ok(std::move(records));
}

QJsonObject body_object(const BackupData& data) {
    QJsonObject section;
    section.insert(key("events"), records_to_array(data.events, [](const Event& e) { return to_json(e); }));
    section.insert(key("categories"),
                   records_to_array(data.categories, [](const Category& c) { return to_json(c); }));
    section.insert(key("calendars"),
                   records_to_array(data.calendars, [](const Calendar& c) { return to_json(c); }));
    section.insert(key("preferences"),
                   data.preferences ? QJsonValue(to_json(*data.preferences)) : QJsonValue(QJsonValue::Null));

    QJsonObject body;
    body.insert(key("data"), section);
    body.insert(key("stats"), stats_to_json(data.stats()));
    return body;
}

QByteArray compact(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

} // namespace

BackupStats BackupData::stats() const {
    BackupStats s;
    s.event_count = static_cast<int64_t>(events.size());
    s.category_count = static_cast<int64_t>(categories.size());
    s.calendar_count = static_cast<int64_t>(calendars.size());
    s.total_records = s.event_count + s.category_count + s.calendar_count + (preferences ? 1 : 0);
    return s;
}

QByteArray serialize_body(const BackupData& data) {
    return compact(body_object(data));
}

Result<BackupData, Error> parse_body(const QByteArray& body) {
    using R = Result<BackupData, Error>;

    auto parsed = parse_json_object(body);
    if (parsed.is_err()) {
        return R::err(parsed.unwrap_err());
    }
    const auto section_value = parsed.unwrap().value(key("data"));
    if (!section_value.isObject()) {
        return R::err(Error{ErrorKind::Format, "backup has no data section"});
    }
    const auto section = section_value.toObject();

    BackupData data;

    auto events = records_from_array<Event>(section, "events", event_from_json);
    if (events.is_err()) return R::err(events.unwrap_err());
    data.events = std::move(events).unwrap();

    auto categories = records_from_array<Category>(section, "categories", category_from_json);
    if (categories.is_err()) return R::err(categories.unwrap_err());
    data.categories = std::move(categories).unwrap();

    auto calendars = records_from_array<Calendar>(section, "calendars", calendar_from_json);
    if (calendars.is_err()) return R::err(calendars.unwrap_err());
    data.calendars = std::move(calendars).unwrap();

    const auto prefs = section.value(key("preferences"));
    if (prefs.isObject()) {
        auto p = preferences_from_json(prefs.toObject());
        if (p.is_err()) return R::err(p.unwrap_err());
        data.preferences = std::move(p).unwrap();
    } else if (!prefs.isNull() && !prefs.isUndefined()) {
        return R::err(Error{ErrorKind::Format, "backup data.preferences must be an object or null"});
    }

    return R::ok(std::move(data));
}

QByteArray envelope_to_json(const BackupEnvelope& envelope) {
    QJsonObject obj;
    obj.insert(key("format"), key(BACKUP_FORMAT_NAME));
    obj.insert(key("version"), envelope.version);
    obj.insert(key("timestamp"), QString::fromStdString(envelope.timestamp.to_iso_string()));
    obj.insert(key("ownerId"), QString::fromStdString(envelope.owner_id));
    obj.insert(key("compressed"), envelope.compressed);
    obj.insert(key("encrypted"), envelope.encrypted);
    obj.insert(key("checksum"), QString::fromStdString(envelope.checksum));
    obj.insert(key("stats"), stats_to_json(envelope.stats));

    // Plain bodies stay readable; anything that does not parse goes out as base64.
    bool written_inline = false;
    if (!envelope.compressed && !envelope.encrypted) {
        auto body = parse_json_object(envelope.payload);
        if (body.is_ok() && body.unwrap().value(key("data")).isObject()) {
            obj.insert(key("data"), body.unwrap().value(key("data")));
            written_inline = true;
        }
    }
    if (!written_inline) {
        obj.insert(key("payload"), QString::fromLatin1(envelope.payload.toBase64()));
    }
    return QJsonDocument(obj).toJson(QJsonDocument::Indented);
}

Result<BackupEnvelope, Error> envelope_from_json(const QByteArray& bytes) {
    using R = Result<BackupEnvelope, Error>;

    auto parsed = parse_json_object(bytes);
    if (parsed.is_err()) {
        return R::err(Error{ErrorKind::Format, "Invalid backup file: " + parsed.unwrap_err().message});
    }
    const auto& obj = parsed.unwrap();

    if (obj.value(key("format")).toString() != key(BACKUP_FORMAT_NAME)) {
        return R::err(Error{ErrorKind::Format, "Invalid backup file: not an almanac backup"});
    }

    BackupEnvelope envelope;
    if (!obj.value(key("version")).isDouble() || !obj.value(key("ownerId")).isString() ||
        !obj.value(key("checksum")).isString()) {
        return R::err(Error{ErrorKind::Format, "Invalid backup file: missing version, ownerId or checksum"});
    }
    envelope.version = obj.value(key("version")).toInt();
    envelope.owner_id = obj.value(key("ownerId")).toString().toStdString();
    envelope.checksum = obj.value(key("checksum")).toString().toStdString();
    envelope.compressed = obj.value(key("compressed")).toBool(false);
    envelope.encrypted = obj.value(key("encrypted")).toBool(false);

    const auto when = QDateTime::fromString(obj.value(key("timestamp")).toString(), Qt::ISODateWithMs);
    if (!when.isValid()) {
        return R::err(Error{ErrorKind::Format, "Invalid backup file: bad timestamp"});
    }
    envelope.timestamp = Timestamp(when.toMSecsSinceEpoch());

    auto stats = stats_from_json(obj.value(key("stats")));
    if (stats.is_err()) {
        return R::err(stats.unwrap_err());
    }
    envelope.stats = stats.unwrap();

    const auto payload = obj.value(key("payload"));
    if (payload.isString()) {
        auto decoded = QByteArray::fromBase64Encoding(payload.toString().toLatin1(),
                                                      QByteArray::AbortOnBase64DecodingErrors);
        if (!decoded) {
            return R::err(Error{ErrorKind::Format, "Invalid backup file: payload is not base64"});
        }
        envelope.payload = *decoded;
    } else if (obj.value(key("data")).isObject()) {
        QJsonObject body;
        body.insert(key("data"), obj.value(key("data")));
        body.insert(key("stats"), obj.value(key("stats")));
        envelope.payload = compact(body);
    } else {
        return R::err(Error{ErrorKind::Format, "Invalid backup file: no data or payload"});
    }

    return R::ok(std::move(envelope));
}

std::string backup_file_name(const std::string& owner_id, Timestamp timestamp) {
    std::string owner = owner_id;
    std::replace_if(owner.begin(), owner.end(), [](char c) {
        return c == '/' || c == '\\' || c == ':' || c == ' ';
    }, '_');
    return "almanac-backup-" + owner + "-" + timestamp.to_compact_string() + ".json";
}

} // namespace almanac::backup
