#include "core/record_json.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace almanac {
namespace {

QString qs(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

QString key(const char* k) {
    return QString::fromLatin1(k);
}

void put_optional(QJsonObject& obj, const char* k, const std::optional<std::string>& v) {
    if (v) obj.insert(key(k), qs(*v));
}

void put_optional(QJsonObject& obj, const char* k, const std::optional<Timestamp>& v) {
    if (v) obj.insert(key(k), static_cast<qint64>(v->millis()));
}

Error format_error(std::string_view record, const char* field, std::string_view expected) {
    return Error{ErrorKind::Format,
                 std::string(record) + "." + field + " must be " + std::string(expected)};
}

// Readers return false on a type mismatch and leave `out` untouched.
bool read_string(const QJsonObject& obj, const char* k, std::string& out) {
    const auto v = obj.value(key(k));
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isString()) return false;
    out = v.toString().toStdString();
    return true;
}

bool read_optional_string(const QJsonObject& obj, const char* k, std::optional<std::string>& out) {
    const auto v = obj.value(key(k));
    if (v.isUndefined() || v.isNull()) {
        out.reset();
        return true;
    }
    if (!v.isString()) return false;
    out = v.toString().toStdString();
    return true;
}

bool read_int(const QJsonObject& obj, const char* k, int& out) {
    const auto v = obj.value(key(k));
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isDouble()) return false;
    out = v.toInt(out);
    return true;
}

bool read_bool(const QJsonObject& obj, const char* k, bool& out) {
    const auto v = obj.value(key(k));
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isBool()) return false;
    out = v.toBool();
    return true;
}

bool read_timestamp(const QJsonObject& obj, const char* k, Timestamp& out) {
    const auto v = obj.value(key(k));
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isDouble()) return false;
    out = Timestamp(v.toInteger());
    return true;
}

bool read_optional_timestamp(const QJsonObject& obj, const char* k, std::optional<Timestamp>& out) {
    const auto v = obj.value(key(k));
    if (v.isUndefined() || v.isNull()) {
        out.reset();
        return true;
    }
    if (!v.isDouble()) return false;
    out = Timestamp(v.toInteger());
    return true;
}

QJsonArray to_array(const std::vector<std::string>& values) {
    QJsonArray arr;
    for (const auto& v : values) arr.append(qs(v));
    return arr;
}

QJsonArray to_array(const std::vector<int>& values) {
    QJsonArray arr;
    for (int v : values) arr.append(v);
    return arr;
}

bool read_strings(const QJsonObject& obj, const char* k, std::vector<std::string>& out) {
    const auto v = obj.value(key(k));
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isArray()) return false;
    std::vector<std::string> values;
    for (const auto& item : v.toArray()) {
        if (!item.isString()) return false;
        values.push_back(item.toString().toStdString());
    }
    out = std::move(values);
    return true;
}

bool read_ints(const QJsonObject& obj, const char* k, std::vector<int>& out) {
    const auto v = obj.value(key(k));
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isArray()) return false;
    std::vector<int> values;
    for (const auto& item : v.toArray()) {
        if (!item.isDouble()) return false;
        values.push_back(item.toInt());
    }
    out = std::move(values);
    return true;
}

QJsonObject to_json(const Reminder& r) {
    QJsonObject obj;
    obj.insert(key("type"), r.type == ReminderType::Email ? QStringLiteral("email")
                                                          : QStringLiteral("notification"));
    obj.insert(key("minutesBefore"), r.minutes_before);
    return obj;
}

QJsonArray to_array(const std::vector<Reminder>& reminders) {
    QJsonArray arr;
    for (const auto& r : reminders) arr.append(to_json(r));
    return arr;
}

bool read_reminders(const QJsonValue& v, std::vector<Reminder>& out) {
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isArray()) return false;
    std::vector<Reminder> reminders;
    for (const auto& item : v.toArray()) {
        if (!item.isObject()) return false;
        const auto obj = item.toObject();
        Reminder r;
        std::string type = "notification";
        if (!read_string(obj, "type", type) || !read_int(obj, "minutesBefore", r.minutes_before)) {
            return false;
        }
        if (type == "email") {
            r.type = ReminderType::Email;
        } else if (type == "notification") {
            r.type = ReminderType::Notification;
        } else {
            return false;
        }
        reminders.push_back(r);
    }
    out = std::move(reminders);
    return true;
}

std::string document_string(const QJsonDocument& doc) {
    return doc.toJson(QJsonDocument::Compact).toStdString();
}

QJsonDocument parse_document(std::string_view json) {
    return QJsonDocument::fromJson(QByteArray(json.data(), static_cast<qsizetype>(json.size())));
}

} // namespace

// ============================================================================
// Records -> JSON
// ============================================================================

QJsonObject to_json(const RecurrenceRule& rule) {
    QJsonObject obj;
    obj.insert(key("frequency"), qs(to_string(rule.frequency)));
    obj.insert(key("interval"), rule.interval);
    if (rule.count) obj.insert(key("count"), *rule.count);
    put_optional(obj, "until", rule.until);
    if (!rule.by_day.empty()) obj.insert(key("byDay"), to_array(rule.by_day));
    if (!rule.by_month.empty()) obj.insert(key("byMonth"), to_array(rule.by_month));
    if (!rule.by_month_day.empty()) obj.insert(key("byMonthDay"), to_array(rule.by_month_day));
    return obj;
}

QJsonObject to_json(const Event& e) {
    QJsonObject obj;
    obj.insert(key("id"), static_cast<qint64>(e.id));
    put_optional(obj, "remoteId", e.remote_id);
    obj.insert(key("ownerId"), qs(e.owner_id));
    obj.insert(key("title"), qs(e.title));
    put_optional(obj, "description", e.description);
    put_optional(obj, "location", e.location);
    obj.insert(key("startTime"), static_cast<qint64>(e.start_time.millis()));
    put_optional(obj, "endTime", e.end_time);
    obj.insert(key("allDay"), e.all_day);
    put_optional(obj, "color", e.color);
    put_optional(obj, "categoryId", e.category_id);
    if (e.recurrence) obj.insert(key("recurrence"), to_json(*e.recurrence));
    obj.insert(key("reminders"), to_array(e.reminders));
    obj.insert(key("attendees"), to_array(e.attendees));
    if (e.metadata_json != "{}" && !e.metadata_json.empty()) {
        obj.insert(key("metadata"), parse_document(e.metadata_json).object());
    }
    obj.insert(key("syncStatus"), qs(to_string(e.sync_status)));
    obj.insert(key("lastModified"), static_cast<qint64>(e.last_modified.millis()));
    obj.insert(key("createdAt"), static_cast<qint64>(e.created_at.millis()));
    obj.insert(key("updatedAt"), static_cast<qint64>(e.updated_at.millis()));
    obj.insert(key("isDeleted"), e.is_deleted);
    return obj;
}

QJsonObject to_json(const Category& c) {
    QJsonObject obj;
    obj.insert(key("id"), static_cast<qint64>(c.id));
    put_optional(obj, "remoteId", c.remote_id);
    obj.insert(key("ownerId"), qs(c.owner_id));
    obj.insert(key("name"), qs(c.name));
    obj.insert(key("color"), qs(c.color));
    put_optional(obj, "icon", c.icon);
    obj.insert(key("syncStatus"), qs(to_string(c.sync_status)));
    obj.insert(key("createdAt"), static_cast<qint64>(c.created_at.millis()));
    obj.insert(key("updatedAt"), static_cast<qint64>(c.updated_at.millis()));
    return obj;
}

QJsonObject to_json(const Calendar& c) {
    QJsonObject obj;
    obj.insert(key("id"), static_cast<qint64>(c.id));
    put_optional(obj, "remoteId", c.remote_id);
    obj.insert(key("ownerId"), qs(c.owner_id));
    obj.insert(key("name"), qs(c.name));
    put_optional(obj, "description", c.description);
    obj.insert(key("color"), qs(c.color));
    obj.insert(key("isDefault"), c.is_default);
    obj.insert(key("isShared"), c.is_shared);
    obj.insert(key("syncStatus"), qs(to_string(c.sync_status)));
    obj.insert(key("createdAt"), static_cast<qint64>(c.created_at.millis()));
    obj.insert(key("updatedAt"), static_cast<qint64>(c.updated_at.millis()));
    return obj;
}

QJsonObject to_json(const Preferences& p) {
    QJsonObject hours;
    hours.insert(key("start"), qs(p.working_hours.start));
    hours.insert(key("end"), qs(p.working_hours.end));

    QJsonObject obj;
    obj.insert(key("ownerId"), qs(p.owner_id));
    obj.insert(key("theme"), qs(p.theme));
    obj.insert(key("firstDayOfWeek"), p.first_day_of_week);
    obj.insert(key("timeFormat"), qs(p.time_format));
    obj.insert(key("timezone"), qs(p.timezone));
    obj.insert(key("defaultEventDuration"), p.default_event_duration);
    obj.insert(key("weekendDays"), to_array(p.weekend_days));
    obj.insert(key("workingHours"), hours);
    put_optional(obj, "lastSyncTime", p.last_sync_time);
    obj.insert(key("offlineMode"), p.offline_mode);
    obj.insert(key("autoSync"), p.auto_sync);
    obj.insert(key("syncIntervalMinutes"), p.sync_interval_minutes);
    return obj;
}

QJsonObject to_json(const EventPatch& p) {
    auto nullable = [](const auto& inner, auto convert) -> QJsonValue {
        if (!inner) return QJsonValue(QJsonValue::Null);
        return convert(*inner);
    };
    auto str = [](const std::string& s) { return QJsonValue(qs(s)); };
    auto millis = [](const Timestamp& t) { return QJsonValue(static_cast<qint64>(t.millis())); };

    QJsonObject obj;
    if (p.title) obj.insert(key("title"), qs(*p.title));
    if (p.description) obj.insert(key("description"), nullable(*p.description, str));
    if (p.location) obj.insert(key("location"), nullable(*p.location, str));
    if (p.start_time) obj.insert(key("startTime"), millis(*p.start_time));
    if (p.end_time) obj.insert(key("endTime"), nullable(*p.end_time, millis));
    if (p.all_day) obj.insert(key("allDay"), *p.all_day);
    if (p.color) obj.insert(key("color"), nullable(*p.color, str));
    if (p.category_id) obj.insert(key("categoryId"), nullable(*p.category_id, str));
    if (p.recurrence) {
        obj.insert(key("recurrence"), nullable(*p.recurrence, [](const RecurrenceRule& r) {
            return QJsonValue(to_json(r));
        }));
    }
    if (p.reminders) obj.insert(key("reminders"), to_array(*p.reminders));
    if (p.attendees) obj.insert(key("attendees"), to_array(*p.attendees));
    if (p.metadata_json) obj.insert(key("metadata"), parse_document(*p.metadata_json).object());
    return obj;
}

// ============================================================================
// JSON -> records
// ============================================================================

Result<RecurrenceRule, Error> recurrence_from_json(const QJsonObject& obj) {
    using R = Result<RecurrenceRule, Error>;
    RecurrenceRule rule;

    std::string frequency = "weekly";
    if (!read_string(obj, "frequency", frequency)) {
        return R::err(format_error("recurrence", "frequency", "a string"));
    }
    auto parsed = parse_frequency(frequency);
    if (!parsed) {
        return R::err(Error{ErrorKind::Format, "unknown recurrence frequency: " + frequency});
    }
    rule.frequency = *parsed;

    if (!read_int(obj, "interval", rule.interval)) {
        return R::err(format_error("recurrence", "interval", "a number"));
    }
    if (obj.contains(key("count")) && !obj.value(key("count")).isNull()) {
        int count = 0;
        if (!read_int(obj, "count", count)) {
            return R::err(format_error("recurrence", "count", "a number"));
        }
        rule.count = count;
    }
    if (!read_optional_timestamp(obj, "until", rule.until)) {
        return R::err(format_error("recurrence", "until", "a timestamp"));
    }
    if (!read_strings(obj, "byDay", rule.by_day) ||
        !read_ints(obj, "byMonth", rule.by_month) ||
        !read_ints(obj, "byMonthDay", rule.by_month_day)) {
        return R::err(Error{ErrorKind::Format, "recurrence by-lists must be arrays"});
    }
    return R::ok(std::move(rule));
}

Result<Event, Error> event_from_json(const QJsonObject& obj) {
    using R = Result<Event, Error>;

    const auto title = obj.value(key("title"));
    if (!title.isString()) {
        return R::err(format_error("event", "title", "a string"));
    }
    const auto start = obj.value(key("startTime"));
    if (!start.isDouble()) {
        return R::err(format_error("event", "startTime", "a number"));
    }

    Event e;
    e.title = title.toString().toStdString();
    e.start_time = Timestamp(start.toInteger());

    const auto id = obj.value(key("id"));
    if (id.isDouble()) e.id = id.toInteger();

    if (!read_optional_string(obj, "remoteId", e.remote_id)) {
        return R::err(format_error("event", "remoteId", "a string"));
    }
    if (!read_string(obj, "ownerId", e.owner_id)) {
        return R::err(format_error("event", "ownerId", "a string"));
    }
    if (!read_optional_string(obj, "description", e.description)) {
        return R::err(format_error("event", "description", "a string"));
    }
    if (!read_optional_string(obj, "location", e.location)) {
        return R::err(format_error("event", "location", "a string"));
    }
    if (!read_optional_timestamp(obj, "endTime", e.end_time)) {
        return R::err(format_error("event", "endTime", "a number"));
    }
    if (!read_bool(obj, "allDay", e.all_day)) {
        return R::err(format_error("event", "allDay", "a boolean"));
    }
    if (!read_optional_string(obj, "color", e.color)) {
        return R::err(format_error("event", "color", "a string"));
    }
    if (!read_optional_string(obj, "categoryId", e.category_id)) {
        return R::err(format_error("event", "categoryId", "a string"));
    }

    const auto recurrence = obj.value(key("recurrence"));
    if (recurrence.isObject()) {
        auto rule = recurrence_from_json(recurrence.toObject());
        if (rule.is_err()) return R::err(rule.unwrap_err());
        e.recurrence = std::move(rule).unwrap();
    } else if (!recurrence.isUndefined() && !recurrence.isNull()) {
        return R::err(format_error("event", "recurrence", "an object"));
    }

    if (!read_reminders(obj.value(key("reminders")), e.reminders)) {
        return R::err(format_error("event", "reminders", "an array of reminders"));
    }
    if (!read_strings(obj, "attendees", e.attendees)) {
        return R::err(format_error("event", "attendees", "an array of strings"));
    }

    const auto metadata = obj.value(key("metadata"));
    if (metadata.isObject()) {
        e.metadata_json = to_compact_json(metadata.toObject());
    }

    std::string status = "local";
    if (!read_string(obj, "syncStatus", status)) {
        return R::err(format_error("event", "syncStatus", "a string"));
    }
    e.sync_status = parse_sync_status(status).value_or(SyncStatus::Local);

    if (!read_timestamp(obj, "lastModified", e.last_modified) ||
        !read_timestamp(obj, "createdAt", e.created_at) ||
        !read_timestamp(obj, "updatedAt", e.updated_at)) {
        return R::err(Error{ErrorKind::Format, "event timestamps must be numbers"});
    }
    if (!read_bool(obj, "isDeleted", e.is_deleted)) {
        return R::err(format_error("event", "isDeleted", "a boolean"));
    }
    return R::ok(std::move(e));
}

Result<Category, Error> category_from_json(const QJsonObject& obj) {
    using R = Result<Category, Error>;
    Category c;
    const auto id = obj.value(key("id"));
    if (id.isDouble()) c.id = id.toInteger();

    std::string status = "local";
    if (!read_optional_string(obj, "remoteId", c.remote_id) ||
        !read_string(obj, "ownerId", c.owner_id) ||
        !read_string(obj, "name", c.name) ||
        !read_string(obj, "color", c.color) ||
        !read_optional_string(obj, "icon", c.icon) ||
        !read_string(obj, "syncStatus", status)) {
        return R::err(Error{ErrorKind::Format, "category fields must be strings"});
    }
    if (!read_timestamp(obj, "createdAt", c.created_at) ||
        !read_timestamp(obj, "updatedAt", c.updated_at)) {
        return R::err(Error{ErrorKind::Format, "category timestamps must be numbers"});
    }
    c.sync_status = parse_sync_status(status).value_or(SyncStatus::Local);
    return R::ok(std::move(c));
}

Result<Calendar, Error> calendar_from_json(const QJsonObject& obj) {
    using R = Result<Calendar, Error>;
    Calendar c;
    const auto id = obj.value(key("id"));
    if (id.isDouble()) c.id = id.toInteger();

    std::string status = "local";
    if (!read_optional_string(obj, "remoteId", c.remote_id) ||
        !read_string(obj, "ownerId", c.owner_id) ||
        !read_string(obj, "name", c.name) ||
        !read_optional_string(obj, "description", c.description) ||
        !read_string(obj, "color", c.color) ||
        !read_string(obj, "syncStatus", status)) {
        return R::err(Error{ErrorKind::Format, "calendar fields must be strings"});
    }
    if (!read_bool(obj, "isDefault", c.is_default) || !read_bool(obj, "isShared", c.is_shared)) {
        return R::err(Error{ErrorKind::Format, "calendar flags must be booleans"});
    }
    if (!read_timestamp(obj, "createdAt", c.created_at) ||
        !read_timestamp(obj, "updatedAt", c.updated_at)) {
        return R::err(Error{ErrorKind::Format, "calendar timestamps must be numbers"});
    }
    c.sync_status = parse_sync_status(status).value_or(SyncStatus::Local);
    return R::ok(std::move(c));
}

Result<Preferences, Error> preferences_from_json(const QJsonObject& obj) {
    using R = Result<Preferences, Error>;
    Preferences p;
    if (!read_string(obj, "ownerId", p.owner_id) ||
        !read_string(obj, "theme", p.theme) ||
        !read_string(obj, "timeFormat", p.time_format) ||
        !read_string(obj, "timezone", p.timezone)) {
        return R::err(Error{ErrorKind::Format, "preferences text fields must be strings"});
    }
    if (!read_int(obj, "firstDayOfWeek", p.first_day_of_week) ||
        !read_int(obj, "defaultEventDuration", p.default_event_duration) ||
        !read_int(obj, "syncIntervalMinutes", p.sync_interval_minutes)) {
        return R::err(Error{ErrorKind::Format, "preferences numeric fields must be numbers"});
    }
    if (!read_ints(obj, "weekendDays", p.weekend_days)) {
        return R::err(format_error("preferences", "weekendDays", "an array of numbers"));
    }
    const auto hours = obj.value(key("workingHours"));
    if (hours.isObject()) {
        const auto h = hours.toObject();
        if (!read_string(h, "start", p.working_hours.start) ||
            !read_string(h, "end", p.working_hours.end)) {
            return R::err(format_error("preferences", "workingHours", "{start, end} strings"));
        }
    }
    if (!read_optional_timestamp(obj, "lastSyncTime", p.last_sync_time)) {
        return R::err(format_error("preferences", "lastSyncTime", "a number"));
    }
    if (!read_bool(obj, "offlineMode", p.offline_mode) ||
        !read_bool(obj, "autoSync", p.auto_sync)) {
        return R::err(Error{ErrorKind::Format, "preferences flags must be booleans"});
    }
    return R::ok(std::move(p));
}

// ============================================================================
// Column codecs
// ============================================================================

std::string reminders_to_string(const std::vector<Reminder>& reminders) {
    return document_string(QJsonDocument(to_array(reminders)));
}

std::vector<Reminder> reminders_from_string(std::string_view json) {
    std::vector<Reminder> reminders;
    const auto doc = parse_document(json);
    if (doc.isArray() && read_reminders(QJsonValue(doc.array()), reminders)) {
        return reminders;
    }
    return {};
}

std::string strings_to_string(const std::vector<std::string>& values) {
    return document_string(QJsonDocument(to_array(values)));
}

std::vector<std::string> strings_from_string(std::string_view json) {
    std::vector<std::string> values;
    const auto doc = parse_document(json);
    if (!doc.isArray()) return values;
    for (const auto& item : doc.array()) {
        if (item.isString()) values.push_back(item.toString().toStdString());
    }
    return values;
}

std::string ints_to_string(const std::vector<int>& values) {
    return document_string(QJsonDocument(to_array(values)));
}

std::vector<int> ints_from_string(std::string_view json) {
    std::vector<int> values;
    const auto doc = parse_document(json);
    if (!doc.isArray()) return values;
    for (const auto& item : doc.array()) {
        if (item.isDouble()) values.push_back(item.toInt());
    }
    return values;
}

std::optional<RecurrenceRule> recurrence_from_string(std::string_view json) {
    if (json.empty()) return std::nullopt;
    const auto doc = parse_document(json);
    if (!doc.isObject()) return std::nullopt;
    auto rule = recurrence_from_json(doc.object());
    if (rule.is_err()) return std::nullopt;
    return std::move(rule).unwrap();
}

std::string to_compact_json(const QJsonObject& obj) {
    return document_string(QJsonDocument(obj));
}

Result<QJsonObject, Error> parse_json_object(const QByteArray& bytes) {
    QJsonParseError error{};
    const auto doc = QJsonDocument::fromJson(bytes, &error);
    if (error.error != QJsonParseError::NoError) {
        return Result<QJsonObject, Error>::err(
            Error{ErrorKind::Format, "invalid JSON: " + error.errorString().toStdString()});
    }
    if (!doc.isObject()) {
        return Result<QJsonObject, Error>::err(Error{ErrorKind::Format, "expected a JSON object"});
    }
    return Result<QJsonObject, Error>::ok(doc.object());
}

Result<QJsonObject, Error> parse_json_object(std::string_view text) {
    return parse_json_object(QByteArray(text.data(), static_cast<qsizetype>(text.size())));
}

} // namespace almanac
