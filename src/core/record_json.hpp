#pragma once

#include "core/records.hpp"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <string>
#include <string_view>
#include <vector>

namespace almanac {

// Record <-> JSON. Keys are camelCase; timestamps are epoch milliseconds;
// unset optional fields are omitted. QJsonObject keeps keys sorted, so
// serializing the same record always yields the same bytes.

[[nodiscard]] QJsonObject to_json(const Event& event);
[[nodiscard]] QJsonObject to_json(const Category& category);
[[nodiscard]] QJsonObject to_json(const Calendar& calendar);
[[nodiscard]] QJsonObject to_json(const Preferences& preferences);
[[nodiscard]] QJsonObject to_json(const RecurrenceRule& rule);
[[nodiscard]] QJsonObject to_json(const EventPatch& patch);

/**
 * Parse an event. `title` and `startTime` are required; everything else
 * falls back to the Event defaults. Wrong value types are Format errors.
 */
[[nodiscard]] Result<Event, Error> event_from_json(const QJsonObject& obj);
[[nodiscard]] Result<Category, Error> category_from_json(const QJsonObject& obj);
[[nodiscard]] Result<Calendar, Error> calendar_from_json(const QJsonObject& obj);
[[nodiscard]] Result<Preferences, Error> preferences_from_json(const QJsonObject& obj);
[[nodiscard]] Result<RecurrenceRule, Error> recurrence_from_json(const QJsonObject& obj);

// Column codecs for the JSON-valued columns of the events table.
[[nodiscard]] std::string reminders_to_string(const std::vector<Reminder>& reminders);
[[nodiscard]] std::vector<Reminder> reminders_from_string(std::string_view json);
[[nodiscard]] std::string strings_to_string(const std::vector<std::string>& values);
[[nodiscard]] std::vector<std::string> strings_from_string(std::string_view json);
[[nodiscard]] std::string ints_to_string(const std::vector<int>& values);
[[nodiscard]] std::vector<int> ints_from_string(std::string_view json);
[[nodiscard]] std::optional<RecurrenceRule> recurrence_from_string(std::string_view json);

[[nodiscard]] std::string to_compact_json(const QJsonObject& obj);
[[nodiscard]] Result<QJsonObject, Error> parse_json_object(const QByteArray& bytes);
[[nodiscard]] Result<QJsonObject, Error> parse_json_object(std::string_view text);

} // namespace almanac
