#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace almanac {

/**
 * Local row identifier assigned by the store. 0 means "not yet stored".
 */
using RecordId = int64_t;

/**
 * Sync lifecycle of a record. Created records start Local; any later
 * mutation flips them to Pending; only the sync collaborator's
 * acknowledgment (Store::mark_synced) moves them to Synced.
 */
enum class SyncStatus {
    Local,
    Pending,
    Synced,
    Conflict
};

[[nodiscard]] constexpr std::string_view to_string(SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::Local: return "local";
        case SyncStatus::Pending: return "pending";
        case SyncStatus::Synced: return "synced";
        case SyncStatus::Conflict: return "conflict";
    }
    return "local";
}

[[nodiscard]] inline std::optional<SyncStatus> parse_sync_status(std::string_view s) {
    if (s == "local") return SyncStatus::Local;
    if (s == "pending") return SyncStatus::Pending;
    if (s == "synced") return SyncStatus::Synced;
    if (s == "conflict") return SyncStatus::Conflict;
    return std::nullopt;
}

/**
 * The record kinds the store persists and the outbox refers to.
 */
enum class EntityKind {
    Event,
    Category,
    Calendar,
    Preferences
};

[[nodiscard]] constexpr std::string_view to_string(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Event: return "event";
        case EntityKind::Category: return "category";
        case EntityKind::Calendar: return "calendar";
        case EntityKind::Preferences: return "preferences";
    }
    return "event";
}

[[nodiscard]] inline std::optional<EntityKind> parse_entity_kind(std::string_view s) {
    if (s == "event") return EntityKind::Event;
    if (s == "category") return EntityKind::Category;
    if (s == "calendar") return EntityKind::Calendar;
    if (s == "preferences") return EntityKind::Preferences;
    return std::nullopt;
}

enum class Frequency {
    Daily,
    Weekly,
    Monthly,
    Yearly
};

[[nodiscard]] constexpr std::string_view to_string(Frequency f) noexcept {
    switch (f) {
        case Frequency::Daily: return "daily";
        case Frequency::Weekly: return "weekly";
        case Frequency::Monthly: return "monthly";
        case Frequency::Yearly: return "yearly";
    }
    return "daily";
}

[[nodiscard]] inline std::optional<Frequency> parse_frequency(std::string_view s) {
    if (s == "daily") return Frequency::Daily;
    if (s == "weekly") return Frequency::Weekly;
    if (s == "monthly") return Frequency::Monthly;
    if (s == "yearly") return Frequency::Yearly;
    return std::nullopt;
}

struct RecurrenceRule {
    Frequency frequency{Frequency::Weekly};
    int interval{1};
    std::optional<int> count;
    std::optional<Timestamp> until;
    std::vector<std::string> by_day;
    std::vector<int> by_month;
    std::vector<int> by_month_day;

    bool operator==(const RecurrenceRule&) const = default;
};

enum class ReminderType {
    Notification,
    Email
};

struct Reminder {
    ReminderType type{ReminderType::Notification};
    int minutes_before{15};

    bool operator==(const Reminder&) const = default;
};

struct Event {
    RecordId id{0};
    std::optional<std::string> remote_id;
    std::string owner_id;
    std::string title;
    std::optional<std::string> description;
    std::optional<std::string> location;
    Timestamp start_time;
    std::optional<Timestamp> end_time;
    bool all_day{false};
    std::optional<std::string> color;
    std::optional<std::string> category_id;
    std::optional<RecurrenceRule> recurrence;
    std::vector<Reminder> reminders;
    std::vector<std::string> attendees;
    std::string metadata_json{"{}"};
    SyncStatus sync_status{SyncStatus::Local};
    Timestamp last_modified;
    Timestamp created_at;
    Timestamp updated_at;
    bool is_deleted{false};

    bool operator==(const Event&) const = default;
};

/**
 * Partial update of an Event. An engaged member replaces the field; for
 * nullable fields an engaged-but-empty inner optional clears it.
 */
struct EventPatch {
    std::optional<std::string> title;
    std::optional<std::optional<std::string>> description;
    std::optional<std::optional<std::string>> location;
    std::optional<Timestamp> start_time;
    std::optional<std::optional<Timestamp>> end_time;
    std::optional<bool> all_day;
    std::optional<std::optional<std::string>> color;
    std::optional<std::optional<std::string>> category_id;
    std::optional<std::optional<RecurrenceRule>> recurrence;
    std::optional<std::vector<Reminder>> reminders;
    std::optional<std::vector<std::string>> attendees;
    std::optional<std::string> metadata_json;

    [[nodiscard]] bool empty() const {
        return !title && !description && !location && !start_time && !end_time &&
               !all_day && !color && !category_id && !recurrence && !reminders &&
               !attendees && !metadata_json;
    }
};

struct Category {
    RecordId id{0};
    std::optional<std::string> remote_id;
    std::string owner_id;
    std::string name;
    std::string color{"#3b82f6"};
    std::optional<std::string> icon;
    SyncStatus sync_status{SyncStatus::Local};
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Category&) const = default;
};

struct CategoryPatch {
    std::optional<std::string> name;
    std::optional<std::string> color;
    std::optional<std::optional<std::string>> icon;
};

struct Calendar {
    RecordId id{0};
    std::optional<std::string> remote_id;
    std::string owner_id;
    std::string name;
    std::optional<std::string> description;
    std::string color{"#3b82f6"};
    bool is_default{false};
    bool is_shared{false};
    SyncStatus sync_status{SyncStatus::Local};
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Calendar&) const = default;
};

struct CalendarPatch {
    std::optional<std::string> name;
    std::optional<std::optional<std::string>> description;
    std::optional<std::string> color;
    std::optional<bool> is_default;
    std::optional<bool> is_shared;
};

struct WorkingHours {
    std::string start{"09:00"};
    std::string end{"17:00"};

    bool operator==(const WorkingHours&) const = default;
};

/**
 * Per-owner settings. One row per owner.
 */
struct Preferences {
    RecordId id{0};
    std::string owner_id;
    std::string theme{"auto"};
    int first_day_of_week{0};
    std::string time_format{"12"};
    std::string timezone{"UTC"};
    int default_event_duration{60};
    std::vector<int> weekend_days{0, 6};
    WorkingHours working_hours;
    std::optional<Timestamp> last_sync_time;
    bool offline_mode{false};
    bool auto_sync{true};
    int sync_interval_minutes{5};

    bool operator==(const Preferences&) const = default;
};

struct PreferencesPatch {
    std::optional<std::string> theme;
    std::optional<int> first_day_of_week;
    std::optional<std::string> time_format;
    std::optional<std::string> timezone;
    std::optional<int> default_event_duration;
    std::optional<std::vector<int>> weekend_days;
    std::optional<WorkingHours> working_hours;
    std::optional<std::optional<Timestamp>> last_sync_time;
    std::optional<bool> offline_mode;
    std::optional<bool> auto_sync;
    std::optional<int> sync_interval_minutes;
};

/**
 * Half-open query window [start, end) over event start times.
 */
struct TimeRange {
    Timestamp start;
    Timestamp end;
};

// ============================================================================
// Factories
// ============================================================================

[[nodiscard]] inline Event create_event(std::string owner_id, std::string title,
                                        Timestamp start_time,
                                        std::optional<Timestamp> end_time = std::nullopt) {
    Event e;
    e.owner_id = std::move(owner_id);
    e.title = std::move(title);
    e.start_time = start_time;
    e.end_time = end_time;
    return e;
}

[[nodiscard]] inline Category create_category(std::string owner_id, std::string name,
                                              std::string color = "#3b82f6") {
    return Category{
        .owner_id = std::move(owner_id),
        .name = std::move(name),
        .color = std::move(color)
    };
}

[[nodiscard]] inline Calendar create_calendar(std::string owner_id, std::string name,
                                              bool is_default = false) {
    return Calendar{
        .owner_id = std::move(owner_id),
        .name = std::move(name),
        .is_default = is_default
    };
}

[[nodiscard]] inline Preferences default_preferences(std::string owner_id) {
    Preferences p;
    p.owner_id = std::move(owner_id);
    return p;
}

/**
 * The string other records use to point at a category: the remote id once
 * the category has been acknowledged, the local id before that.
 */
[[nodiscard]] inline std::string category_ref(const Category& category) {
    return category.remote_id.value_or(std::to_string(category.id));
}

// ============================================================================
// Patch application (pure)
// ============================================================================

[[nodiscard]] inline Event apply_patch(Event e, const EventPatch& p) {
    if (p.title) e.title = *p.title;
    if (p.description) e.description = *p.description;
    if (p.location) e.location = *p.location;
    if (p.start_time) e.start_time = *p.start_time;
    if (p.end_time) e.end_time = *p.end_time;
    if (p.all_day) e.all_day = *p.all_day;
    if (p.color) e.color = *p.color;
    if (p.category_id) e.category_id = *p.category_id;
    if (p.recurrence) e.recurrence = *p.recurrence;
    if (p.reminders) e.reminders = *p.reminders;
    if (p.attendees) e.attendees = *p.attendees;
    if (p.metadata_json) e.metadata_json = *p.metadata_json;
    return e;
}

[[nodiscard]] inline Category apply_patch(Category c, const CategoryPatch& p) {
    if (p.name) c.name = *p.name;
    if (p.color) c.color = *p.color;
    if (p.icon) c.icon = *p.icon;
    return c;
}

[[nodiscard]] inline Calendar apply_patch(Calendar c, const CalendarPatch& p) {
    if (p.name) c.name = *p.name;
    if (p.description) c.description = *p.description;
    if (p.color) c.color = *p.color;
    if (p.is_default) c.is_default = *p.is_default;
    if (p.is_shared) c.is_shared = *p.is_shared;
    return c;
}

[[nodiscard]] inline Preferences apply_patch(Preferences prefs, const PreferencesPatch& p) {
    if (p.theme) prefs.theme = *p.theme;
    if (p.first_day_of_week) prefs.first_day_of_week = *p.first_day_of_week;
    if (p.time_format) prefs.time_format = *p.time_format;
    if (p.timezone) prefs.timezone = *p.timezone;
    if (p.default_event_duration) prefs.default_event_duration = *p.default_event_duration;
    if (p.weekend_days) prefs.weekend_days = *p.weekend_days;
    if (p.working_hours) prefs.working_hours = *p.working_hours;
    if (p.last_sync_time) prefs.last_sync_time = *p.last_sync_time;
    if (p.offline_mode) prefs.offline_mode = *p.offline_mode;
    if (p.auto_sync) prefs.auto_sync = *p.auto_sync;
    if (p.sync_interval_minutes) prefs.sync_interval_minutes = *p.sync_interval_minutes;
    return prefs;
}

// ============================================================================
// Validation
// ============================================================================

[[nodiscard]] inline Result<void, Error> validate(const Event& e) {
    if (e.owner_id.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "event owner is required"});
    }
    if (e.title.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "event title is required"});
    }
    if (e.end_time && *e.end_time < e.start_time) {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation, "event end time precedes start time"});
    }
    if (e.recurrence && e.recurrence->interval < 1) {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation, "recurrence interval must be positive"});
    }
    return Result<void, Error>::ok();
}

[[nodiscard]] inline Result<void, Error> validate(const Category& c) {
    if (c.owner_id.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "category owner is required"});
    }
    if (c.name.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "category name is required"});
    }
    return Result<void, Error>::ok();
}

[[nodiscard]] inline Result<void, Error> validate(const Calendar& c) {
    if (c.owner_id.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "calendar owner is required"});
    }
    if (c.name.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "calendar name is required"});
    }
    return Result<void, Error>::ok();
}

[[nodiscard]] inline Result<void, Error> validate(const Preferences& p) {
    if (p.owner_id.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "preferences owner is required"});
    }
    if (p.theme != "light" && p.theme != "dark" && p.theme != "auto") {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "unknown theme: " + p.theme});
    }
    if (p.time_format != "12" && p.time_format != "24") {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation, "time format must be 12 or 24"});
    }
    if (p.first_day_of_week < 0 || p.first_day_of_week > 6) {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation, "first day of week must be 0-6"});
    }
    return Result<void, Error>::ok();
}

} // namespace almanac
