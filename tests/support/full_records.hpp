#pragma once

#include "support/store_fixture.hpp"
#include "core/record_json.hpp"
#include <QJsonObject>
#include <string>
#include <vector>

namespace almanac::test {

/**
 * Every record kind of one owner with every optional field set and every
 * sync state represented (local, pending, synced, conflict, soft-deleted).
 */
inline void seed_full_owner(StoreFixture& f, const std::string& owner) {
    auto& store = *f;
    const auto base = f.clock->now();

    auto health = create_category(owner, "Health", "#ef4444");
    health.icon = "heart";
    health = store.create_category(health).unwrap();
    REQUIRE(store.mark_synced(EntityKind::Category, health.id, "cat-" + owner + "-1").is_ok());
    REQUIRE(store.create_category(create_category(owner, "Work")).is_ok());
    const auto health_ref = category_ref(store.get_category(health.id).unwrap().value());

    f.clock->advance(std::chrono::minutes(1));
    auto checkup = create_event(owner, "Checkup", base + std::chrono::hours(2), base + std::chrono::hours(3));
    checkup.description = "Annual";
    checkup.location = "Clinic, 2nd floor";
    checkup.color = "#10b981";
    checkup.category_id = health_ref;
    checkup.recurrence = RecurrenceRule{
        .frequency = Frequency::Monthly,
        .interval = 2,
        .count = 6,
        .by_month = {1, 6},
        .by_month_day = {1, 15}
    };
    checkup.reminders = {Reminder{ReminderType::Notification, 10}, Reminder{ReminderType::Email, 1440}};
    checkup.attendees = {"bob@example.com", "carol@example.com"};
    checkup.metadata_json = R"({"source":"import","priority":2,"tags":["a","b"]})";
    checkup = store.create_event(checkup).unwrap();
    REQUIRE(store.mark_synced(EntityKind::Event, checkup.id, "evt-" + owner + "-1").is_ok());

    f.clock->advance(std::chrono::minutes(1));
    auto standup = create_event(owner, "Standup", base + std::chrono::hours(24));
    standup.all_day = true;
    standup.recurrence = RecurrenceRule{
        .frequency = Frequency::Weekly,
        .until = base + std::chrono::hours(24 * 90),
        .by_day = {"MO", "WE", "FR"}
    };
    standup = store.create_event(standup).unwrap();
    f.clock->advance(std::chrono::minutes(1));
    REQUIRE(store.update_event(standup.id, EventPatch{.title = "Daily standup"}).is_ok());

    f.clock->advance(std::chrono::minutes(1));
    auto cancelled = store.create_event(create_event(owner, "Cancelled", base + std::chrono::hours(30))).unwrap();
    REQUIRE(store.delete_event(cancelled.id).is_ok());

    auto disputed = store.create_event(create_event(owner, "Disputed", base + std::chrono::hours(40))).unwrap();
    QJsonObject remote;
    remote.insert(QStringLiteral("title"), QStringLiteral("Disputed (remote)"));
    REQUIRE(store.mark_conflict(disputed.id, remote).is_ok());

    auto personal = create_calendar(owner, "Personal", true);
    personal.description = "Home and family";
    personal.color = "#a855f7";
    personal = store.create_calendar(personal).unwrap();
    REQUIRE(store.mark_synced(EntityKind::Calendar, personal.id, "cal-" + owner + "-1").is_ok());
    auto team = store.create_calendar(create_calendar(owner, "Team")).unwrap();
    REQUIRE(store.update_calendar(team.id, CalendarPatch{.is_shared = true}).is_ok());

    REQUIRE(store.update_preferences(owner, PreferencesPatch{
        .theme = "dark",
        .first_day_of_week = 1,
        .time_format = "24",
        .timezone = "Europe/Berlin",
        .default_event_duration = 45,
        .weekend_days = std::vector<int>{5, 6},
        .working_hours = WorkingHours{"08:30", "16:30"},
        .last_sync_time = std::optional<Timestamp>(base - std::chrono::hours(1)),
        .offline_mode = true,
        .auto_sync = false,
        .sync_interval_minutes = 15
    }).is_ok());
}

/**
 * The owner's records (soft-deleted events included) as compact JSON with
 * the store-assigned ids left out, in store order.
 */
struct OwnerSnapshot {
    std::vector<std::string> events;
    std::vector<std::string> categories;
    std::vector<std::string> calendars;
    std::string preferences;
};

template<typename T>
std::string without_id(const T& record) {
    auto obj = to_json(record);
    obj.remove(QStringLiteral("id"));
    return to_compact_json(obj);
}

inline OwnerSnapshot snapshot_owner(storage::Store& store, const std::string& owner) {
    OwnerSnapshot s;
    for (const auto& e : store.events_for_owner(owner, true).unwrap()) {
        s.events.push_back(without_id(e));
    }
    for (const auto& c : store.categories(owner).unwrap()) {
        s.categories.push_back(without_id(c));
    }
    for (const auto& c : store.calendars(owner).unwrap()) {
        s.calendars.push_back(without_id(c));
    }
    s.preferences = without_id(store.get_preferences(owner).unwrap());
    return s;
}

inline void require_same_records(const OwnerSnapshot& before, const OwnerSnapshot& after) {
    REQUIRE(after.events == before.events);
    REQUIRE(after.categories == before.categories);
    REQUIRE(after.calendars == before.calendars);
    REQUIRE(after.preferences == before.preferences);
}

} // namespace almanac::test
