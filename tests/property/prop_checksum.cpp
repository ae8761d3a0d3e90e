#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "backup/backup_manager.hpp"
#include "support/full_records.hpp"

using namespace almanac;
using namespace almanac::backup;
using almanac::test::StoreFixture;

namespace {

rc::Gen<std::string> printable_text() {
    return rc::gen::nonEmpty(rc::gen::container<std::string>(rc::gen::inRange<char>(' ', '~')));
}

std::string printable_title() {
    return *printable_text();
}

std::optional<std::string> maybe_text() {
    if (!*rc::gen::arbitrary<bool>()) return std::nullopt;
    return printable_title();
}

Event arbitrary_event(const std::string& owner, Timestamp base, int i) {
    auto e = create_event(owner, printable_title(), base + std::chrono::minutes(*rc::gen::inRange(0, 100'000)));
    e.description = maybe_text();
    e.location = maybe_text();
    e.color = maybe_text();
    e.category_id = maybe_text();
    e.all_day = *rc::gen::arbitrary<bool>();
    if (*rc::gen::arbitrary<bool>()) {
        e.end_time = e.start_time + std::chrono::minutes(*rc::gen::inRange(0, 600));
    }
    if (*rc::gen::arbitrary<bool>()) {
        RecurrenceRule rule;
        rule.frequency = *rc::gen::element(Frequency::Daily, Frequency::Weekly, Frequency::Monthly,
                                           Frequency::Yearly);
        rule.interval = *rc::gen::inRange(1, 12);
        if (*rc::gen::arbitrary<bool>()) rule.count = *rc::gen::inRange(1, 50);
        rule.by_day = *rc::gen::container<std::vector<std::string>>(
            *rc::gen::inRange(0, 3), rc::gen::element(std::string("MO"), std::string("TU"), std::string("WE"),
                                                     std::string("TH"), std::string("FR")));
        rule.by_month_day = *rc::gen::container<std::vector<int>>(*rc::gen::inRange(0, 3),
                                                                  rc::gen::inRange(1, 29));
        e.recurrence = rule;
    }
    for (int r = *rc::gen::inRange(0, 3); r > 0; --r) {
        e.reminders.push_back(Reminder{
            *rc::gen::element(ReminderType::Notification, ReminderType::Email),
            *rc::gen::inRange(0, 10'000)});
    }
    e.attendees = *rc::gen::container<std::vector<std::string>>(*rc::gen::inRange(0, 3),
                                                                 printable_text());
    e.metadata_json = "{\"n\":" + std::to_string(i) + "}";
    return e;
}

} // namespace

TEST_CASE("Property: intact backups always verify", "[property][backup]") {
    rc::check("create then restore reports a verified checksum and identical records",
        []() {
            const auto count = *rc::gen::inRange(0, 15);
            const bool compress = *rc::gen::arbitrary<bool>();

            StoreConfig config;
            config.compression_threshold = compress ? 0 : 1 << 30;
            StoreFixture f(config);
            for (int i = 0; i < count; ++i) {
                auto created = f->create_event(arbitrary_event("alice", f.clock->now(), i));
                RC_ASSERT(created.is_ok());
                if (*rc::gen::arbitrary<bool>()) {
                    RC_ASSERT(f->mark_synced(EntityKind::Event, created.unwrap().id,
                                             "remote-" + std::to_string(i)).is_ok());
                }
                if (*rc::gen::arbitrary<bool>()) {
                    RC_ASSERT(f->delete_event(created.unwrap().id).is_ok());
                }
                f.clock->advance(std::chrono::milliseconds(*rc::gen::inRange(1, 5'000)));
            }
            const auto before = test::snapshot_owner(*f, "alice");

            BackupManager manager(*f);
            auto envelope = manager.create_backup("alice", BackupOptions{.include_deleted = true});
            RC_ASSERT(envelope.is_ok());
            RC_ASSERT(envelope.unwrap().compressed == compress);

            auto result = manager.restore_backup(envelope.unwrap(), RestoreOptions{.overwrite = true});
            RC_ASSERT(result.success);
            RC_ASSERT(result.checksum_verified);
            RC_ASSERT(result.restored.events == count);

            const auto after = test::snapshot_owner(*f, "alice");
            RC_ASSERT(after.events == before.events);
            RC_ASSERT(after.preferences == before.preferences);
        });
}

TEST_CASE("Property: any flipped payload byte is detected", "[property][backup]") {
    rc::check("a single-byte change never verifies and Refuse writes nothing",
        []() {
            StoreFixture f;
            f.add_event("alice", "Dentist");
            f.add_event("alice", "Flight", std::chrono::hours(3));

            BackupManager manager(*f);
            auto envelope = manager.create_backup("alice").unwrap();

            const auto at = *rc::gen::inRange<qsizetype>(0, envelope.payload.size());
            const auto mask = *rc::gen::inRange<int>(1, 256);
            BackupEnvelope tampered = envelope;
            tampered.payload[at] = static_cast<char>(tampered.payload[at] ^ mask);

            auto result = manager.restore_backup(tampered, RestoreOptions{
                .overwrite = true, .integrity_policy = IntegrityPolicy::Refuse});
            RC_ASSERT_FALSE(result.success);
            RC_ASSERT_FALSE(result.checksum_verified);
            RC_ASSERT(result.restored.total() == 0);
            RC_ASSERT(f->events_for_owner("alice").unwrap().size() == 2u);
        });
}
