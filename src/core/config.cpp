#include "core/config.hpp"
#include "core/logging.hpp"

#include <QtGlobal>

namespace almanac {
namespace {

std::optional<long long> env_number(const char* name) {
    const auto raw = qEnvironmentVariable(name);
    if (raw.isEmpty()) return std::nullopt;
    bool ok = false;
    const auto value = raw.toLongLong(&ok);
    if (!ok || value <= 0) {
        qCWarning(almanacStoreLog) << "Config: ignoring" << name << "=" << raw
                                   << "(expected a positive integer)";
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<IntegrityPolicy> parse_integrity_policy(std::string_view s) {
    if (s == "warn") return IntegrityPolicy::Warn;
    if (s == "refuse") return IntegrityPolicy::Refuse;
    return std::nullopt;
}

StoreConfig StoreConfig::from_environment(StoreConfig base) {
    const auto path = qEnvironmentVariable("ALMANAC_DB_PATH");
    if (!path.isEmpty()) {
        base.db_path = path.toStdString();
    }

    if (auto n = env_number("ALMANAC_BATCH_SIZE")) {
        base.batch_size = static_cast<size_t>(*n);
    }
    if (auto n = env_number("ALMANAC_MAX_BACKUPS")) {
        base.max_backups = static_cast<int>(*n);
    }
    if (auto n = env_number("ALMANAC_CACHE_TTL_MS")) {
        base.cache_ttl = std::chrono::milliseconds(*n);
    }

    const auto policy = qEnvironmentVariable("ALMANAC_INTEGRITY_POLICY");
    if (!policy.isEmpty()) {
        if (auto parsed = parse_integrity_policy(policy.toLower().toStdString())) {
            base.integrity_policy = *parsed;
        } else {
            qCWarning(almanacStoreLog) << "Config: ignoring ALMANAC_INTEGRITY_POLICY =" << policy
                                       << "(expected warn or refuse)";
        }
    }

    return base;
}

} // namespace almanac
