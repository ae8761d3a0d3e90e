#pragma once

#include "core/records.hpp"
#include <QJsonObject>
#include <map>
#include <string>

namespace almanac::bulk {

/**
 * FieldMapper - turns one foreign record into an Event for bulk_import.
 *
 * The owner is assigned by the importer after mapping.
 */
class FieldMapper {
public:
    virtual ~FieldMapper() = default;

    [[nodiscard]] virtual Result<Event, Error> map(const QJsonObject& source) const = 0;
};

/**
 * Records already in the store's own JSON shape (camelCase keys, epoch
 * millisecond times).
 */
class CanonicalFieldMapper final : public FieldMapper {
public:
    [[nodiscard]] Result<Event, Error> map(const QJsonObject& source) const override;
};

/**
 * Records from another calendar: keys are renamed through an alias table
 * (source key -> canonical key) and ISO 8601 date strings are accepted
 * wherever a time is expected.
 *
 *   AliasFieldMapper mapper({{"summary", "title"}, {"dtstart", "startTime"}});
 */
class AliasFieldMapper final : public FieldMapper {
public:
    explicit AliasFieldMapper(std::map<std::string, std::string> aliases)
        : aliases_(std::move(aliases)) {}

    [[nodiscard]] Result<Event, Error> map(const QJsonObject& source) const override;

private:
    std::map<std::string, std::string> aliases_;
};

} // namespace almanac::bulk
