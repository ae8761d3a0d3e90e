#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "backup/backup_manager.hpp"
#include "cache/index_advisor.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "crypto/keys.hpp"
#include "storage/store.hpp"
#include "sync/retention.hpp"

namespace {

int fail(const std::string& message) {
    QTextStream(stderr) << QString::fromStdString(message) << QLatin1Char('\n');
    return 1;
}

int usage(const QCommandLineParser& parser) {
    QTextStream(stderr) << parser.helpText();
    return 2;
}

int run_stats(almanac::storage::Store& store) {
    auto stats = store.stats();
    if (stats.is_err()) {
        return fail(stats.unwrap_err().message);
    }
    const auto& s = stats.unwrap();
    QTextStream out(stdout);
    out << "events:      " << s.events << '\n'
        << "categories:  " << s.categories << '\n'
        << "calendars:   " << s.calendars << '\n'
        << "preferences: " << s.preferences << '\n'
        << "outbox:      " << s.outbox << '\n'
        << "cache:       " << s.cache_entries << '\n'
        << "backups:     " << s.backups << '\n'
        << "metrics:     " << s.metrics << '\n';
    return 0;
}

int run_backup(almanac::storage::Store& store, const QString& owner, const QString& directory,
               bool compress, const QString& password) {
    almanac::backup::BackupManager manager(store);
    auto created = manager.create_backup(owner.toStdString(), almanac::backup::BackupOptions{
        .compress = compress,
        .encrypt = !password.isEmpty(),
        .password = password.toStdString()
    });
    if (created.is_err()) {
        return fail(created.unwrap_err().message);
    }

    auto path = manager.export_to_file(created.unwrap(), directory);
    if (path.is_err()) {
        return fail(path.unwrap_err().message);
    }
    QTextStream(stdout) << path.unwrap() << " (" << created.unwrap().stats.total_records
                        << " records, checksum " << QString::fromStdString(created.unwrap().checksum) << ")\n";
    return 0;
}

int run_restore(almanac::storage::Store& store, const QString& file, bool overwrite, bool merge,
                const QString& password) {
    almanac::backup::BackupManager manager(store);
    auto envelope = manager.import_from_file(file);
    if (envelope.is_err()) {
        return fail(envelope.unwrap_err().message);
    }

    const auto result = manager.restore_backup(envelope.unwrap(), almanac::backup::RestoreOptions{
        .overwrite = overwrite,
        .merge = merge,
        .decrypt = !password.isEmpty(),
        .password = password.toStdString()
    });

    QTextStream out(stdout);
    out << "events: " << result.restored.events << ", categories: " << result.restored.categories
        << ", calendars: " << result.restored.calendars
        << ", preferences: " << (result.restored.preferences ? "yes" : "no")
        << ", skipped: " << result.restored.skipped << '\n';
    for (const auto& w : result.warnings) {
        out << "warning: " << QString::fromStdString(w) << '\n';
    }
    for (const auto& e : result.errors) {
        QTextStream(stderr) << "error: " << QString::fromStdString(e) << '\n';
    }
    return result.success ? 0 : 1;
}

int run_sweep(almanac::storage::Store& store) {
    almanac::sync::RetentionSweeper sweeper(store);
    auto report = sweeper.sweep();
    if (report.is_err()) {
        return fail(report.unwrap_err().message);
    }
    const auto& r = report.unwrap();
    QTextStream(stdout) << "reaped outbox entries: " << r.reaped_outbox.size() << '\n'
                        << "purged events:         " << r.purged_events << '\n'
                        << "expired cache entries: " << r.expired_cache_entries << '\n'
                        << "purged metrics:        " << r.purged_metrics << '\n';
    return 0;
}

int run_advise(almanac::storage::Store& store) {
    const auto& config = store.config();
    almanac::cache::IndexAdvisor advisor(store.database(), store.metrics(),
                                         config.slow_query_ms, config.flag_average_ms);
    auto report = advisor.analyze();
    if (report.is_err()) {
        return fail(report.unwrap_err().message);
    }

    QTextStream out(stdout);
    if (report.unwrap().slow_operations.empty() && report.unwrap().suggestions.empty()) {
        out << "no recommendations\n";
        return 0;
    }
    for (const auto& slow : report.unwrap().slow_operations) {
        out << "slow: " << QString::fromStdString(slow.operation) << " avg " << slow.average_ms
            << "ms over " << slow.slow_samples << " slow samples\n";
    }
    for (const auto& suggestion : report.unwrap().suggestions) {
        out << QString::fromStdString(suggestion.create_sql) << "  -- "
            << QString::fromStdString(suggestion.operation) << " x" << suggestion.frequency << '\n';
    }
    return 0;
}

int run_export_csv(almanac::storage::Store& store, const QString& owner) {
    auto csv = store.export_csv(owner.toStdString());
    if (csv.is_err()) {
        return fail(csv.unwrap_err().message);
    }
    QTextStream(stdout) << QString::fromStdString(csv.unwrap());
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("almanac");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Almanac store maintenance.\n\n"
        "Commands:\n"
        "  stats                     record counts per table\n"
        "  backup <owner> <dir>      write a backup file for <owner> into <dir>\n"
        "  restore <file>            restore a backup file\n"
        "  sweep                     run the retention sweep\n"
        "  advise                    report slow operations and missing indexes\n"
        "  export-csv <owner>        print the owner's events as CSV"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Database path (overrides ALMANAC_DB_PATH)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption compressOption(
        QStringList{QStringLiteral("compress")},
        QStringLiteral("Compress the backup when it exceeds the threshold."));
    parser.addOption(compressOption);

    const QCommandLineOption encryptOption(
        QStringList{QStringLiteral("encrypt")},
        QStringLiteral("Encrypt the backup with this password."),
        QStringLiteral("password"));
    parser.addOption(encryptOption);

    const QCommandLineOption passwordOption(
        QStringList{QStringLiteral("password")},
        QStringLiteral("Password of an encrypted backup."),
        QStringLiteral("password"));
    parser.addOption(passwordOption);

    const QCommandLineOption overwriteOption(
        QStringList{QStringLiteral("overwrite")},
        QStringLiteral("Delete the owner's records before restoring."));
    parser.addOption(overwriteOption);

    const QCommandLineOption mergeOption(
        QStringList{QStringLiteral("merge")},
        QStringLiteral("Skip events that already exist (same title and start)."));
    parser.addOption(mergeOption);

    const QCommandLineOption logOption(
        QStringList{QStringLiteral("log")},
        QStringLiteral("Also append log output to the default log file."));
    parser.addOption(logOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'stats')."));
    parser.process(app);

    if (parser.isSet(logOption)) {
        almanac::install_file_logging();
        qInfo() << "almanac: logging to" << almanac::default_log_file_path();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(parser);
    }
    const QString command = positional.first();

    if (parser.isSet(overwriteOption) && parser.isSet(mergeOption)) {
        return fail("--overwrite and --merge are mutually exclusive");
    }

    auto crypto_result = almanac::crypto::init();
    if (crypto_result.is_err()) {
        return fail("Failed to initialize crypto: " + crypto_result.unwrap_err().message);
    }

    auto config = almanac::StoreConfig::from_environment();
    if (parser.isSet(dbPathOption)) {
        config.db_path = parser.value(dbPathOption).toStdString();
    }

    auto opened = almanac::storage::Store::open(std::move(config));
    if (opened.is_err()) {
        return fail("Failed to open store: " + opened.unwrap_err().message);
    }
    auto& store = *opened.unwrap();

    if (command == QStringLiteral("stats")) {
        return run_stats(store);
    }
    if (command == QStringLiteral("backup") && positional.size() == 3) {
        return run_backup(store, positional.at(1), positional.at(2),
                          parser.isSet(compressOption), parser.value(encryptOption));
    }
    if (command == QStringLiteral("restore") && positional.size() == 2) {
        return run_restore(store, positional.at(1), parser.isSet(overwriteOption),
                           parser.isSet(mergeOption), parser.value(passwordOption));
    }
    if (command == QStringLiteral("sweep")) {
        return run_sweep(store);
    }
    if (command == QStringLiteral("advise")) {
        return run_advise(store);
    }
    if (command == QStringLiteral("export-csv") && positional.size() == 2) {
        return run_export_csv(store, positional.at(1));
    }
    return usage(parser);
}
