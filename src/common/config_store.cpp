#include "config_store.hpp"

#include "logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

#include <algorithm>

namespace ab::config {

namespace {

using common::LogLevel;
using common::Logger;

const QString kCategory = QStringLiteral("config");

void set_error(QString *error, const QString &text) {
    if (error) {
        *error = text;
    }
}

}  // namespace

ConfigStore::ConfigStore(QString path, QObject *parent)
    : QObject(parent), path_(std::move(path)), current_(std::make_shared<const BridgeConfig>()) {
    connect(&watcher_, &QFileSystemWatcher::fileChanged, this, &ConfigStore::handleFileChanged);
}

QString ConfigStore::defaultDirectory() {
    return QDir::home().filePath(QStringLiteral(".automator_bridge"));
}

QString ConfigStore::defaultConfigPath() {
    return QDir(defaultDirectory()).filePath(QStringLiteral("config.json"));
}

QString ConfigStore::path() const {
    return path_;
}

bool ConfigStore::load(QString *error) {
    QFile file(path_);
    if (!file.exists()) {
        Logger::instance().log(LogLevel::Info, kCategory,
                               QStringLiteral("No configuration at %1, creating an empty one").arg(path_));
        BridgeConfig empty;
        empty.extra.insert(QStringLiteral("config_version"), QLatin1String(kConfigVersion));
        publish(std::move(empty));
        return save(error);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        set_error(error, QStringLiteral("cannot open %1: %2").arg(path_, file.errorString()));
        emit loadFailed(file.errorString());
        return false;
    }
    const QByteArray raw = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        const QString reason = parseError.error != QJsonParseError::NoError
                                   ? parseError.errorString()
                                   : QStringLiteral("top level is not an object");
        Logger::instance().log(LogLevel::Error, kCategory,
                               QStringLiteral("Error loading config %1: %2").arg(path_, reason));
        set_error(error, reason);
        emit loadFailed(reason);
        return false;
    }

    QJsonObject object = document.object();
    const bool migrated = needs_migration(object);
    if (migrated) {
        Logger::instance().log(LogLevel::Info, kCategory, QStringLiteral("Migrating configuration to v%1")
                                                              .arg(QLatin1String(kConfigVersion)));
        object = migrate_document(object);
    }

    QStringList warnings;
    BridgeConfig config = config_from_json(object, &warnings);
    for (const auto &warning : warnings) {
        Logger::instance().log(LogLevel::Warn, kCategory, warning);
    }
    publish(std::move(config));
    Logger::instance().log(LogLevel::Info, kCategory, QStringLiteral("Configuration loaded from %1").arg(path_));
    if (migrated) {
        return save(error);
    }
    return true;
}

bool ConfigStore::save(QString *error) const {
    return writeDocument(config_to_json(*current_), error);
}

ConfigSnapshot ConfigStore::snapshot() const {
    return current_;
}

bool ConfigStore::replace(BridgeConfig config, QString *error) {
    for (const auto &trigger : duplicate_triggers(config)) {
        Logger::instance().log(LogLevel::Warn, kCategory,
                               QStringLiteral("Trigger '%1' is defined by more than one command").arg(trigger));
    }
    publish(std::move(config));
    return save(error);
}

bool ConfigStore::applyUpdate(const ConfigUpdate &update, QString *error) {
    BridgeConfig next = *current_;
    if (update.listeners) {
        next.listeners = *update.listeners;
    }
    if (update.commands) {
        next.commands = *update.commands;
    }
    if (update.automators) {
        next.automators = *update.automators;
    }
    if (update.mappings) {
        next.mappings = *update.mappings;
    }
    return replace(std::move(next), error);
}

bool ConfigStore::addAutomator(AutomatorInstance automator, QString *error) {
    if (automator.id.isEmpty()) {
        automator.id = generate_automator_id();
    }
    if (current_->findAutomator(automator.id)) {
        set_error(error, QStringLiteral("Automator ID already exists"));
        return false;
    }
    BridgeConfig next = *current_;
    next.automators.push_back(automator);
    return replace(std::move(next), error);
}

bool ConfigStore::updateAutomator(const QString &id, const AutomatorInstance &automator, QString *error) {
    BridgeConfig next = *current_;
    for (auto &existing : next.automators) {
        if (existing.id == id) {
            existing = automator;
            return replace(std::move(next), error);
        }
    }
    set_error(error, QStringLiteral("Automator not found"));
    return false;
}

QVector<CommandMapping> ConfigStore::orphanedMappings(const QString &automatorId) const {
    QVector<CommandMapping> orphaned;
    for (const auto &mapping : current_->mappings) {
        if (mapping.automatorId == automatorId) {
            orphaned.push_back(mapping);
        }
    }
    return orphaned;
}

int ConfigStore::removeAutomator(const QString &id, bool deleteMappings) {
    BridgeConfig next = *current_;
    next.automators.erase(std::remove_if(next.automators.begin(), next.automators.end(),
                                         [&id](const AutomatorInstance &a) { return a.id == id; }),
                          next.automators.end());
    int removed = 0;
    if (deleteMappings) {
        const int before = next.mappings.size();
        next.mappings.erase(std::remove_if(next.mappings.begin(), next.mappings.end(),
                                           [&id](const CommandMapping &m) { return m.automatorId == id; }),
                            next.mappings.end());
        removed = before - next.mappings.size();
    }
    QString error;
    if (!replace(std::move(next), &error)) {
        Logger::instance().log(LogLevel::Error, kCategory, QStringLiteral("Error saving config: %1").arg(error));
    }
    return removed;
}

void ConfigStore::setWatchEnabled(bool enabled) {
    watchEnabled_ = enabled;
    if (!watcher_.files().isEmpty()) {
        watcher_.removePaths(watcher_.files());
    }
    if (enabled) {
        rearmWatch();
    }
}

void ConfigStore::handleFileChanged(const QString &path) {
    Q_UNUSED(path);
    // Editors replace the file, which drops it from the watch list.
    rearmWatch();

    QFile file(path_);
    if (!file.open(QIODevice::ReadOnly)) {
        return;
    }
    if (file.readAll() == lastWritten_) {
        return;
    }
    file.close();
    Logger::instance().log(LogLevel::Info, kCategory, QStringLiteral("Configuration file changed, reloading"));
    QString error;
    if (!load(&error)) {
        Logger::instance().log(LogLevel::Error, kCategory,
                               QStringLiteral("Keeping previous configuration: %1").arg(error));
    }
}

void ConfigStore::publish(BridgeConfig config) {
    config.revision = current_->revision + 1;
    current_ = std::make_shared<const BridgeConfig>(std::move(config));
    emit configChanged(current_);
}

bool ConfigStore::writeDocument(const QJsonObject &document, QString *error) const {
    const QFileInfo info(path_);
    if (!QDir().mkpath(info.absolutePath())) {
        set_error(error, QStringLiteral("cannot create %1").arg(info.absolutePath()));
        return false;
    }
    const QByteArray bytes = QJsonDocument(document).toJson(QJsonDocument::Indented);
    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        set_error(error, file.errorString());
        return false;
    }
    file.write(bytes);
    if (!file.commit()) {
        set_error(error, file.errorString());
        return false;
    }
    lastWritten_ = bytes;
    Logger::instance().log(LogLevel::Debug, kCategory, QStringLiteral("Configuration saved to %1").arg(path_));
    return true;
}

void ConfigStore::rearmWatch() {
    if (watchEnabled_ && QFile::exists(path_) && !watcher_.files().contains(path_)) {
        watcher_.addPath(path_);
    }
}

}  // namespace ab::config
