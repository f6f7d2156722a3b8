#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace cw {

namespace {

// Positive integer from the environment, or nullopt (with a warning when set
// but unusable).
std::optional<int> positiveEnvInt(const char* name)
{
    const QString raw = qEnvironmentVariable(name).trimmed();
    if (raw.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok || value <= 0) {
        LOG_WARN(cwCore, "Ignoring invalid %s=%s", name, qUtf8Printable(raw));
        return std::nullopt;
    }
    return value;
}

int positiveOr(const QJsonObject& json, const QString& key, int fallback)
{
    if (!json.contains(key)) {
        return fallback;
    }
    const int value = json.value(key).toInt(fallback);
    return value > 0 ? value : fallback;
}

} // namespace

Settings defaultSettings()
{
    Settings settings;
    const QString home = QDir::homePath();
    settings.codexDir = QDir(home).filePath(QStringLiteral(".codex"));
    settings.claudeDir = QDir(home).filePath(QStringLiteral(".claude/projects"));
    return settings;
}

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(cwCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(cwCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(cwCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(cwCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const QByteArray payload = QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size() || !file.commit()) {
        LOG_ERROR(cwCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("CODEXWATCHER_SETTINGS").trimmed();
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/codexwatcher/settings.json");
}

Settings SettingsManager::resolve()
{
    Settings settings = load().value_or(defaultSettings());
    applyEnvironmentOverrides(settings);
    return settings;
}

void SettingsManager::applyEnvironmentOverrides(Settings& settings)
{
    const QString codexDir = qEnvironmentVariable("CODEX_DIR").trimmed();
    if (!codexDir.isEmpty()) {
        settings.codexDir = QDir::cleanPath(codexDir);
    }

    const QString claudeDir = qEnvironmentVariable("CLAUDE_DIR").trimmed();
    if (!claudeDir.isEmpty()) {
        settings.claudeDir = QDir::cleanPath(claudeDir);
    }

    if (const auto pollMs = positiveEnvInt("CODEXWATCHER_POLL_MS")) {
        settings.pollIntervalMs = pollMs.value();
    }
    if (const auto budgetMs = positiveEnvInt("CODEXWATCHER_SEARCH_BUDGET_MS")) {
        settings.searchBudgetMs = budgetMs.value();
    }
    if (const auto maxReturn = positiveEnvInt("CODEXWATCHER_SEARCH_MAX")) {
        settings.searchMaxReturn = maxReturn.value();
    }
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("codexDir"), settings.codexDir);
    json.insert(QStringLiteral("claudeDir"), settings.claudeDir);
    json.insert(QStringLiteral("pollIntervalMs"), settings.pollIntervalMs);
    json.insert(QStringLiteral("maxMessagesPerSession"), settings.maxMessagesPerSession);
    json.insert(QStringLiteral("searchBudgetMs"), settings.searchBudgetMs);
    json.insert(QStringLiteral("searchMaxReturn"), settings.searchMaxReturn);
    json.insert(QStringLiteral("serviceName"), settings.serviceName);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings = defaultSettings();

    settings.codexDir = json.value(QStringLiteral("codexDir")).toString(settings.codexDir);
    settings.claudeDir = json.value(QStringLiteral("claudeDir")).toString(settings.claudeDir);
    settings.pollIntervalMs = positiveOr(json, QStringLiteral("pollIntervalMs"),
                                         settings.pollIntervalMs);
    settings.maxMessagesPerSession = positiveOr(json, QStringLiteral("maxMessagesPerSession"),
                                                settings.maxMessagesPerSession);
    settings.searchBudgetMs = positiveOr(json, QStringLiteral("searchBudgetMs"),
                                         settings.searchBudgetMs);
    settings.searchMaxReturn = positiveOr(json, QStringLiteral("searchMaxReturn"),
                                          settings.searchMaxReturn);

    const QString serviceName = json.value(QStringLiteral("serviceName")).toString().trimmed();
    if (!serviceName.isEmpty()) {
        settings.serviceName = serviceName;
    }

    return settings;
}

} // namespace cw
