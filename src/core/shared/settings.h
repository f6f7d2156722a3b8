#pragma once

#include <QString>
#include <cstdint>

namespace cw {

struct Settings {
    // Provider roots
    QString codexDir;                    // ~/.codex
    QString claudeDir;                   // ~/.claude/projects

    // Ingestion
    int pollIntervalMs = 1500;
    int maxMessagesPerSession = 5000;

    // Search
    int searchBudgetMs = 350;
    int searchMaxReturn = 200;

    // Service
    QString serviceName = QStringLiteral("codexwatcher");
};

// Settings with the provider roots resolved against $HOME.
Settings defaultSettings();

} // namespace cw
