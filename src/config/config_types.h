#pragma once
#include <QString>

struct TranslatorOptions {
    QString systemPreamble = QStringLiteral("You are Claude Code, Anthropic's official CLI for Claude.");
    int defaultMaxTokens = 64000;
    int minToolMaxTokens = 32000;
    int thinkingBudgetPadding = 1024;
    int defaultThinkingBudget = 8192;
    QString thoughtSignature = QStringLiteral("skip_thought_signature_validator");
    QString envelopeUserAgent = QStringLiteral("gemini-cli");
};

struct LoggingOptions {
    QString logDir;
    QString minimumLevel = QStringLiteral("info");
    bool echoToStderr = false;
};

struct BridgeConfig {
    TranslatorOptions translator;
    LoggingOptions logging;
};
