#pragma once
#include "types.h"
#include "content_block.h"
#include <QString>
#include <QStringList>
#include <QList>
#include <QJsonObject>
#include <QJsonValue>
#include <optional>

struct Message {
    MessageRole role = MessageRole::User;
    QList<ContentBlock> blocks;

    bool contains(BlockKind kind) const {
        for (const auto& block : blocks) {
            if (block.kind == kind)
                return true;
        }
        return false;
    }

    QString joinedText(const QString& separator = QStringLiteral("\n")) const {
        QStringList parts;
        for (const auto& block : blocks) {
            if (block.kind == BlockKind::Text)
                parts.append(block.text);
        }
        return parts.join(separator);
    }
};

struct ToolSpec {
    QString name;
    QString description;
    QJsonObject inputSchema;
};

struct GenerationParams {
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> topK;
    std::optional<int> maxTokens;
    QStringList stopSequences;
};

struct RequestModel {
    QString model;
    QList<Message> messages;
    QList<ToolSpec> tools;
    QJsonValue toolChoice;          // Null when absent
    GenerationParams params;
    bool stream = false;
    QString reasoningEffort;
    std::optional<int> thinkingBudget;

    bool hasTools() const { return !tools.isEmpty(); }
    bool hasToolChoice() const { return !toolChoice.isNull() && !toolChoice.isUndefined(); }
};
