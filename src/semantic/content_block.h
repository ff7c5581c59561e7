#pragma once
#include "types.h"
#include <QString>
#include <QJsonValue>

struct ContentBlock {
    BlockKind kind = BlockKind::Text;

    QString text;           // Text

    QString mediaType;      // Image
    QString data;           // Image, base64 payload

    QString id;             // ToolUse
    QString name;           // ToolUse
    QJsonValue input;       // ToolUse

    QString toolUseId;      // ToolResult
    QJsonValue content;     // ToolResult
    bool isError = false;   // ToolResult

    // Marks the end of a cacheable prefix (rendered as an ephemeral cache_control).
    bool cacheEligible = false;

    static ContentBlock fromText(const QString& text) {
        ContentBlock block;
        block.kind = BlockKind::Text;
        block.text = text;
        return block;
    }
    static ContentBlock fromImage(const QString& mediaType, const QString& data) {
        ContentBlock block;
        block.kind = BlockKind::Image;
        block.mediaType = mediaType;
        block.data = data;
        return block;
    }
    static ContentBlock fromToolUse(const QString& id, const QString& name, const QJsonValue& input) {
        ContentBlock block;
        block.kind = BlockKind::ToolUse;
        block.id = id;
        block.name = name;
        block.input = input;
        return block;
    }
    static ContentBlock fromToolResult(const QString& toolUseId, const QJsonValue& content,
                                       bool isError = false) {
        ContentBlock block;
        block.kind = BlockKind::ToolResult;
        block.toolUseId = toolUseId;
        block.content = content;
        block.isError = isError;
        return block;
    }
};
