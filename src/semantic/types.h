#pragma once
#include <QtGlobal>

enum class WireFormat : quint8 {
    OpenAI, Claude, Gemini, GeminiCli, Antigravity
};

enum class MessageRole : quint8 {
    User, Assistant, System, Tool
};

enum class BlockKind : quint8 {
    Text, Image, ToolUse, ToolResult
};

enum class OpenBlock : quint8 {
    None, Text, Thinking
};

enum class ErrorKind : quint8 {
    InvalidInput,    // 400
    NotSupported,    // 501
    Internal         // 500
};

enum class IdKind : quint8 {
    Request, Session, Project, Message
};
