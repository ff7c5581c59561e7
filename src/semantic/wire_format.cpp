#include "wire_format.h"

QString wireFormatName(WireFormat format)
{
    switch (format) {
    case WireFormat::OpenAI:      return QStringLiteral("openai");
    case WireFormat::Claude:      return QStringLiteral("claude");
    case WireFormat::Gemini:      return QStringLiteral("gemini");
    case WireFormat::GeminiCli:   return QStringLiteral("gemini-cli");
    case WireFormat::Antigravity: return QStringLiteral("antigravity");
    }
    return QStringLiteral("unknown");
}

std::optional<WireFormat> wireFormatFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("openai"))
        return WireFormat::OpenAI;
    if (key == QLatin1String("claude") || key == QLatin1String("anthropic"))
        return WireFormat::Claude;
    if (key == QLatin1String("gemini"))
        return WireFormat::Gemini;
    if (key == QLatin1String("gemini-cli") || key == QLatin1String("gemini_cli"))
        return WireFormat::GeminiCli;
    if (key == QLatin1String("antigravity"))
        return WireFormat::Antigravity;
    return std::nullopt;
}

QStringList wireFormatNames()
{
    return {
        wireFormatName(WireFormat::OpenAI),
        wireFormatName(WireFormat::Claude),
        wireFormatName(WireFormat::Gemini),
        wireFormatName(WireFormat::GeminiCli),
        wireFormatName(WireFormat::Antigravity),
    };
}
