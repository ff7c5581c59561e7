#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>
#include <cstdio>

#include "adapters/format_registry.h"
#include "config/config_store.h"
#include "core/log_manager.h"
#include "semantic/providers.h"
#include "semantic/wire_format.h"
#include "stream/stream_session.h"

namespace {

int fail(const DomainFailure& failure)
{
    QTextStream err(stderr);
    err << QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact) << '\n';
    return 1;
}

Result<WireFormat> formatOption(const QCommandLineParser& parser, const QString& option)
{
    const QString name = parser.value(option);
    const auto format = wireFormatFromName(name);
    if (!format) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("unknown_format"),
            QStringLiteral("Unknown --%1 format '%2' (expected one of: %3)")
                .arg(option, name, wireFormatNames().join(QStringLiteral(", ")))));
    }
    return *format;
}

Result<QByteArray> readInput(const QStringList& positional)
{
    QFile file;
    if (positional.size() > 1) {
        file.setFileName(positional.at(1));
        if (!file.open(QIODevice::ReadOnly)) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("unreadable_input"),
                QStringLiteral("Cannot read %1: %2").arg(file.fileName(), file.errorString())));
        }
    } else if (!file.open(stdin, QIODevice::ReadOnly)) {
        return std::unexpected(DomainFailure::internal(QStringLiteral("Cannot read standard input")));
    }
    return file.readAll();
}

int runRequest(const QCommandLineParser& parser, const FormatRegistry& registry,
               const TranslationContext& ctx)
{
    const auto from = formatOption(parser, QStringLiteral("from"));
    if (!from)
        return fail(from.error());
    const auto to = formatOption(parser, QStringLiteral("to"));
    if (!to)
        return fail(to.error());

    const auto body = readInput(parser.positionalArguments());
    if (!body)
        return fail(body.error());

    const auto translated = registry.translateRequest(*from, *to, parser.value(QStringLiteral("model")),
                                                      *body, parser.isSet(QStringLiteral("stream")), ctx);
    if (!translated)
        return fail(translated.error());

    QTextStream out(stdout);
    out << QJsonDocument(*translated).toJson(QJsonDocument::Indented);
    return 0;
}

int runStream(const QCommandLineParser& parser, const FormatRegistry& registry,
              const TranslationContext& ctx)
{
    const auto from = formatOption(parser, QStringLiteral("from"));
    if (!from)
        return fail(from.error());
    const auto to = formatOption(parser, QStringLiteral("to"));
    if (!to)
        return fail(to.error());

    auto session = StreamSession::open(registry, *from, *to, ctx);
    if (!session)
        return fail(session.error());

    const auto transcript = readInput(parser.positionalArguments());
    if (!transcript)
        return fail(transcript.error());

    QFile out;
    if (!out.open(stdout, QIODevice::WriteOnly))
        return fail(DomainFailure::internal(QStringLiteral("Cannot write standard output")));
    out.write((*session)->feed(*transcript));
    out.write((*session)->finish());
    return 0;
}

int runPairs(const FormatRegistry& registry)
{
    QTextStream out(stdout);
    for (const auto& key : registry.registeredPairs()) {
        const TranslatorPair pair = registry.lookup(key.first, key.second);
        out << wireFormatName(key.first) << " -> " << wireFormatName(key.second) << ':'
            << (pair.request ? " request" : "")
            << (pair.response ? " response" : "") << '\n';
    }
    return 0;
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("llmbridge"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Translate LLM API requests and response streams between wire formats."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("request | stream | pairs"));
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("Input file (stdin when omitted)."),
                                 QStringLiteral("[file]"));
    parser.addOptions({
        {QStringLiteral("from"), QStringLiteral("Source wire format."), QStringLiteral("format"),
         QStringLiteral("openai")},
        {QStringLiteral("to"), QStringLiteral("Target wire format."), QStringLiteral("format"),
         QStringLiteral("claude")},
        {QStringLiteral("model"), QStringLiteral("Target model name."), QStringLiteral("model")},
        {QStringLiteral("stream"), QStringLiteral("Request a streamed response.")},
        {QStringLiteral("project-id"), QStringLiteral("Cloud project for Antigravity envelopes."),
         QStringLiteral("id")},
        {QStringLiteral("config"), QStringLiteral("Configuration file."), QStringLiteral("path")},
        {QStringLiteral("log-dir"), QStringLiteral("Directory for llmbridge.log."), QStringLiteral("dir")},
    });
    parser.process(app);

    ConfigStore configStore;
    if (parser.isSet(QStringLiteral("config")) && !configStore.load(parser.value(QStringLiteral("config")))) {
        return fail(DomainFailure::invalidInput(
            QStringLiteral("invalid_config"),
            QStringLiteral("Cannot load configuration from %1").arg(parser.value(QStringLiteral("config")))));
    }
    if (parser.isSet(QStringLiteral("log-dir"))) {
        LoggingOptions logging = configStore.loggingOptions();
        logging.logDir = parser.value(QStringLiteral("log-dir"));
        configStore.setLoggingOptions(logging);
    }
    configStore.applyLogging();

    TranslationContext ctx;
    ctx.ids = &SystemIdProvider::shared();
    ctx.clock = &SystemClock::shared();
    ctx.options = configStore.translatorOptions();
    if (parser.isSet(QStringLiteral("project-id")))
        ctx.credentials = Credentials{parser.value(QStringLiteral("project-id"))};

    const FormatRegistry registry = FormatRegistry::createDefault();

    const QStringList positional = parser.positionalArguments();
    const QString command = positional.value(0);
    int rc = 0;
    if (command == QLatin1String("request")) {
        rc = runRequest(parser, registry, ctx);
    } else if (command == QLatin1String("stream")) {
        rc = runStream(parser, registry, ctx);
    } else if (command == QLatin1String("pairs")) {
        rc = runPairs(registry);
    } else {
        rc = fail(DomainFailure::invalidInput(
            QStringLiteral("unknown_command"),
            QStringLiteral("Unknown command '%1' (expected request, stream or pairs)").arg(command)));
    }

    LogManager::instance().shutdown();
    return rc;
}
