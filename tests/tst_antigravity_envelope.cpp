#include <QTest>
#include "adapters/request/antigravity_envelope.h"
#include "adapters/request/gemini_request.h"
#include "semantic/providers.h"
#include "test_support.h"

class TestAntigravityEnvelope : public QObject {
    Q_OBJECT

private slots:
    void testWrapWithCredentials() {
        TestContext test;
        test.ctx.credentials = Credentials{QStringLiteral("  my-project  ")};

        QJsonObject body = jsonObject(R"({"model":"m","contents":[{"role":"user","parts":[{"text":"hi"}]}],
            "generationConfig":{"temperature":1},"safetySettings":[]})");
        QJsonObject env = AntigravityEnvelope::wrap(QStringLiteral("gemini-3-pro"), body, test.ctx);

        QCOMPARE(env.value(QStringLiteral("project")).toString(), QStringLiteral("my-project"));
        QCOMPARE(env.value(QStringLiteral("model")).toString(), QStringLiteral("gemini-3-pro"));
        QCOMPARE(env.value(QStringLiteral("userAgent")).toString(), QStringLiteral("gemini-cli"));
        QCOMPARE(env.value(QStringLiteral("requestId")).toString(), QStringLiteral("request-1"));
        QCOMPARE(test.ids.issued(IdKind::Project), 0);

        const QJsonObject request = env.value(QStringLiteral("request")).toObject();
        QCOMPARE(request.value(QStringLiteral("sessionId")).toString(), QStringLiteral("session-1"));
        QCOMPARE(request.value(QStringLiteral("contents")), body.value(QStringLiteral("contents")));
        QVERIFY(request.contains(QStringLiteral("generationConfig")));
        QVERIFY(request.contains(QStringLiteral("safetySettings")));
        QVERIFY(!request.contains(QStringLiteral("systemInstruction")));
        QVERIFY(!request.contains(QStringLiteral("tools")));
        QVERIFY(!request.contains(QStringLiteral("model")));
    }

    void testGeneratedProjectWhenMissing() {
        TestContext test;
        test.ctx.credentials = Credentials{QStringLiteral("   ")};
        QJsonObject env = AntigravityEnvelope::wrap(QStringLiteral("m"), QJsonObject(), test.ctx);
        QCOMPARE(env.value(QStringLiteral("project")).toString(), QStringLiteral("project-1"));

        TestContext bare;
        env = AntigravityEnvelope::wrap(QStringLiteral("m"), QJsonObject(), bare.ctx);
        QCOMPARE(env.value(QStringLiteral("project")).toString(), QStringLiteral("project-1"));
    }

    void testFreshIdsPerCall() {
        TestContext test;
        QJsonObject first = AntigravityEnvelope::wrap(QStringLiteral("m"), QJsonObject(), test.ctx);
        QJsonObject second = AntigravityEnvelope::wrap(QStringLiteral("m"), QJsonObject(), test.ctx);
        QVERIFY(first.value(QStringLiteral("requestId")) != second.value(QStringLiteral("requestId")));
        QCOMPARE(second.value(QStringLiteral("request")).toObject().value(QStringLiteral("sessionId")).toString(),
                 QStringLiteral("session-2"));
    }

    void testAntigravityTranslatorWrapsCliBody() {
        TestContext test;
        test.ctx.credentials = Credentials{QStringLiteral("proj")};
        OpenAiToAntigravityRequest translator;
        QJsonObject env = translator.translate(QStringLiteral("gemini-3-pro"),
            jsonObject(R"({"messages":[{"role":"user","content":"hi"}]})"), true, test.ctx);

        const QJsonObject request = env.value(QStringLiteral("request")).toObject();
        QCOMPARE(request.value(QStringLiteral("contents")).toArray(),
                 jsonArray(R"([{"role":"user","parts":[{"text":"hi"}]}])"));
        QVERIFY(request.value(QStringLiteral("generationConfig")).toObject()
                    .contains(QStringLiteral("thinkingConfig")));
    }

    void testSystemProviderIdShapes() {
        SystemIdProvider ids;
        QVERIFY(ids.nextId(IdKind::Request).startsWith(QStringLiteral("agent-")));

        const QString session = ids.nextId(IdKind::Session);
        QVERIFY(session.startsWith(QLatin1Char('-')));
        QCOMPARE(session.size(), 20);

        const QStringList project = ids.nextId(IdKind::Project).split(QLatin1Char('-'));
        QCOMPARE(project.size(), 3);
        QCOMPARE(project[2].size(), 5);

        QVERIFY(ids.nextId(IdKind::Message).startsWith(QStringLiteral("msg_")));
    }
};

QTEST_MAIN(TestAntigravityEnvelope)
#include "tst_antigravity_envelope.moc"
