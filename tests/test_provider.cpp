#include <QtTest/QTest>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QtNumeric>
#include "core.h"
#include "providers/json_provider.h"
#include "providers/memory_provider.h"

using namespace gsx;

// Store that only implements the required surface
class FixedProvider : public SettingsProvider {
public:
    QStringList schemas() const override { return {"org.example.fixed"}; }
    QStringList keys(const QString&) const override { return {"answer"}; }
    bool lookup(const QString& schemaId, const QString& key, KeyMeta* out) const override {
        if (schemaId != "org.example.fixed" || key != "answer") return false;
        out->schemaId = schemaId;
        out->key = key;
        out->type = "i";
        return true;
    }
    Value read(const QString&, const QString&, const QString&) const override {
        return Value::fromInt32(42);
    }
};

static KeyMeta volumeMeta() {
    KeyMeta m;
    m.schemaId     = "org.example.app";
    m.key          = "volume";
    m.type         = "i";
    m.summary      = "Output volume";
    m.defaultValue = Value::fromInt32(5);
    m.range        = KeyRange::bounds(Value::fromInt32(0), Value::fromInt32(10));
    return m;
}

static const char* kStoreJson = R"({
  "schemas": [
    { "id": "org.example.app",
      "keys": [
        { "name": "volume", "type": "i", "summary": "Output volume",
          "default": 5, "range": { "type": "range", "values": [0, 10] },
          "values": { "": 7, "/profiles/quiet/": 2 } },
        { "name": "mode", "type": "s", "default": "auto",
          "range": { "type": "enum", "values": ["auto", "manual"] } },
        { "name": "counter", "type": "x", "values": { "": "-9007199254740993" } },
        { "name": "locked", "type": "b", "writable": false, "default": false },
        { "name": "broken", "type": "a{vs}" },
        { "name": "extras", "type": "a{sv}",
          "values": { "": [["depth", {"type": "i", "value": 3}]] } }
      ] }
  ]
})";

class TestProvider : public QObject {
    Q_OBJECT
private slots:
    // ── SettingsProvider defaults ──

    void testDefaultsAreReadOnly() {
        FixedProvider p;
        QVERIFY(p.hasKey("org.example.fixed", "answer"));
        QVERIFY(!p.hasKey("org.example.fixed", "question"));
        QVERIFY(!p.isWritable("org.example.fixed", "answer"));
        CommitResult r = p.write("org.example.fixed", "answer", {}, Value::fromInt32(1));
        QVERIFY(!r.ok);
        QCOMPARE(r.errorKind, ErrorKind::PersistenceRejected);
        QVERIFY(r.error.contains("read-only"));
    }

    // ── MemoryProvider ──

    void testRegisterAndLookup() {
        MemoryProvider p;
        QVERIFY(p.addKey(volumeMeta()));
        QCOMPARE(p.schemas(), QStringList{"org.example.app"});
        QCOMPARE(p.keys("org.example.app"), QStringList{"volume"});
        KeyMeta m;
        QVERIFY(p.lookup("org.example.app", "volume", &m));
        QCOMPARE(m.summary, QString("Output volume"));
        QVERIFY(m.defaultValue == Value::fromInt32(5));
        QVERIFY(!p.read("org.example.app", "volume", {}).isValid());
    }

    void testRejectBadRegistration() {
        MemoryProvider p;
        KeyMeta bad = volumeMeta();
        bad.type = "a{";
        QVERIFY(!p.addKey(bad));
        bad = volumeMeta();
        bad.defaultValue = Value::fromString("loud");
        QVERIFY(!p.addKey(bad));
        QVERIFY(p.schemas().isEmpty());
    }

    void testAcceptedWrite() {
        MemoryProvider p;
        p.addKey(volumeMeta());
        CommitResult r = p.write("org.example.app", "volume", {}, Value::fromInt32(7));
        QVERIFY(r.ok);
        QCOMPARE(p.writeCount(), 1);
        QVERIFY(p.read("org.example.app", "volume", {}) == Value::fromInt32(7));
    }

    void testRejectedWrites() {
        MemoryProvider p;
        p.addKey(volumeMeta());

        CommitResult r = p.write("org.example.app", "volume", {}, Value::fromUInt32(7));
        QVERIFY(!r.ok);
        QCOMPARE(r.errorKind, ErrorKind::PersistenceRejected);

        r = p.write("org.example.app", "volume", {}, Value::fromInt32(11));
        QVERIFY(!r.ok);
        QVERIFY(r.error.contains("outside"));

        r = p.write("org.example.app", "missing", {}, Value::fromInt32(1));
        QVERIFY(!r.ok);

        p.setWritable("org.example.app", "volume", false);
        r = p.write("org.example.app", "volume", {}, Value::fromInt32(1));
        QVERIFY(!r.ok);
        QVERIFY(r.error.contains("not writable"));

        QCOMPARE(p.writeCount(), 0);
        QVERIFY(!p.read("org.example.app", "volume", {}).isValid());
    }

    void testRelocationPathsAreIndependent() {
        MemoryProvider p;
        p.addKey(volumeMeta());
        QVERIFY(p.write("org.example.app", "volume", "/a/", Value::fromInt32(1)).ok);
        QVERIFY(p.write("org.example.app", "volume", "/b/", Value::fromInt32(2)).ok);
        QVERIFY(p.read("org.example.app", "volume", "/a/") == Value::fromInt32(1));
        QVERIFY(p.read("org.example.app", "volume", "/b/") == Value::fromInt32(2));
        QVERIFY(!p.read("org.example.app", "volume", {}).isValid());

        p.unset("org.example.app", "volume", "/a/");
        QVERIFY(!p.read("org.example.app", "volume", "/a/").isValid());
    }

    // ── JsonProvider ──

    void testLoad() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("store.json");
        writeFile(path, kStoreJson);

        JsonProvider p(path);
        QVERIFY2(p.load(), qPrintable(p.errorString()));
        QCOMPARE(p.name(), QString("store.json"));

        // "broken" has a non-basic dictionary key and is left out
        QCOMPARE(p.keys("org.example.app"),
                 (QStringList{"counter", "extras", "locked", "mode", "volume"}));

        QVERIFY(p.read("org.example.app", "volume", {}) == Value::fromInt32(7));
        QVERIFY(p.read("org.example.app", "volume", "/profiles/quiet/") == Value::fromInt32(2));
        QVERIFY(p.read("org.example.app", "counter", {}) == Value::fromInt64(-9007199254740993LL));
        QVERIFY(p.read("org.example.app", "extras", {})
                == Value::dict("s", "v", {{Value::fromString("depth"),
                                           Value::variant(Value::fromInt32(3))}}));
        QVERIFY(!p.isWritable("org.example.app", "locked"));

        KeyMeta mode;
        QVERIFY(p.lookup("org.example.app", "mode", &mode));
        QCOMPARE(mode.range.type, KeyRange::Type::Enum);
        QCOMPARE(mode.range.values.size(), 2);
        QVERIFY(mode.defaultValue == Value::fromString("auto"));
    }

    void testWriteSavesFile() {
        QTemporaryDir dir;
        const QString path = dir.filePath("store.json");
        writeFile(path, kStoreJson);

        {
            JsonProvider p(path);
            QVERIFY(p.load());
            QVERIFY(p.write("org.example.app", "volume", {}, Value::fromInt32(9)).ok);
            QVERIFY(!p.write("org.example.app", "mode", {}, Value::fromString("turbo")).ok);
        }

        JsonProvider reread(path);
        QVERIFY(reread.load());
        QVERIFY(reread.read("org.example.app", "volume", {}) == Value::fromInt32(9));
        QVERIFY(!reread.read("org.example.app", "mode", {}).isValid());
        QVERIFY(reread.read("org.example.app", "counter", {}) == Value::fromInt64(-9007199254740993LL));

        KeyMeta volume;
        QVERIFY(reread.lookup("org.example.app", "volume", &volume));
        QCOMPARE(volume.range.print(), QString("range : [0, 10]"));
    }

    void testNonFiniteDoublesSurviveReload() {
        QTemporaryDir dir;
        const QString path = dir.filePath("store.json");
        writeFile(path, kStoreJson);

        {
            JsonProvider p(path);
            QVERIFY(p.load());
            KeyMeta ratio;
            ratio.schemaId = "org.example.app";
            ratio.key = "ratio";
            ratio.type = "d";
            QVERIFY(p.addKey(ratio));
            QVERIFY(p.write("org.example.app", "ratio", {}, Value::fromDouble(qInf())).ok);
            QVERIFY(p.write("org.example.app", "ratio", "/low/", Value::fromDouble(-qInf())).ok);
            QVERIFY(p.write("org.example.app", "ratio", "/unset/", Value::fromDouble(qQNaN())).ok);
        }

        JsonProvider reread(path);
        QVERIFY(reread.load());
        QVERIFY(reread.read("org.example.app", "ratio", {}) == Value::fromDouble(qInf()));
        QVERIFY(reread.read("org.example.app", "ratio", "/low/") == Value::fromDouble(-qInf()));
        Value nan = reread.read("org.example.app", "ratio", "/unset/");
        QVERIFY(nan.isValid());
        QVERIFY(qIsNaN(std::get<double>(nan.scalar())));
    }

    void testMalformedValueRejected() {
        MemoryProvider p;
        KeyMeta target;
        target.schemaId = "org.example.app";
        target.key = "target";
        target.type = "(os)";
        QVERIFY(p.addKey(target));

        // Type text matches, payload does not decode
        Value bad = Value::tuple({Value::fromObjectPath("no path"), Value::fromString("x")});
        CommitResult r = p.write("org.example.app", "target", {}, bad);
        QVERIFY(!r.ok);
        QCOMPARE(r.errorKind, ErrorKind::PersistenceRejected);
        QVERIFY(r.error.contains("object path"));

        KeyMeta map = target;
        map.key = "map";
        map.type = "a{si}";
        QVERIFY(p.addKey(map));
        r = p.write("org.example.app", "map", {}, Value::array("{si}", {Value::fromInt32(1)}));
        QVERIFY(!r.ok);
        QCOMPARE(p.writeCount(), 0);
    }

    void testLoadMissingFile() {
        QTemporaryDir dir;
        JsonProvider p(dir.filePath("nope.json"));
        QVERIFY(!p.load());
        QVERIFY(p.errorString().contains("nope.json"));
    }

    void testLoadGarbage() {
        QTemporaryDir dir;
        const QString path = dir.filePath("bad.json");
        writeFile(path, "{ not json");
        JsonProvider p(path);
        QVERIFY(!p.load());
        QVERIFY(!p.errorString().isEmpty());
    }

private:
    static void writeFile(const QString& path, const char* content) {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(content);
    }
};

QTEST_MAIN(TestProvider)
#include "test_provider.moc"
