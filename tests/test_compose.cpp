#include <QtTest/QTest>
#include "core.h"
#include "signature.h"

using namespace gsx;

static Value window(const char* name, int32_t width) {
    return Value::tuple({Value::fromString(name), Value::fromInt32(width)});
}

// org.example.app.windows : a(si) = [('main', 800), ('aux', 300)]
static KeyTree windowsTree() {
    KeyTree t;
    t.meta.schemaId     = "org.example.app";
    t.meta.key          = "windows";
    t.meta.type         = "a(si)";
    t.meta.summary      = "Open windows";
    t.meta.description  = "Geometry of open windows";
    t.meta.defaultValue = Value::array("(si)", {window("main", 640)});
    auto sig = SignatureParser::parse(t.meta.type).signature;
    t.root = decompose(sig, Value::array("(si)", {window("main", 800), window("aux", 300)}),
                       t.meta.key).node;
    return t;
}

class TestCompose : public QObject {
    Q_OBJECT
private slots:
    // ── compose ──

    void testOneLinePerNode() {
        KeyTree t = windowsTree();
        ComposeResult r = compose(t);
        QCOMPARE(r.meta.size(), t.root.subtreeSize());
        QCOMPARE(r.meta.size(), 7);
        QCOMPARE(r.text.split('\n').size(), 7);
    }

    void testLineMeta() {
        ComposeResult r = compose(windowsTree());
        QVERIFY(r.meta[0].path.isEmpty());
        QVERIFY(r.meta[0].foldHead);
        QVERIFY(!r.meta[0].isLeaf);
        QCOMPARE(r.meta[0].valueText, QString("a(si)"));

        const LineMeta& leaf = r.meta[2];
        QCOMPARE(leaf.path, (QVector<int>{0, 0}));
        QCOMPARE(leaf.depth, 2);
        QVERIFY(leaf.isLeaf);
        QVERIFY(!leaf.foldHead);
        QCOMPARE(leaf.name, QString("0"));
        QCOMPARE(leaf.valueText, QString("main"));

        QCOMPARE(r.meta[6].path, (QVector<int>{1, 1}));
        QCOMPARE(r.meta[6].valueText, QString("300"));
    }

    void testLineText() {
        QStringList lines = compose(windowsTree()).text.split('\n');
        QVERIFY(lines[0].endsWith("windows = a(si)"));
        QCOMPARE(lines[3], QString("   ") + fmt::indent(2) + "1 = 800");
        QVERIFY(lines[4].endsWith(fmt::indent(1) + "1 = (si)"));
    }

    void testEmptyContainerIsNotFoldHead() {
        KeyTree t;
        t.meta.key = "tags";
        t.root = decompose(SignatureParser::parse("as").signature,
                           Value::array("s", {}), "tags").node;
        ComposeResult r = compose(t);
        QCOMPARE(r.meta.size(), 1);
        QVERIFY(!r.meta[0].foldHead);
        QVERIFY(!r.meta[0].isLeaf);
    }

    void testVariantLeafShowsType() {
        KeyTree t;
        t.root = decompose(SignatureParser::parse("av").signature,
                           Value::array("v", {Value::variant(Value::fromInt32(1))}), "mixed").node;
        ComposeResult r = compose(t);
        QVERIFY(r.meta[1].variant);
        QVERIFY(!r.meta[0].variant);
        QVERIFY(r.text.split('\n')[1].endsWith("0 = 1  <i>"));
    }

    // ── Paths ──

    void testFullPath() {
        KeyTree t = windowsTree();
        QCOMPARE(t.fullPath({}), QString("org.example.app.windows"));
        QCOMPARE(t.fullPath({1, 0}), QString("org.example.app.windows.1.0"));
    }

    void testFullPathSkipsMaybeChild() {
        KeyTree t;
        t.meta.schemaId = "org.example.app";
        t.meta.key = "limit";
        t.root = decompose(SignatureParser::parse("mi").signature,
                           Value::just(Value::fromInt32(5)), "limit").node;
        QCOMPARE(t.fullPath({0}), QString("org.example.app.limit"));
    }

    void testParseNodePath() {
        bool ok = false;
        QCOMPARE(parseNodePath("2/0", &ok), (QVector<int>{2, 0}));
        QVERIFY(ok);
        QVERIFY(parseNodePath("", &ok).isEmpty());
        QVERIFY(ok);
        QVERIFY(parseNodePath("/", &ok).isEmpty());
        QVERIFY(ok);
        QCOMPARE(parseNodePath("/1", &ok), (QVector<int>{1}));
        QVERIFY(ok);

        parseNodePath("1//2", &ok);
        QVERIFY(!ok);
        parseNodePath("a", &ok);
        QVERIFY(!ok);
        parseNodePath("-1", &ok);
        QVERIFY(!ok);
    }

    void testNodePathToString() {
        QCOMPARE(nodePathToString({2, 0}), QString("2/0"));
        QCOMPARE(nodePathToString({}), QString());
    }

    // ── describe ──

    void testDescribeLeaf() {
        QStringList lines = describe(windowsTree(), {0, 1}).split('\n');
        QCOMPARE(lines[0], QString("org.example.app.windows.0.1"));
        QVERIFY(lines.contains("Schema ID: org.example.app"));
        QVERIFY(lines.contains("Key: windows (Open windows)"));
        QVERIFY(lines.contains("Description: Geometry of open windows"));
        QVERIFY(lines.contains("Name: 1"));
        QVERIFY(lines.contains("Type: i"));
        QVERIFY(lines.contains("Value: 800"));
        QVERIFY(lines.contains("Default Value: 640"));
    }

    void testDescribeRoot() {
        QString text = describe(windowsTree(), {});
        QVERIFY(!text.contains("Name:"));
        QVERIFY(text.contains("Value: [('main', 800), ('aux', 300)]"));
        QVERIFY(text.contains("Default Value: [('main', 640)]"));
        QVERIFY(!text.contains("Range:"));
    }

    void testDescribeDefaultTooShort() {
        QString text = describe(windowsTree(), {1, 1});
        QVERIFY(text.contains("Default Value: <"));
        QVERIFY(text.contains("Value: 300"));
    }

    void testDescribeRange() {
        KeyTree t;
        t.meta.schemaId = "org.example.app";
        t.meta.key = "volume";
        t.meta.type = "i";
        t.meta.range = KeyRange::bounds(Value::fromInt32(0), Value::fromInt32(100));
        t.root = decompose(SignatureParser::parse("i").signature, Value::fromInt32(5), "volume").node;
        QString text = describe(t, {});
        QVERIFY(text.contains("Range: range : [0, 100]"));
        QVERIFY(text.contains("Default Value: <none>"));
    }

    void testDescribeBadEditShowsText() {
        KeyTree t = windowsTree();
        t.root.nodeAt({0, 1})->setLeafText("wide");
        QString text = describe(t, {0, 1});
        QVERIFY(text.contains("Value: wide"));
    }

    void testDescribeMissingNode() {
        QVERIFY(describe(windowsTree(), {9}).isEmpty());
    }
};

QTEST_MAIN(TestCompose)
#include "test_compose.moc"
