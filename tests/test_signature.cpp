#include <QtTest/QTest>
#include "core.h"
#include "signature.h"

using namespace gsx;

class TestSignature : public QObject {
    Q_OBJECT
private slots:
    void testLeafKinds() {
        const char* codes = "bynqiuxtdsog";
        const SigKind kinds[] = {
            SigKind::Boolean, SigKind::Byte, SigKind::Int16, SigKind::UInt16,
            SigKind::Int32, SigKind::UInt32, SigKind::Int64, SigKind::UInt64,
            SigKind::Double, SigKind::String, SigKind::ObjectPath, SigKind::Signature
        };
        for (int i = 0; codes[i]; i++) {
            auto r = SignatureParser::parse(QString(QLatin1Char(codes[i])));
            QVERIFY2(r.ok, codes + i);
            QCOMPARE(r.signature.kind, kinds[i]);
            QVERIFY(r.signature.isLeaf());
            QVERIFY(r.signature.isBasic());
            QVERIFY(r.signature.children.empty());
        }
    }

    void testVariant() {
        auto r = SignatureParser::parse("v");
        QVERIFY(r.ok);
        QCOMPARE(r.signature.kind, SigKind::Variant);
        QVERIFY(!r.signature.isLeaf());
        QVERIFY(!r.signature.isBasic());
    }

    void testAtIsVariant() {
        auto r = SignatureParser::parse("a@");
        QVERIFY(r.ok);
        QCOMPARE(r.signature.text, QString("av"));
        QCOMPARE(r.signature.element().kind, SigKind::Variant);
        QCOMPARE(r.signature.element().text, QString("v"));
    }

    void testDict() {
        auto r = SignatureParser::parse("a{sv}");
        QVERIFY(r.ok);
        QCOMPARE(r.signature.kind, SigKind::DictEntryArray);
        QCOMPARE(r.signature.text, QString("a{sv}"));
        QCOMPARE(r.signature.keySig().kind, SigKind::String);
        QCOMPARE(r.signature.valueSig().kind, SigKind::Variant);
    }

    void testArrayOfTuples() {
        // 'a' followed by '(' is an array, not a dictionary
        auto r = SignatureParser::parse("a(is)");
        QVERIFY(r.ok);
        QCOMPARE(r.signature.kind, SigKind::Array);
        const TypeSignature& t = r.signature.element();
        QCOMPARE(t.kind, SigKind::Tuple);
        QCOMPARE(t.text, QString("(is)"));
        QCOMPARE((int)t.children.size(), 2);
        QCOMPARE(t.children[0].text, QString("i"));
        QCOMPARE(t.children[1].text, QString("s"));
    }

    void testEmptyTuple() {
        auto r = SignatureParser::parse("()");
        QVERIFY(r.ok);
        QCOMPARE(r.signature.kind, SigKind::Tuple);
        QVERIFY(r.signature.children.empty());
    }

    void testNestedMaybe() {
        auto r = SignatureParser::parse("mmi");
        QVERIFY(r.ok);
        QCOMPARE(r.signature.kind, SigKind::Maybe);
        QCOMPARE(r.signature.element().text, QString("mi"));
        QCOMPARE(r.signature.element().element().kind, SigKind::Int32);
    }

    void testDeepNesting() {
        auto r = SignatureParser::parse("a{s(iav)}");
        QVERIFY(r.ok);
        const TypeSignature& val = r.signature.valueSig();
        QCOMPARE(val.text, QString("(iav)"));
        QCOMPARE(val.children[1].element().kind, SigKind::Variant);
    }

    void testEmptyInput() {
        auto r = SignatureParser::parse("");
        QVERIFY(!r.ok);
        QCOMPARE(r.errorPos, 0);
        QVERIFY(r.error.contains("empty"));
    }

    void testUnbalancedTuple() {
        auto r = SignatureParser::parse("(i");
        QVERIFY(!r.ok);
        QCOMPARE(r.errorPos, 2);
    }

    void testNonBasicDictKey() {
        auto r = SignatureParser::parse("a{vi}");
        QVERIFY(!r.ok);
        QCOMPARE(r.errorPos, 2);
        QVERIFY(r.error.contains("basic"));

        QVERIFY(!SignatureParser::parse("a{(i)s}").ok);
        QVERIFY(!SignatureParser::parse("a{ais}").ok);
    }

    void testDictNeedsTwoTypes() {
        QVERIFY(!SignatureParser::parse("a{s}").ok);
        QVERIFY(!SignatureParser::parse("a{}").ok);
        auto r = SignatureParser::parse("a{si");
        QVERIFY(!r.ok);
        QCOMPARE(r.errorPos, 4);
    }

    void testTrailingCharacters() {
        auto r = SignatureParser::parse("ii");
        QVERIFY(!r.ok);
        QCOMPARE(r.errorPos, 1);
    }

    void testUnknownCharacter() {
        auto r = SignatureParser::parse("z");
        QVERIFY(!r.ok);
        QCOMPARE(r.errorPos, 0);
        QVERIFY(!SignatureParser::parse("a(iz)").ok);
        QVERIFY(!SignatureParser::parse(")").ok);
        QVERIFY(!SignatureParser::parse("}").ok);
    }

    void testTruncated() {
        auto r = SignatureParser::parse("a");
        QVERIFY(!r.ok);
        QCOMPARE(r.errorPos, 1);
        QVERIFY(!SignatureParser::parse("m").ok);
        QVERIFY(!SignatureParser::parse("a{").ok);
    }

    void testDepthLimit() {
        QString ok = QString(SignatureParser::kMaxDepth - 1, QLatin1Char('a')) + "i";
        QVERIFY(SignatureParser::parse(ok).ok);
        QString tooDeep = QString(SignatureParser::kMaxDepth, QLatin1Char('a')) + "i";
        auto r = SignatureParser::parse(tooDeep);
        QVERIFY(!r.ok);
        QVERIFY(r.error.contains("deeper"));
    }

    void testFailureYieldsNoSignature() {
        auto r = SignatureParser::parse("a{sv");
        QVERIFY(!r.ok);
        QVERIFY(r.signature.text.isEmpty());
        QVERIFY(r.signature.children.empty());
    }

    void testParseList() {
        auto r = SignatureParser::parseList("sa{sv}(i)");
        QVERIFY(r.ok);
        QCOMPARE(r.signatures.size(), 3);
        QCOMPARE(r.signatures[1].text, QString("a{sv}"));

        auto empty = SignatureParser::parseList("");
        QVERIFY(empty.ok);
        QVERIFY(empty.signatures.isEmpty());

        QVERIFY(!SignatureParser::parseList("sa").ok);
    }

    void testValidate() {
        QVERIFY(SignatureParser::validate("a{sv}").isEmpty());
        QVERIFY(!SignatureParser::validate("a{vs}").isEmpty());
    }

    void testEquality() {
        auto a = SignatureParser::parse("a@").signature;
        auto b = SignatureParser::parse("av").signature;
        QVERIFY(a == b);
        QVERIFY(a != SignatureParser::parse("as").signature);
    }

    void testErrorKindNames() {
        QCOMPARE(QString(errorKindName(ErrorKind::MalformedSignature)), QString("MalformedSignature"));
        QCOMPARE(QString(errorKindName(ErrorKind::PersistenceRejected)), QString("PersistenceRejected"));
    }
};

QTEST_MAIN(TestSignature)
#include "test_signature.moc"
