#include "signature.h"

namespace gsx {

// ── Type signature parser ──────────────────────────────────────────────
//
// Grammar (one character of lookahead, no whitespace):
//
//   type   = leaf                     -- b y n q i u x t d s o g
//          | 'v' | '@'                -- variant, inner type known only at runtime
//          | 'm' type                 -- maybe
//          | 'a' '{' leaf type '}'    -- dictionary (key must be a basic leaf)
//          | 'a' type                 -- array
//          | '(' type* ')'            -- tuple, "()" is the unit tuple
//
// Every sub-signature records the exact slice of input it consumed, so the
// text of a child can be handed straight to Value factories. '@' is stored
// as 'v'.

const char* errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:                return "None";
    case ErrorKind::MalformedSignature:  return "MalformedSignature";
    case ErrorKind::TypeMismatch:        return "TypeMismatch";
    case ErrorKind::ValueCoercionError:  return "ValueCoercionError";
    case ErrorKind::StructuralMismatch:  return "StructuralMismatch";
    case ErrorKind::IndexOutOfRange:     return "IndexOutOfRange";
    case ErrorKind::PersistenceRejected: return "PersistenceRejected";
    }
    return "Unknown";
}

namespace {

class TypeParser {
public:
    explicit TypeParser(const QString& input) : m_input(input) {}

    SignatureParseResult parseOne() {
        if (atEnd())
            return {false, {}, QStringLiteral("empty signature"), 0};

        TypeSignature sig;
        if (!parseType(sig, 0))
            return {false, {}, m_error, m_errorPos};

        if (!atEnd()) {
            m_errorPos = m_pos;
            return {false, {}, QStringLiteral("unexpected '%1' after complete type")
                                   .arg(peek()), m_pos};
        }
        return {true, sig, {}, -1};
    }

    SignatureListResult parseMany() {
        QVector<TypeSignature> out;
        while (!atEnd()) {
            TypeSignature sig;
            if (!parseType(sig, 0))
                return {false, {}, m_error, m_errorPos};
            out.append(sig);
        }
        return {true, out, {}, -1};
    }

private:
    const QString& m_input;
    int m_pos = 0;
    QString m_error;
    int m_errorPos = 0;

    // ── Helpers ──

    bool atEnd() const { return m_pos >= m_input.size(); }

    QChar peek() const { return atEnd() ? QChar('\0') : m_input[m_pos]; }

    void advance() { m_pos++; }

    bool fail(const QString& msg) {
        m_error = msg;
        m_errorPos = m_pos;
        return false;
    }

    bool expect(QChar ch) {
        if (atEnd())
            return fail(QStringLiteral("expected '%1', got end of signature").arg(ch));
        if (peek() != ch)
            return fail(QStringLiteral("expected '%1', got '%2'").arg(ch).arg(peek()));
        advance();
        return true;
    }

    // Canonical text of everything consumed since 'start'
    QString sliceFrom(int start) const {
        QString s = m_input.mid(start, m_pos - start);
        s.replace(QLatin1Char('@'), QLatin1Char('v'));
        return s;
    }

    // ── Recursive descent ──

    bool parseType(TypeSignature& out, int depth) {
        if (depth >= SignatureParser::kMaxDepth)
            return fail(QStringLiteral("signature nested deeper than %1 levels")
                            .arg(SignatureParser::kMaxDepth));
        if (atEnd())
            return fail("unexpected end of signature");

        int start = m_pos;
        QChar ch = peek();

        SigKind leafKind;
        if (leafKindFromCode(ch, &leafKind)) {
            advance();
            out.kind = leafKind;
        } else if (ch == 'v' || ch == '@') {
            advance();
            out.kind = SigKind::Variant;
        } else if (ch == 'm') {
            advance();
            TypeSignature inner;
            if (!parseType(inner, depth + 1))
                return false;
            out.kind = SigKind::Maybe;
            out.children.push_back(inner);
        } else if (ch == 'a') {
            advance();
            // The one place where lookahead decides the kind: "a{" vs anything else
            if (peek() == '{') {
                if (!parseDictEntry(out, depth))
                    return false;
            } else {
                TypeSignature elem;
                if (!parseType(elem, depth + 1))
                    return false;
                out.kind = SigKind::Array;
                out.children.push_back(elem);
            }
        } else if (ch == '(') {
            if (!parseTuple(out, depth))
                return false;
        } else {
            return fail(QStringLiteral("unexpected '%1'").arg(ch));
        }

        out.text = sliceFrom(start);
        return true;
    }

    // '{' basic type '}' (the leading 'a' is already consumed)
    bool parseDictEntry(TypeSignature& out, int depth) {
        advance(); // skip '{'

        int keyPos = m_pos;
        TypeSignature key;
        if (!parseType(key, depth + 1))
            return false;
        if (!key.isBasic()) {
            m_pos = keyPos;
            return fail(QStringLiteral("dictionary key must be a basic type, got '%1'")
                            .arg(key.text));
        }

        TypeSignature value;
        if (!parseType(value, depth + 1))
            return false;
        if (!expect('}'))
            return false;

        out.kind = SigKind::DictEntryArray;
        out.children = {key, value};
        return true;
    }

    // '(' type* ')'
    bool parseTuple(TypeSignature& out, int depth) {
        advance(); // skip '('
        out.kind = SigKind::Tuple;
        for (;;) {
            if (atEnd())
                return fail("expected ')', got end of signature");
            if (peek() == ')')
                break;
            TypeSignature item;
            if (!parseType(item, depth + 1))
                return false;
            out.children.push_back(item);
        }
        advance(); // skip ')'
        return true;
    }
};

} // namespace

// ── Public API ─────────────────────────────────────────────────────────

SignatureParseResult SignatureParser::parse(const QString& text) {
    TypeParser parser(text);
    return parser.parseOne();
}

SignatureListResult SignatureParser::parseList(const QString& text) {
    TypeParser parser(text);
    return parser.parseMany();
}

QString SignatureParser::validate(const QString& text) {
    auto result = parse(text);
    return result.ok ? QString() : result.error;
}

} // namespace gsx
