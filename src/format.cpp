#include "core.h"
#include "signature.h"
#include <QLocale>
#include <cmath>
#include <limits>
#include <type_traits>

namespace gsx::fmt {

// ── Leaf text ──
// Editable form of a leaf: what the edit field shows and what parseLeaf
// accepts back unchanged.

static QString fmtDouble(double v) {
    if (std::isnan(v)) return QStringLiteral("nan");
    if (std::isinf(v)) return v > 0 ? QStringLiteral("inf") : QStringLiteral("-inf");
    QString s = QString::number(v, 'g', QLocale::FloatingPointShortest);
    if (!s.contains('.') && !s.contains('e') && !s.contains('E'))
        s += QStringLiteral(".0");
    return s;
}

QString leafText(const Scalar& s) {
    struct Text {
        QString operator()(std::monostate) const   { return {}; }
        QString operator()(bool v) const           { return v ? QStringLiteral("True") : QStringLiteral("False"); }
        QString operator()(uint8_t v) const        { return QString::number(v); }
        QString operator()(int16_t v) const        { return QString::number(v); }
        QString operator()(uint16_t v) const       { return QString::number(v); }
        QString operator()(int32_t v) const        { return QString::number(v); }
        QString operator()(uint32_t v) const       { return QString::number(v); }
        QString operator()(int64_t v) const        { return QString::number(qlonglong(v)); }
        QString operator()(uint64_t v) const       { return QString::number(qulonglong(v)); }
        QString operator()(double v) const         { return fmtDouble(v); }
        QString operator()(const QString& v) const { return v; }
    };
    return std::visit(Text{}, s);
}

QString typeTag(const TypeSignature& sig) {
    return sig.text;
}

QString displayValue(const ValueNode& node) {
    if (node.compound) return typeTag(node.signature);
    return leafText(node.leaf);
}

QString quoted(const QString& s) {
    QString out;
    out.reserve(s.size() + 2);
    out += QLatin1Char('\'');
    for (QChar c : s) {
        if (c == '\\')      out += QStringLiteral("\\\\");
        else if (c == '\'') out += QStringLiteral("\\'");
        else if (c == '\n') out += QStringLiteral("\\n");
        else if (c == '\t') out += QStringLiteral("\\t");
        else out += c;
    }
    out += QLatin1Char('\'');
    return out;
}

QString indent(int depth) {
    return QString(depth * 3, ' ');
}

// ── Object paths ──
// "/" or one or more "/element" groups, elements drawn from [A-Za-z0-9_].

bool isObjectPath(const QString& text) {
    if (!text.startsWith('/')) return false;
    if (text.size() == 1) return true;
    if (text.endsWith('/')) return false;
    bool prevSlash = true;
    for (int i = 1; i < text.size(); i++) {
        QChar c = text[i];
        if (c == '/') {
            if (prevSlash) return false;
            prevSlash = true;
            continue;
        }
        bool okChar = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                   || (c >= '0' && c <= '9') || c == '_';
        if (!okChar) return false;
        prevSlash = false;
    }
    return true;
}

// ── Leaf coercion (text → scalar) ──

// Range-checked narrowing: sets *ok = false if parsed value doesn't fit in T
template<class T, class ParseT>
static Scalar parseIntChecked(ParseT val, bool* ok) {
    if (*ok) {
        using L = std::numeric_limits<T>;
        if constexpr (std::is_signed_v<T>) {
            if (val < (ParseT)L::min() || val > (ParseT)L::max()) *ok = false;
        } else {
            if (val > (ParseT)L::max()) *ok = false;
        }
    }
    return *ok ? Scalar(static_cast<T>(val)) : Scalar{};
}

template<class T>
static Scalar parseInt(const QString& s, bool* ok) {
    if constexpr (std::is_signed_v<T>) {
        qlonglong val = s.toLongLong(ok, 10);
        return parseIntChecked<T>(val, ok);
    } else {
        if (s.startsWith('-')) { *ok = false; return {}; }
        qulonglong val = s.toULongLong(ok, 10);
        return parseIntChecked<T>(val, ok);
    }
}

Scalar parseLeaf(SigKind kind, const QString& text, bool* ok) {
    *ok = false;
    const QString s = text.trimmed();

    switch (kind) {
    case SigKind::Boolean:
        // Exactly the two spellings leafText produces; no trimming, no case folding
        if (text == QStringLiteral("True"))  { *ok = true; return Scalar(true); }
        if (text == QStringLiteral("False")) { *ok = true; return Scalar(false); }
        return {};
    case SigKind::Byte:   return parseInt<uint8_t>(s, ok);
    case SigKind::Int16:  return parseInt<int16_t>(s, ok);
    case SigKind::UInt16: return parseInt<uint16_t>(s, ok);
    case SigKind::Int32:  return parseInt<int32_t>(s, ok);
    case SigKind::UInt32: return parseInt<uint32_t>(s, ok);
    case SigKind::Int64:  return parseInt<int64_t>(s, ok);
    case SigKind::UInt64: return parseInt<uint64_t>(s, ok);
    case SigKind::Double: {
        double val = s.toDouble(ok);
        return *ok ? Scalar(val) : Scalar{};
    }
    case SigKind::String:
        *ok = true;
        return Scalar(text);
    case SigKind::ObjectPath:
        if (!isObjectPath(text)) return {};
        *ok = true;
        return Scalar(text);
    case SigKind::Signature:
        if (!SignatureParser::parseList(text).ok) return {};
        *ok = true;
        return Scalar(text);
    default:
        return {};
    }
}

// ── Leaf validation (returns error message or empty string if valid) ──

QString validateLeaf(SigKind kind, const QString& text) {
    bool ok;
    parseLeaf(kind, text, &ok);
    if (ok) return {};

    switch (kind) {
    case SigKind::Boolean:
        return QStringLiteral("expected True or False, got '%1'").arg(text);
    case SigKind::Byte:  case SigKind::Int16: case SigKind::UInt16:
    case SigKind::Int32: case SigKind::UInt32:
    case SigKind::Int64: case SigKind::UInt64: {
        QString s = text.trimmed();
        int start = (s.startsWith('-') || s.startsWith('+')) ? 1 : 0;
        if (s.size() <= start)
            return QStringLiteral("invalid integer '%1'").arg(text);
        for (int i = start; i < s.size(); i++) {
            if (!s[i].isDigit())
                return QStringLiteral("invalid integer '%1'").arg(text);
        }
        return QStringLiteral("'%1' is out of range for %2").arg(s, QString::fromLatin1(kindToString(kind)));
    }
    case SigKind::Double:
        return QStringLiteral("invalid number '%1'").arg(text);
    case SigKind::ObjectPath:
        return QStringLiteral("invalid object path '%1'").arg(text);
    case SigKind::Signature:
        return QStringLiteral("invalid type signature '%1': %2")
            .arg(text, SignatureParser::parseList(text).error);
    default:
        return QStringLiteral("%1 is not a leaf type").arg(QString::fromLatin1(kindToString(kind)));
    }
}

} // namespace gsx::fmt
