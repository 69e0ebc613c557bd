#include "core.h"
#include "signature.h"
#include <QHash>

namespace gsx {

// ── ValueNode ──

ValueNode* ValueNode::nodeAt(const QVector<int>& path) {
    ValueNode* cur = this;
    for (int idx : path) {
        if (idx < 0 || idx >= (int)cur->children.size()) return nullptr;
        cur = &cur->children[idx];
    }
    return cur;
}

const ValueNode* ValueNode::nodeAt(const QVector<int>& path) const {
    const ValueNode* cur = this;
    for (int idx : path) {
        if (idx < 0 || idx >= (int)cur->children.size()) return nullptr;
        cur = &cur->children[idx];
    }
    return cur;
}

int ValueNode::subtreeSize() const {
    int n = 1;
    for (const auto& c : children) n += c.subtreeSize();
    return n;
}

namespace {

bool scalarMatches(SigKind kind, const Scalar& s) {
    switch (kind) {
    case SigKind::Boolean:    return std::holds_alternative<bool>(s);
    case SigKind::Byte:       return std::holds_alternative<uint8_t>(s);
    case SigKind::Int16:      return std::holds_alternative<int16_t>(s);
    case SigKind::UInt16:     return std::holds_alternative<uint16_t>(s);
    case SigKind::Int32:      return std::holds_alternative<int32_t>(s);
    case SigKind::UInt32:     return std::holds_alternative<uint32_t>(s);
    case SigKind::Int64:      return std::holds_alternative<int64_t>(s);
    case SigKind::UInt64:     return std::holds_alternative<uint64_t>(s);
    case SigKind::Double:     return std::holds_alternative<double>(s);
    case SigKind::String:
    case SigKind::ObjectPath:
    case SigKind::Signature:  return std::holds_alternative<QString>(s);
    default:                  return false;
    }
}

// Object paths and signatures carry a QString that must also parse, or the
// recomposer would refuse the untouched leaf. Empty when the payload is fine.
QString invalidPayload(SigKind kind, const Scalar& s) {
    if (kind == SigKind::ObjectPath) {
        const QString& text = std::get<QString>(s);
        if (!fmt::isObjectPath(text))
            return QStringLiteral("invalid object path '%1'").arg(text);
    } else if (kind == SigKind::Signature) {
        const QString& text = std::get<QString>(s);
        auto parsed = SignatureParser::parseList(text);
        if (!parsed.ok)
            return QStringLiteral("invalid type signature '%1': %2").arg(text, parsed.error);
    }
    return {};
}

// ── Decomposer ──
//
// One node per container level and per element. Variants are resolved
// against the type they actually carry; below the root the variant level
// itself disappears and the inner node records it in variantDepth.

class Decomposer {
public:
    ErrorKind errorKind = ErrorKind::None;
    QString   error;

    bool build(const TypeSignature& sig, const Value& value,
               const QString& name, bool isRoot, ValueNode& out) {
        if (value.type() != sig.text)
            return fail(ErrorKind::TypeMismatch,
                        QStringLiteral("'%1': expected type '%2', got '%3'")
                            .arg(name, sig.text, value.type()));

        out.name = name;
        out.signature = sig;

        switch (sig.kind) {
        case SigKind::Variant:        return buildVariant(value, name, isRoot, out);
        case SigKind::Maybe:          return buildMaybe(sig, value, name, out);
        case SigKind::Array:          return buildArray(sig, value, out);
        case SigKind::DictEntryArray: return buildDict(sig, value, out);
        case SigKind::Tuple:          return buildTuple(sig, value, out);
        default:                      return buildLeaf(sig, value, name, out);
        }
    }

private:
    bool fail(ErrorKind kind, const QString& msg) {
        errorKind = kind;
        error = msg;
        return false;
    }

    bool buildLeaf(const TypeSignature& sig, const Value& value,
                   const QString& name, ValueNode& out) {
        if (!scalarMatches(sig.kind, value.scalar()))
            return fail(ErrorKind::TypeMismatch,
                        QStringLiteral("'%1': payload does not hold a %2")
                            .arg(name, QString::fromLatin1(kindToString(sig.kind))));
        QString bad = invalidPayload(sig.kind, value.scalar());
        if (!bad.isEmpty())
            return fail(ErrorKind::TypeMismatch, QStringLiteral("'%1': %2").arg(name, bad));
        out.compound = false;
        out.leaf = value.scalar();
        return true;
    }

    bool buildVariant(const Value& value, const QString& name,
                      bool isRoot, ValueNode& out) {
        if (value.childCount() != 1)
            return fail(ErrorKind::TypeMismatch,
                        QStringLiteral("'%1': variant holds %2 values, expected 1")
                            .arg(name).arg(value.childCount()));
        const Value& inner = value.child(0);
        auto discovered = SignatureParser::parse(inner.type());
        if (!discovered.ok)
            return fail(ErrorKind::MalformedSignature,
                        QStringLiteral("'%1': variant carries bad type '%2': %3")
                            .arg(name, inner.type(), discovered.error));

        if (isRoot) {
            // The root is never elided: keep the wrapper, hang the content below it
            out.compound = true;
            out.children.emplace_back();
            return build(discovered.signature, inner, name, false, out.children.back());
        }

        ValueNode flat;
        if (!build(discovered.signature, inner, name, false, flat))
            return false;
        flat.variantDepth += 1;
        out = std::move(flat);
        return true;
    }

    bool buildMaybe(const TypeSignature& sig, const Value& value,
                    const QString& name, ValueNode& out) {
        out.compound = true;
        if (value.childCount() == 0)
            return true;   // absent
        if (value.childCount() > 1)
            return fail(ErrorKind::TypeMismatch,
                        QStringLiteral("'%1': maybe holds %2 values, expected at most 1")
                            .arg(name).arg(value.childCount()));
        out.children.emplace_back();
        return build(sig.element(), value.child(0), name, false, out.children.back());
    }

    bool buildArray(const TypeSignature& sig, const Value& value, ValueNode& out) {
        out.compound = true;
        out.children.reserve(value.childCount());
        for (int i = 0; i < value.childCount(); i++) {
            out.children.emplace_back();
            if (!build(sig.element(), value.child(i), QString::number(i), false,
                       out.children.back()))
                return false;
        }
        return true;
    }

    // Map semantics: a repeated key keeps its first position and its last value.
    bool buildDict(const TypeSignature& sig, const Value& value, ValueNode& out) {
        out.compound = true;
        QHash<QString, int> seen;
        const QString entryType = sig.text.mid(1);
        for (int i = 0; i < value.childCount(); i++) {
            const Value& entry = value.child(i);
            if (entry.type() != entryType || entry.childCount() != 2)
                return fail(ErrorKind::TypeMismatch,
                            QStringLiteral("'%1': entry %2 is not a '%3' pair")
                                .arg(out.name).arg(i).arg(entryType));
            const Value& keyValue = entry.child(0);
            if (keyValue.type() != sig.keySig().text
                || !scalarMatches(sig.keySig().kind, keyValue.scalar()))
                return fail(ErrorKind::TypeMismatch,
                            QStringLiteral("'%1': entry %2 has a key that is not a %3")
                                .arg(out.name).arg(i)
                                .arg(QString::fromLatin1(kindToString(sig.keySig().kind))));
            QString badKey = invalidPayload(sig.keySig().kind, keyValue.scalar());
            if (!badKey.isEmpty())
                return fail(ErrorKind::TypeMismatch,
                            QStringLiteral("'%1': entry %2: %3").arg(out.name).arg(i).arg(badKey));
            const QString key = fmt::leafText(entry.child(0).scalar());

            ValueNode child;
            if (!build(sig.valueSig(), entry.child(1), key, false, child))
                return false;

            auto it = seen.constFind(key);
            if (it != seen.constEnd()) {
                out.children[it.value()] = std::move(child);
            } else {
                seen.insert(key, (int)out.children.size());
                out.children.push_back(std::move(child));
            }
        }
        return true;
    }

    bool buildTuple(const TypeSignature& sig, const Value& value, ValueNode& out) {
        out.compound = true;
        if (value.childCount() != (int)sig.children.size())
            return fail(ErrorKind::TypeMismatch,
                        QStringLiteral("'%1': tuple has %2 components, type '%3' declares %4")
                            .arg(out.name).arg(value.childCount())
                            .arg(sig.text).arg((int)sig.children.size()));
        out.children.reserve(value.childCount());
        for (int i = 0; i < value.childCount(); i++) {
            out.children.emplace_back();
            if (!build(sig.children[i], value.child(i), QString::number(i), false,
                       out.children.back()))
                return false;
        }
        return true;
    }
};

} // namespace

DecomposeResult decompose(const TypeSignature& sig, const Value& value, const QString& name) {
    DecomposeResult result;
    Decomposer d;
    if (!d.build(sig, value, name, true, result.node)) {
        result.node = ValueNode{};
        result.errorKind = d.errorKind;
        result.error = d.error;
        return result;
    }
    result.ok = true;
    return result;
}

} // namespace gsx
