#include "core.h"
#include <QSet>

namespace gsx {

namespace {

const TypeSignature& variantSig() {
    static const TypeSignature sig{QStringLiteral("v"), SigKind::Variant, {}};
    return sig;
}

bool holdsKind(SigKind kind, const Scalar& s) {
    switch (kind) {
    case SigKind::Boolean: return std::holds_alternative<bool>(s);
    case SigKind::Byte:    return std::holds_alternative<uint8_t>(s);
    case SigKind::Int16:   return std::holds_alternative<int16_t>(s);
    case SigKind::UInt16:  return std::holds_alternative<uint16_t>(s);
    case SigKind::Int32:   return std::holds_alternative<int32_t>(s);
    case SigKind::UInt32:  return std::holds_alternative<uint32_t>(s);
    case SigKind::Int64:   return std::holds_alternative<int64_t>(s);
    case SigKind::UInt64:  return std::holds_alternative<uint64_t>(s);
    case SigKind::Double:  return std::holds_alternative<double>(s);
    default:               return false;   // string kinds always go through validation
    }
}

// ── Recomposer ──
//
// Walks the tree against the declared signature. Every step yields a
// complete typed Value; containers collect their children's Values.
// At a variant position the node's own (discovered) signature takes over
// and the flattened variant levels are put back.

class Recomposer {
public:
    ErrorKind errorKind = ErrorKind::None;
    QString   error;

    // 'sig' is the static type of the position the node occupies
    bool recomposeAs(const ValueNode& node, const TypeSignature& sig, Value& out) {
        if (sig.kind == SigKind::Variant)
            return recomposeVariant(node, out);

        if (node.isVariantWrapped())
            return fail(ErrorKind::StructuralMismatch,
                        QStringLiteral("'%1': variant content at a '%2' position")
                            .arg(node.name, sig.text));
        if (node.signature != sig)
            return fail(ErrorKind::StructuralMismatch,
                        QStringLiteral("'%1': node has type '%2', position expects '%3'")
                            .arg(node.name, node.signature.text, sig.text));
        return recomposeBody(node, sig, out);
    }

private:
    bool fail(ErrorKind kind, const QString& msg) {
        errorKind = kind;
        error = msg;
        return false;
    }

    bool recomposeVariant(const ValueNode& node, Value& out) {
        if (node.isVariantWrapped()) {
            Value inner;
            if (!recomposeBody(node, node.signature, inner))
                return false;
            for (int i = 0; i < node.variantDepth; i++)
                inner = Value::variant(inner);
            out = inner;
            return true;
        }

        // Wrapper kept in the tree (the root case)
        if (node.signature.kind == SigKind::Variant && node.compound
            && node.children.size() == 1) {
            const ValueNode& content = node.children[0];
            const TypeSignature& contentSig =
                content.isVariantWrapped() ? variantSig() : content.signature;
            Value inner;
            if (!recomposeAs(content, contentSig, inner))
                return false;
            out = Value::variant(inner);
            return true;
        }

        return fail(ErrorKind::StructuralMismatch,
                    QStringLiteral("'%1': variant position holds a plain '%2' node")
                        .arg(node.name, node.signature.text));
    }

    bool recomposeBody(const ValueNode& node, const TypeSignature& sig, Value& out) {
        if (sig.isLeaf())
            return recomposeLeaf(node, sig, out);

        if (!node.compound)
            return fail(ErrorKind::StructuralMismatch,
                        QStringLiteral("'%1': leaf node where '%2' expects children")
                            .arg(node.name, sig.text));

        switch (sig.kind) {
        case SigKind::Maybe:          return recomposeMaybe(node, sig, out);
        case SigKind::Array:          return recomposeArray(node, sig, out);
        case SigKind::DictEntryArray: return recomposeDict(node, sig, out);
        case SigKind::Tuple:          return recomposeTuple(node, sig, out);
        default:
            return fail(ErrorKind::StructuralMismatch,
                        QStringLiteral("'%1': nested variant wrapper below the root")
                            .arg(node.name));
        }
    }

    bool recomposeLeaf(const ValueNode& node, const TypeSignature& sig, Value& out) {
        if (node.compound)
            return fail(ErrorKind::StructuralMismatch,
                        QStringLiteral("'%1': compound node at leaf type '%2'")
                            .arg(node.name, sig.text));

        if (holdsKind(sig.kind, node.leaf)) {
            out = Value::leaf(sig.kind, node.leaf);
            return true;
        }

        const QString text = fmt::leafText(node.leaf);
        bool ok = false;
        Scalar s = fmt::parseLeaf(sig.kind, text, &ok);
        if (!ok)
            return fail(ErrorKind::ValueCoercionError,
                        QStringLiteral("'%1': %2").arg(node.name, fmt::validateLeaf(sig.kind, text)));
        out = Value::leaf(sig.kind, s);
        return true;
    }

    bool recomposeMaybe(const ValueNode& node, const TypeSignature& sig, Value& out) {
        if (node.children.empty()) {
            out = Value::nothing(sig.text);
            return true;
        }
        if (node.children.size() > 1)
            return fail(ErrorKind::StructuralMismatch,
                        QStringLiteral("'%1': maybe holds %2 values")
                            .arg(node.name).arg((int)node.children.size()));
        Value inner;
        if (!recomposeAs(node.children[0], sig.element(), inner))
            return false;
        out = Value::just(inner);
        return true;
    }

    bool recomposeArray(const ValueNode& node, const TypeSignature& sig, Value& out) {
        std::vector<Value> items;
        items.reserve(node.children.size());
        for (const auto& child : node.children) {
            Value v;
            if (!recomposeAs(child, sig.element(), v))
                return false;
            items.push_back(std::move(v));
        }
        out = Value::array(sig.element().text, std::move(items));
        return true;
    }

    bool recomposeDict(const ValueNode& node, const TypeSignature& sig, Value& out) {
        std::vector<std::pair<Value, Value>> entries;
        entries.reserve(node.children.size());
        QSet<QString> keys;
        for (const auto& child : node.children) {
            if (keys.contains(child.name))
                return fail(ErrorKind::StructuralMismatch,
                            QStringLiteral("'%1': duplicate dictionary key '%2'")
                                .arg(node.name, child.name));
            keys.insert(child.name);

            bool ok = false;
            Scalar k = fmt::parseLeaf(sig.keySig().kind, child.name, &ok);
            if (!ok)
                return fail(ErrorKind::ValueCoercionError,
                            QStringLiteral("'%1': key %2")
                                .arg(node.name, fmt::validateLeaf(sig.keySig().kind, child.name)));

            Value v;
            if (!recomposeAs(child, sig.valueSig(), v))
                return false;
            entries.emplace_back(Value::leaf(sig.keySig().kind, k), std::move(v));
        }
        out = Value::dict(sig.keySig().text, sig.valueSig().text, std::move(entries));
        return true;
    }

    bool recomposeTuple(const ValueNode& node, const TypeSignature& sig, Value& out) {
        if (node.children.size() != sig.children.size())
            return fail(ErrorKind::StructuralMismatch,
                        QStringLiteral("'%1': tuple '%2' needs %3 components, node has %4")
                            .arg(node.name, sig.text)
                            .arg((int)sig.children.size())
                            .arg((int)node.children.size()));
        std::vector<Value> items;
        items.reserve(node.children.size());
        for (size_t i = 0; i < sig.children.size(); i++) {
            Value v;
            if (!recomposeAs(node.children[i], sig.children[i], v))
                return false;
            items.push_back(std::move(v));
        }
        out = Value::tuple(std::move(items));
        return true;
    }
};

} // namespace

RecomposeResult recompose(const ValueNode& root, const TypeSignature& originalSig) {
    Recomposer r;
    Value v;
    if (!r.recomposeAs(root, originalSig, v))
        return {false, {}, r.errorKind, r.error};
    if (v.type() != originalSig.text)
        return {false, {}, ErrorKind::StructuralMismatch,
                QStringLiteral("recomposed type '%1' differs from '%2'")
                    .arg(v.type(), originalSig.text)};
    return {true, v, ErrorKind::None, {}};
}

} // namespace gsx
