#include "core.h"

namespace gsx {

// ── KeyRange ──

KeyRange KeyRange::bounds(const Value& min, const Value& max) {
    KeyRange r;
    r.type = Type::Range;
    r.values = {min, max};
    return r;
}

KeyRange KeyRange::choices(const QVector<Value>& allowed) {
    KeyRange r;
    r.type = Type::Enum;
    r.values = allowed;
    return r;
}

QString KeyRange::typeName() const {
    switch (type) {
    case Type::None:  return QStringLiteral("type");
    case Type::Range: return QStringLiteral("range");
    case Type::Enum:  return QStringLiteral("enum");
    }
    return {};
}

QString KeyRange::print() const {
    QStringList parts;
    for (const auto& v : values) parts << v.print();
    return typeName() + QStringLiteral(" : [") + parts.join(QStringLiteral(", ")) + QStringLiteral("]");
}

bool KeyRange::allows(const Value& v, QString* why) const {
    if (isEmpty()) return true;

    if (type == Type::Range) {
        const Value& lo = values[0];
        const Value& hi = values.size() > 1 ? values[1] : values[0];
        if (v.type() != lo.type()) {
            if (why) *why = QStringLiteral("value of type '%1' checked against a '%2' range")
                                .arg(v.type(), lo.type());
            return false;
        }
        // Same alternative on both sides, so variant ordering is value ordering
        if (v.scalar() < lo.scalar() || hi.scalar() < v.scalar()) {
            if (why) *why = QStringLiteral("%1 is outside the range [%2, %3]")
                                .arg(v.print(), lo.print(), hi.print());
            return false;
        }
        return true;
    }

    for (const auto& choice : values)
        if (choice == v) return true;
    if (why) {
        QStringList names;
        for (const auto& choice : values) names << choice.print();
        *why = QStringLiteral("%1 is not one of %2").arg(v.print(), names.join(QStringLiteral(", ")));
    }
    return false;
}

// ── Default resolution ──
//
// A compound default is matched to an element by the element's position
// among its siblings, never by comparing values.

static Value unwrapVariants(Value v) {
    while (v.isValid() && v.type().startsWith(QLatin1Char('v')))
        v = Value(v.child(0));
    return v;
}

DefaultResult resolveDefault(const Value& defaultValue, bool isCompoundWhole, int siblingIndex) {
    if (!defaultValue.isValid() || isCompoundWhole)
        return {true, defaultValue, ErrorKind::None, {}};

    const Value d = unwrapVariants(defaultValue);
    const QString& t = d.type();
    const bool isDict = t.startsWith(QStringLiteral("a{"));
    const bool positional = t.startsWith(QLatin1Char('a')) || t.startsWith(QLatin1Char('('));
    if (!positional)
        return {true, defaultValue, ErrorKind::None, {}};

    if (siblingIndex < 0 || siblingIndex >= d.childCount())
        return {false, {}, ErrorKind::IndexOutOfRange,
                QStringLiteral("default %1 has %2 elements, element %3 requested")
                    .arg(d.print()).arg(d.childCount()).arg(siblingIndex)};

    const Value& element = d.child(siblingIndex);
    return {true, isDict ? element.child(1) : element, ErrorKind::None, {}};
}

DefaultResult resolveDefaultAt(const Value& defaultValue, const ValueNode& root,
                               const QVector<int>& path) {
    if (path.isEmpty())
        return resolveDefault(defaultValue, true, 0);

    Value cur = defaultValue;
    const ValueNode* node = &root;
    for (int idx : path) {
        if (!cur.isValid())
            return {true, cur, ErrorKind::None, {}};
        if (idx < 0 || idx >= (int)node->children.size())
            return {false, {}, ErrorKind::IndexOutOfRange,
                    QStringLiteral("no element %1 below '%2'").arg(idx).arg(node->name)};

        const SigKind k = node->signature.kind;
        if (k == SigKind::Variant && !node->isVariantWrapped()) {
            // Kept wrapper: its only child is the variant's content
            cur = unwrapVariants(cur);
        } else if (k == SigKind::Maybe) {
            const Value d = unwrapVariants(cur);
            if (d.childCount() == 0)
                return {false, {}, ErrorKind::IndexOutOfRange,
                        QStringLiteral("default for '%1' is nothing").arg(node->name)};
            cur = d.child(0);
        } else {
            auto r = resolveDefault(cur, false, idx);
            if (!r.ok) return r;
            cur = r.value;
        }
        node = &node->children[idx];
    }
    return {true, cur, ErrorKind::None, {}};
}

} // namespace gsx
