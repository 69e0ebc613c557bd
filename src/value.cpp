#include "core.h"
#include "signature.h"
#include <QJsonArray>
#include <QJsonObject>
#include <cmath>
#include <limits>
#include <type_traits>

namespace gsx {

// ── Leaf factories ──

static QString codeOf(SigKind kind) {
    auto* m = kindMeta(kind);
    return m ? QString(QLatin1Char(m->code)) : QString();
}

Value Value::fromBool(bool v)                 { return {QStringLiteral("b"), Scalar(v)}; }
Value Value::fromByte(uint8_t v)              { return {QStringLiteral("y"), Scalar(v)}; }
Value Value::fromInt16(int16_t v)             { return {QStringLiteral("n"), Scalar(v)}; }
Value Value::fromUInt16(uint16_t v)           { return {QStringLiteral("q"), Scalar(v)}; }
Value Value::fromInt32(int32_t v)             { return {QStringLiteral("i"), Scalar(v)}; }
Value Value::fromUInt32(uint32_t v)           { return {QStringLiteral("u"), Scalar(v)}; }
Value Value::fromInt64(int64_t v)             { return {QStringLiteral("x"), Scalar(v)}; }
Value Value::fromUInt64(uint64_t v)           { return {QStringLiteral("t"), Scalar(v)}; }
Value Value::fromDouble(double v)             { return {QStringLiteral("d"), Scalar(v)}; }
Value Value::fromString(const QString& v)     { return {QStringLiteral("s"), Scalar(v)}; }
Value Value::fromObjectPath(const QString& v) { return {QStringLiteral("o"), Scalar(v)}; }
Value Value::fromSignature(const QString& v)  { return {QStringLiteral("g"), Scalar(v)}; }

// Containers have no single-scalar form: a non-leaf kind yields an invalid Value.
Value Value::leaf(SigKind kind, const Scalar& s) {
    if (!isLeafKind(kind)) return {};
    return {codeOf(kind), s};
}

// ── Container factories ──

Value Value::variant(const Value& inner) {
    return {QStringLiteral("v"), std::vector<Value>{inner}};
}

Value Value::nothing(const QString& maybeType) {
    if (!maybeType.startsWith(QLatin1Char('m'))) return {};
    return {maybeType, std::vector<Value>{}};
}

Value Value::just(const Value& inner) {
    return {QStringLiteral("m") + inner.type(), std::vector<Value>{inner}};
}

Value Value::array(const QString& elementType, std::vector<Value> items) {
    return {QStringLiteral("a") + elementType, std::move(items)};
}

Value Value::dict(const QString& keyType, const QString& valueType,
                  std::vector<std::pair<Value, Value>> entries) {
    const QString entryType = QStringLiteral("{") + keyType + valueType + QStringLiteral("}");
    std::vector<Value> kids;
    kids.reserve(entries.size());
    for (auto& e : entries)
        kids.push_back(Value(entryType, std::vector<Value>{std::move(e.first), std::move(e.second)}));
    return {QStringLiteral("a") + entryType, std::move(kids)};
}

Value Value::tuple(std::vector<Value> items) {
    QString type = QStringLiteral("(");
    for (const auto& v : items) type += v.type();
    type += QLatin1Char(')');
    return {type, std::move(items)};
}

bool Value::isNothing() const {
    return m_type.startsWith(QLatin1Char('m')) && m_children.empty();
}

bool Value::operator==(const Value& o) const {
    return m_type == o.m_type
        && m_scalar == o.m_scalar
        && m_children == o.m_children;
}

// ── Zero values ──

static Scalar zeroScalar(SigKind kind) {
    switch (kind) {
    case SigKind::Boolean:    return Scalar(false);
    case SigKind::Byte:       return Scalar(uint8_t(0));
    case SigKind::Int16:      return Scalar(int16_t(0));
    case SigKind::UInt16:     return Scalar(uint16_t(0));
    case SigKind::Int32:      return Scalar(int32_t(0));
    case SigKind::UInt32:     return Scalar(uint32_t(0));
    case SigKind::Int64:      return Scalar(int64_t(0));
    case SigKind::UInt64:     return Scalar(uint64_t(0));
    case SigKind::Double:     return Scalar(0.0);
    case SigKind::String:     return Scalar(QString());
    case SigKind::ObjectPath: return Scalar(QStringLiteral("/"));
    case SigKind::Signature:  return Scalar(QString());
    default:                  return {};
    }
}

Value Value::defaultFor(const TypeSignature& sig) {
    switch (sig.kind) {
    case SigKind::Variant:
        return variant(tuple({}));
    case SigKind::Maybe:
        return nothing(sig.text);
    case SigKind::Array:
        return array(sig.element().text, {});
    case SigKind::DictEntryArray:
        return dict(sig.keySig().text, sig.valueSig().text, {});
    case SigKind::Tuple: {
        std::vector<Value> items;
        for (const auto& c : sig.children) items.push_back(defaultFor(c));
        return tuple(std::move(items));
    }
    default:
        return leaf(sig.kind, zeroScalar(sig.kind));
    }
}

// ── Text form ──

QString Value::print() const {
    if (!isValid()) return QStringLiteral("<invalid>");
    const QChar head = m_type[0];

    if (head == 'v') {
        if (m_children.size() != 1) return QStringLiteral("<invalid>");
        return QStringLiteral("<") + m_children[0].print() + QStringLiteral(">");
    }

    if (head == 'm') {
        if (m_children.empty()) return QStringLiteral("nothing");
        const Value& inner = m_children[0];
        if (inner.type().startsWith(QLatin1Char('m')))
            return QStringLiteral("just ") + inner.print();
        return inner.print();
    }

    if (head == 'a' || head == '(') {
        QStringList parts;
        for (const auto& c : m_children) {
            if (c.isDictEntry() && c.m_children.size() == 2)
                parts << c.m_children[0].print() + QStringLiteral(": ") + c.m_children[1].print();
            else
                parts << c.print();
        }
        if (head == '(') {
            if (parts.size() == 1) return QStringLiteral("(") + parts[0] + QStringLiteral(",)");
            return QStringLiteral("(") + parts.join(QStringLiteral(", ")) + QStringLiteral(")");
        }
        if (m_type.startsWith(QStringLiteral("a{")))
            return QStringLiteral("{") + parts.join(QStringLiteral(", ")) + QStringLiteral("}");
        return QStringLiteral("[") + parts.join(QStringLiteral(", ")) + QStringLiteral("]");
    }

    if (head == 'b')
        return std::get<bool>(m_scalar) ? QStringLiteral("true") : QStringLiteral("false");
    if (head == 's' || head == 'o' || head == 'g')
        return fmt::quoted(std::get<QString>(m_scalar));
    return fmt::leafText(m_scalar);
}

// ── JSON mapping ──
//
// 64-bit integers are written as decimal strings (doubles would lose
// precision), non-finite doubles as "nan", "inf" and "-inf" (JSON has no
// literal for them), dictionaries as ordered [key, value] pairs, maybes as [] or
// [inner], variants as {"type": ..., "value": ...}.

QJsonValue Value::toJson() const {
    if (!isValid()) return QJsonValue();
    const QChar head = m_type[0];

    if (head == 'v') {
        if (m_children.size() != 1) return QJsonValue();
        QJsonObject o;
        o["type"]  = m_children[0].type();
        o["value"] = m_children[0].toJson();
        return o;
    }
    if (head == 'm' || head == '(' || head == 'a') {
        QJsonArray arr;
        for (const auto& c : m_children) {
            if (c.isDictEntry() && c.m_children.size() == 2)
                arr.append(QJsonArray{c.m_children[0].toJson(), c.m_children[1].toJson()});
            else
                arr.append(c.toJson());
        }
        return arr;
    }

    struct ToJson {
        QJsonValue operator()(std::monostate) const { return QJsonValue(); }
        QJsonValue operator()(bool v)        const { return v; }
        QJsonValue operator()(uint8_t v)     const { return int(v); }
        QJsonValue operator()(int16_t v)     const { return int(v); }
        QJsonValue operator()(uint16_t v)    const { return int(v); }
        QJsonValue operator()(int32_t v)     const { return int(v); }
        QJsonValue operator()(uint32_t v)    const { return double(v); }
        QJsonValue operator()(int64_t v)     const { return QString::number(qlonglong(v)); }
        QJsonValue operator()(uint64_t v)    const { return QString::number(qulonglong(v)); }
        QJsonValue operator()(double v)      const {
            if (std::isnan(v)) return QStringLiteral("nan");
            if (std::isinf(v)) return v > 0 ? QStringLiteral("inf") : QStringLiteral("-inf");
            return v;
        }
        QJsonValue operator()(const QString& v) const { return v; }
    };
    return std::visit(ToJson{}, m_scalar);
}

template<class T>
static bool jsonInteger(const QJsonValue& json, T* out) {
    using L = std::numeric_limits<T>;
    if (json.isString()) {
        bool ok = false;
        if constexpr (std::is_signed_v<T>) {
            qlonglong v = json.toString().toLongLong(&ok, 10);
            if (!ok || v < (qlonglong)L::min() || v > (qlonglong)L::max()) return false;
            *out = static_cast<T>(v);
        } else {
            qulonglong v = json.toString().toULongLong(&ok, 10);
            if (!ok || v > (qulonglong)L::max()) return false;
            *out = static_cast<T>(v);
        }
        return true;
    }
    if (!json.isDouble()) return false;
    double d = json.toDouble();
    if (std::floor(d) != d) return false;
    if (d < (double)L::min() || d > (double)L::max()) return false;
    *out = static_cast<T>(d);
    return true;
}

template<class T>
static Value jsonLeaf(SigKind kind, const QJsonValue& json, bool* ok) {
    T v{};
    *ok = jsonInteger<T>(json, &v);
    return *ok ? Value::leaf(kind, Scalar(v)) : Value();
}

Value Value::fromJson(const QJsonValue& json, const TypeSignature& sig, bool* ok) {
    *ok = false;
    switch (sig.kind) {
    case SigKind::Boolean:
        if (!json.isBool()) return {};
        *ok = true;
        return fromBool(json.toBool());
    case SigKind::Byte:   return jsonLeaf<uint8_t>(sig.kind, json, ok);
    case SigKind::Int16:  return jsonLeaf<int16_t>(sig.kind, json, ok);
    case SigKind::UInt16: return jsonLeaf<uint16_t>(sig.kind, json, ok);
    case SigKind::Int32:  return jsonLeaf<int32_t>(sig.kind, json, ok);
    case SigKind::UInt32: return jsonLeaf<uint32_t>(sig.kind, json, ok);
    case SigKind::Int64:  return jsonLeaf<int64_t>(sig.kind, json, ok);
    case SigKind::UInt64: return jsonLeaf<uint64_t>(sig.kind, json, ok);
    case SigKind::Double:
        if (json.isString()) {
            const QString t = json.toString();
            if (t == QLatin1String("nan")) { *ok = true; return fromDouble(std::numeric_limits<double>::quiet_NaN()); }
            if (t == QLatin1String("inf")) { *ok = true; return fromDouble(std::numeric_limits<double>::infinity()); }
            if (t == QLatin1String("-inf")) { *ok = true; return fromDouble(-std::numeric_limits<double>::infinity()); }
            return {};
        }
        if (!json.isDouble()) return {};
        *ok = true;
        return fromDouble(json.toDouble());
    case SigKind::String:
        if (!json.isString()) return {};
        *ok = true;
        return fromString(json.toString());
    case SigKind::ObjectPath:
        if (!json.isString() || !fmt::isObjectPath(json.toString())) return {};
        *ok = true;
        return fromObjectPath(json.toString());
    case SigKind::Signature:
        if (!json.isString() || !SignatureParser::parseList(json.toString()).ok) return {};
        *ok = true;
        return fromSignature(json.toString());
    case SigKind::Variant: {
        if (!json.isObject()) return {};
        QJsonObject o = json.toObject();
        auto parsed = SignatureParser::parse(o["type"].toString());
        if (!parsed.ok) return {};
        Value inner = fromJson(o["value"], parsed.signature, ok);
        return *ok ? variant(inner) : Value();
    }
    case SigKind::Maybe: {
        if (!json.isArray()) return {};
        QJsonArray arr = json.toArray();
        if (arr.isEmpty()) { *ok = true; return nothing(sig.text); }
        if (arr.size() != 1) return {};
        Value inner = fromJson(arr[0], sig.element(), ok);
        return *ok ? just(inner) : Value();
    }
    case SigKind::Array: {
        if (!json.isArray()) return {};
        std::vector<Value> items;
        for (const auto& item : json.toArray()) {
            items.push_back(fromJson(item, sig.element(), ok));
            if (!*ok) return {};
        }
        *ok = true;
        return array(sig.element().text, std::move(items));
    }
    case SigKind::DictEntryArray: {
        if (!json.isArray()) return {};
        std::vector<std::pair<Value, Value>> entries;
        for (const auto& item : json.toArray()) {
            QJsonArray pair = item.toArray();
            if (pair.size() != 2) { *ok = false; return {}; }
            Value k = fromJson(pair[0], sig.keySig(), ok);
            if (!*ok) return {};
            Value v = fromJson(pair[1], sig.valueSig(), ok);
            if (!*ok) return {};
            entries.emplace_back(std::move(k), std::move(v));
        }
        *ok = true;
        return dict(sig.keySig().text, sig.valueSig().text, std::move(entries));
    }
    case SigKind::Tuple: {
        if (!json.isArray()) return {};
        QJsonArray arr = json.toArray();
        if (arr.size() != (int)sig.children.size()) return {};
        std::vector<Value> items;
        for (int i = 0; i < arr.size(); i++) {
            items.push_back(fromJson(arr[i], sig.children[i], ok));
            if (!*ok) return {};
        }
        *ok = true;
        return tuple(std::move(items));
    }
    }
    return {};
}

} // namespace gsx
