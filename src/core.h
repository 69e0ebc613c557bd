#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QJsonValue>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

namespace gsx {

// ── Signature kind enum ──

enum class SigKind : uint8_t {
    Boolean, Byte,
    Int16, UInt16, Int32, UInt32, Int64, UInt64,
    Double,
    String, ObjectPath, Signature,
    Variant, Maybe, Array, DictEntryArray, Tuple
};

// ── Unified kind metadata table (single source of truth) ──

struct KindMeta {
    SigKind     kind;
    const char* name;      // "Int32", "DictEntryArray"
    char        code;      // leading signature character
    bool        leaf;      // scalar, no children
    bool        basic;     // legal as a dictionary key
};

inline constexpr KindMeta kKindMeta[] = {
    // kind                     name              code  leaf   basic
    {SigKind::Boolean,        "Boolean",        'b',  true,  true },
    {SigKind::Byte,           "Byte",           'y',  true,  true },
    {SigKind::Int16,          "Int16",          'n',  true,  true },
    {SigKind::UInt16,         "UInt16",         'q',  true,  true },
    {SigKind::Int32,          "Int32",          'i',  true,  true },
    {SigKind::UInt32,         "UInt32",         'u',  true,  true },
    {SigKind::Int64,          "Int64",          'x',  true,  true },
    {SigKind::UInt64,         "UInt64",         't',  true,  true },
    {SigKind::Double,         "Double",         'd',  true,  true },
    {SigKind::String,         "String",         's',  true,  true },
    {SigKind::ObjectPath,     "ObjectPath",     'o',  true,  true },
    {SigKind::Signature,      "Signature",      'g',  true,  true },
    {SigKind::Variant,        "Variant",        'v',  false, false},
    {SigKind::Maybe,          "Maybe",          'm',  false, false},
    {SigKind::Array,          "Array",          'a',  false, false},
    {SigKind::DictEntryArray, "DictEntryArray", 'a',  false, false},
    {SigKind::Tuple,          "Tuple",          '(',  false, false},
};

inline constexpr const KindMeta* kindMeta(SigKind k) {
    for (const auto& m : kKindMeta)
        if (m.kind == k) return &m;
    return nullptr;
}

inline constexpr bool isLeafKind(SigKind k)  { auto* m = kindMeta(k); return m && m->leaf; }
inline constexpr bool isBasicKind(SigKind k) { auto* m = kindMeta(k); return m && m->basic; }

inline const char* kindToString(SigKind k) {
    auto* m = kindMeta(k);
    return m ? m->name : "Unknown";
}

// Leaf kinds only; containers need more than one character to classify.
inline bool leafKindFromCode(QChar c, SigKind* out) {
    for (const auto& m : kKindMeta) {
        if (m.leaf && c == QLatin1Char(m.code)) {
            *out = m.kind;
            return true;
        }
    }
    return false;
}

// ── Errors ──

enum class ErrorKind : uint8_t {
    None,
    MalformedSignature,
    TypeMismatch,
    ValueCoercionError,
    StructuralMismatch,
    IndexOutOfRange,
    PersistenceRejected
};

const char* errorKindName(ErrorKind k);

// ── TypeSignature ──

struct TypeSignature {
    QString                text;   // canonical: '@' is stored as 'v'
    SigKind                kind = SigKind::Variant;
    std::vector<TypeSignature> children;

    bool isLeaf()  const { return isLeafKind(kind); }
    bool isBasic() const { return isBasicKind(kind); }

    // Array / Maybe
    const TypeSignature& element()  const { return children[0]; }
    // DictEntryArray
    const TypeSignature& keySig()   const { return children[0]; }
    const TypeSignature& valueSig() const { return children[1]; }

    bool operator==(const TypeSignature& o) const { return text == o.text; }
    bool operator!=(const TypeSignature& o) const { return text != o.text; }
};

// ── Scalar ──
// Closed set of leaf payloads. s/o/g all travel as QString and are told
// apart by the signature that accompanies them.

using Scalar = std::variant<
    std::monostate,
    bool, uint8_t,
    int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t,
    double, QString
>;

// ── Value ──
// Self-describing typed value: the unit exchanged with settings stores.

class Value {
public:
    Value() = default;

    static Value fromBool(bool v);
    static Value fromByte(uint8_t v);
    static Value fromInt16(int16_t v);
    static Value fromUInt16(uint16_t v);
    static Value fromInt32(int32_t v);
    static Value fromUInt32(uint32_t v);
    static Value fromInt64(int64_t v);
    static Value fromUInt64(uint64_t v);
    static Value fromDouble(double v);
    static Value fromString(const QString& v);
    static Value fromObjectPath(const QString& v);
    static Value fromSignature(const QString& v);
    static Value leaf(SigKind kind, const Scalar& s);

    static Value variant(const Value& inner);
    static Value nothing(const QString& maybeType);
    static Value just(const Value& inner);
    static Value array(const QString& elementType, std::vector<Value> items);
    static Value dict(const QString& keyType, const QString& valueType,
                      std::vector<std::pair<Value, Value>> entries);
    static Value tuple(std::vector<Value> items);

    static Value defaultFor(const TypeSignature& sig);
    static Value fromJson(const QJsonValue& json, const TypeSignature& sig, bool* ok);

    bool isValid() const { return !m_type.isEmpty(); }
    const QString& type() const { return m_type; }
    const Scalar& scalar() const { return m_scalar; }

    int childCount() const { return static_cast<int>(m_children.size()); }
    const Value& child(int i) const { return m_children[i]; }
    const std::vector<Value>& children() const { return m_children; }

    bool isNothing() const;
    bool isDictEntry() const { return m_type.startsWith(QLatin1Char('{')); }

    QString print() const;
    QJsonValue toJson() const;

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    Value(QString type, Scalar s) : m_type(std::move(type)), m_scalar(std::move(s)) {}
    Value(QString type, std::vector<Value> kids)
        : m_type(std::move(type)), m_children(std::move(kids)) {}

    QString            m_type;
    Scalar             m_scalar;
    std::vector<Value> m_children;
};

// ── ValueNode ──

struct ValueNode {
    QString                name;
    TypeSignature          signature;        // discovered type of the unwrapped value
    bool                   compound     = false;
    int                    variantDepth = 0; // variant layers flattened into this node
    Scalar                 leaf;             // monostate for compound nodes
    std::vector<ValueNode> children;

    bool isVariantWrapped() const { return variantDepth > 0; }
    bool hasLeafValue() const { return !std::holds_alternative<std::monostate>(leaf); }

    // Single-field edit: the text is coerced when the tree is recomposed.
    void setLeafText(const QString& text) { leaf = text; }

    ValueNode*       nodeAt(const QVector<int>& path);
    const ValueNode* nodeAt(const QVector<int>& path) const;

    // Number of nodes in the subtree, this one included
    int subtreeSize() const;
};

// ── Metadata overlay ──

struct KeyRange {
    enum class Type : uint8_t { None, Range, Enum };

    Type           type = Type::None;
    QVector<Value> values;    // Range: {min, max}; Enum: allowed choices

    static KeyRange none() { return {}; }
    static KeyRange bounds(const Value& min, const Value& max);
    static KeyRange choices(const QVector<Value>& allowed);

    bool isEmpty() const { return type == Type::None || values.isEmpty(); }
    QString typeName() const;
    bool allows(const Value& v, QString* why = nullptr) const;
    QString print() const;
};

struct KeyMeta {
    QString  schemaId;
    QString  key;
    QString  type;           // declared type signature
    QString  summary;
    QString  description;
    Value    defaultValue;   // invalid when the schema declares none
    KeyRange range;
};

// Decomposed root plus the metadata it was built for.
struct KeyTree {
    KeyMeta   meta;
    QString   relocationPath;
    ValueNode root;

    QString fullPath(const QVector<int>& path) const;
};

// ── Results ──

struct DecomposeResult {
    bool      ok = false;
    ValueNode node;
    ErrorKind errorKind = ErrorKind::None;
    QString   error;
};

struct RecomposeResult {
    bool      ok = false;
    Value     value;
    ErrorKind errorKind = ErrorKind::None;
    QString   error;
};

struct DefaultResult {
    bool      ok = false;
    Value     value;
    ErrorKind errorKind = ErrorKind::None;
    QString   error;
};

struct CommitResult {
    bool      ok = false;
    ErrorKind errorKind = ErrorKind::None;
    QString   error;

    static CommitResult success() { return {true, ErrorKind::None, {}}; }
    static CommitResult rejected(const QString& why) {
        return {false, ErrorKind::PersistenceRejected, why};
    }
};

// ── Display lines ──

struct LineMeta {
    QVector<int> path;            // index path from the key root
    int          depth      = 0;
    bool         isLeaf     = false;
    bool         foldHead   = false;
    bool         variant    = false;
    QString      name;
    QString      valueText;       // leaf text or type tag
};

struct ComposeResult {
    QString           text;
    QVector<LineMeta> meta;
};

// ── Format function forward declarations ──

namespace fmt {
    QString leafText(const Scalar& s);
    QString typeTag(const TypeSignature& sig);
    QString displayValue(const ValueNode& node);
    Scalar  parseLeaf(SigKind kind, const QString& text, bool* ok);
    QString validateLeaf(SigKind kind, const QString& text);
    bool    isObjectPath(const QString& text);
    QString quoted(const QString& s);
    QString indent(int depth);
} // namespace fmt

// ── Codec ──

DecomposeResult decompose(const TypeSignature& sig, const Value& value, const QString& name);
RecomposeResult recompose(const ValueNode& root, const TypeSignature& originalSig);

// ── Default resolution ──

DefaultResult resolveDefault(const Value& defaultValue, bool isCompoundWhole, int siblingIndex);
// Applies resolveDefault down an index path; wrappers and maybes pass through
DefaultResult resolveDefaultAt(const Value& defaultValue, const ValueNode& root,
                               const QVector<int>& path);

// ── Compose ──

ComposeResult compose(const KeyTree& tree);
QString describe(const KeyTree& tree, const QVector<int>& path);

QVector<int> parseNodePath(const QString& text, bool* ok);
QString nodePathToString(const QVector<int>& path);

} // namespace gsx
