#include "json_provider.h"
#include "signature.h"
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace gsx {

JsonProvider::JsonProvider(QString filePath)
    : MemoryProvider(QFileInfo(filePath).fileName())
    , m_filePath(std::move(filePath)) {}

// ── Loading ──

static KeyRange rangeFromJson(const QJsonObject& obj, const TypeSignature& sig, bool* ok) {
    *ok = true;
    const QString type = obj["type"].toString();
    if (type.isEmpty() || type == QStringLiteral("type"))
        return KeyRange::none();

    QVector<Value> values;
    for (const auto& item : obj["values"].toArray()) {
        Value v = Value::fromJson(item, sig, ok);
        if (!*ok) return {};
        values.append(v);
    }
    if (type == QStringLiteral("range") && values.size() == 2)
        return KeyRange::bounds(values[0], values[1]);
    if (type == QStringLiteral("enum"))
        return KeyRange::choices(values);
    *ok = false;
    return {};
}

static QJsonObject rangeToJson(const KeyRange& range) {
    QJsonObject o;
    o["type"] = range.typeName();
    QJsonArray values;
    for (const auto& v : range.values) values.append(v.toJson());
    o["values"] = values;
    return o;
}

bool JsonProvider::loadKey(const QString& schemaId, const QJsonObject& obj) {
    KeyMeta meta;
    meta.schemaId    = schemaId;
    meta.key         = obj["name"].toString();
    meta.type        = obj["type"].toString();
    meta.summary     = obj["summary"].toString();
    meta.description = obj["description"].toString();

    auto sig = SignatureParser::parse(meta.type);
    if (meta.key.isEmpty() || !sig.ok) {
        qWarning() << "JsonProvider: skipping key" << meta.key << "in" << schemaId
                   << ":" << (sig.ok ? QStringLiteral("no name") : sig.error);
        return false;
    }

    bool ok = true;
    if (obj.contains("default")) {
        meta.defaultValue = Value::fromJson(obj["default"], sig.signature, &ok);
        if (!ok) {
            qWarning() << "JsonProvider: default of" << meta.key << "does not fit" << meta.type;
            return false;
        }
    }
    meta.range = rangeFromJson(obj["range"].toObject(), sig.signature, &ok);
    if (!ok) {
        qWarning() << "JsonProvider: bad range for" << meta.key;
        return false;
    }

    if (!addKey(meta, obj["writable"].toBool(true)))
        return false;

    const QJsonObject values = obj["values"].toObject();
    for (auto it = values.begin(); it != values.end(); ++it) {
        Value v = Value::fromJson(it.value(), sig.signature, &ok);
        if (!ok) {
            qWarning() << "JsonProvider: stored value of" << meta.key << "at"
                       << it.key() << "does not fit" << meta.type;
            continue;
        }
        setStoredValue(schemaId, meta.key, it.key(), v);
    }
    return true;
}

bool JsonProvider::load() {
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QStringLiteral("cannot open %1: %2").arg(m_filePath, file.errorString());
        return false;
    }
    QJsonParseError perr;
    QJsonDocument jdoc = QJsonDocument::fromJson(file.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !jdoc.isObject()) {
        m_error = QStringLiteral("%1 is not a settings store: %2")
                      .arg(m_filePath, perr.errorString());
        return false;
    }

    clear();
    int loaded = 0;
    for (const auto& s : jdoc.object()["schemas"].toArray()) {
        const QJsonObject schema = s.toObject();
        const QString id = schema["id"].toString();
        if (id.isEmpty()) continue;
        for (const auto& k : schema["keys"].toArray())
            if (loadKey(id, k.toObject())) loaded++;
    }
    qDebug() << "JsonProvider: Loaded" << loaded << "key(s) from" << m_filePath;
    m_error.clear();
    return true;
}

// ── Saving ──

bool JsonProvider::save() const {
    QJsonArray schemaArr;
    for (auto s = m_schemas.constBegin(); s != m_schemas.constEnd(); ++s) {
        QJsonArray keyArr;
        for (auto k = s->constBegin(); k != s->constEnd(); ++k) {
            const Entry& e = k.value();
            QJsonObject ko;
            ko["name"] = e.meta.key;
            ko["type"] = e.meta.type;
            if (!e.meta.summary.isEmpty())     ko["summary"] = e.meta.summary;
            if (!e.meta.description.isEmpty()) ko["description"] = e.meta.description;
            if (e.meta.defaultValue.isValid()) ko["default"] = e.meta.defaultValue.toJson();
            if (!e.meta.range.isEmpty())       ko["range"] = rangeToJson(e.meta.range);
            ko["writable"] = e.writable;

            QJsonObject values;
            for (auto v = e.values.constBegin(); v != e.values.constEnd(); ++v)
                values[v.key()] = v.value().toJson();
            ko["values"] = values;
            keyArr.append(ko);
        }
        QJsonObject so;
        so["id"] = s.key();
        so["keys"] = keyArr;
        schemaArr.append(so);
    }
    QJsonObject root;
    root["schemas"] = schemaArr;

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QStringLiteral("cannot write %1: %2").arg(m_filePath, file.errorString());
        qWarning() << "JsonProvider:" << m_error;
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return true;
}

CommitResult JsonProvider::write(const QString& schemaId, const QString& key,
                                 const QString& path, const Value& value) {
    const Value previous = read(schemaId, key, path);
    CommitResult r = MemoryProvider::write(schemaId, key, path, value);
    if (!r.ok) return r;
    if (!save()) {
        // Keep memory and file in agreement
        if (previous.isValid()) setStoredValue(schemaId, key, path, previous);
        else unset(schemaId, key, path);
        return CommitResult::rejected(m_error);
    }
    return r;
}

} // namespace gsx
