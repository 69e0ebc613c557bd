#include "memory_provider.h"
#include "signature.h"
#include <QDebug>

namespace gsx {

MemoryProvider::MemoryProvider(QString name)
    : m_name(std::move(name)) {}

const MemoryProvider::Entry* MemoryProvider::entry(const QString& schemaId,
                                                    const QString& key) const {
    auto s = m_schemas.constFind(schemaId);
    if (s == m_schemas.constEnd()) return nullptr;
    auto k = s->constFind(key);
    return k == s->constEnd() ? nullptr : &k.value();
}

MemoryProvider::Entry* MemoryProvider::entry(const QString& schemaId, const QString& key) {
    auto s = m_schemas.find(schemaId);
    if (s == m_schemas.end()) return nullptr;
    auto k = s->find(key);
    return k == s->end() ? nullptr : &k.value();
}

// ── Registration ──

bool MemoryProvider::addKey(const KeyMeta& meta, bool writable) {
    auto sig = SignatureParser::parse(meta.type);
    if (!sig.ok) {
        qWarning() << "MemoryProvider: key" << meta.key << "in" << meta.schemaId
                   << "has a bad type" << meta.type << ":" << sig.error;
        return false;
    }
    if (meta.defaultValue.isValid() && meta.defaultValue.type() != sig.signature.text) {
        qWarning() << "MemoryProvider: default for" << meta.key << "has type"
                   << meta.defaultValue.type() << "but the key is" << sig.signature.text;
        return false;
    }

    Entry e;
    e.meta = meta;
    e.meta.type = sig.signature.text;
    e.writable = writable;
    m_schemas[meta.schemaId].insert(meta.key, e);
    qDebug() << "MemoryProvider: Registered" << meta.schemaId + QLatin1Char('.') + meta.key
             << "type" << e.meta.type;
    return true;
}

void MemoryProvider::setWritable(const QString& schemaId, const QString& key, bool writable) {
    if (Entry* e = entry(schemaId, key)) e->writable = writable;
}

bool MemoryProvider::setStoredValue(const QString& schemaId, const QString& key,
                                    const QString& path, const Value& value) {
    Entry* e = entry(schemaId, key);
    if (!e) return false;
    e->values.insert(path, value);
    return true;
}

void MemoryProvider::unset(const QString& schemaId, const QString& key, const QString& path) {
    if (Entry* e = entry(schemaId, key)) e->values.remove(path);
}

void MemoryProvider::clear() {
    m_schemas.clear();
    m_writeCount = 0;
}

// ── SettingsProvider ──

QStringList MemoryProvider::schemas() const {
    return m_schemas.keys();
}

QStringList MemoryProvider::keys(const QString& schemaId) const {
    return m_schemas.value(schemaId).keys();
}

bool MemoryProvider::lookup(const QString& schemaId, const QString& key, KeyMeta* out) const {
    const Entry* e = entry(schemaId, key);
    if (!e) return false;
    if (out) *out = e->meta;
    return true;
}

Value MemoryProvider::read(const QString& schemaId, const QString& key,
                           const QString& path) const {
    const Entry* e = entry(schemaId, key);
    if (!e) return {};
    return e->values.value(path);
}

bool MemoryProvider::isWritable(const QString& schemaId, const QString& key) const {
    const Entry* e = entry(schemaId, key);
    return e && e->writable;
}

CommitResult MemoryProvider::write(const QString& schemaId, const QString& key,
                                   const QString& path, const Value& value) {
    Entry* e = entry(schemaId, key);
    const QString full = schemaId + QLatin1Char('.') + key;
    if (!e) {
        qWarning() << "MemoryProvider: write to unknown key" << full;
        return CommitResult::rejected(QStringLiteral("no such key '%1'").arg(full));
    }
    if (!e->writable) {
        qWarning() << "MemoryProvider: write to read-only key" << full;
        return CommitResult::rejected(QStringLiteral("key '%1' is not writable").arg(full));
    }
    if (value.type() != e->meta.type) {
        qWarning() << "MemoryProvider: type" << value.type() << "rejected for" << full;
        return CommitResult::rejected(QStringLiteral("key '%1' holds '%2', got '%3'")
                                          .arg(full, e->meta.type, value.type()));
    }
    // Matching type text is not enough: the payload must decode as that type
    auto sig = SignatureParser::parse(e->meta.type);
    auto shape = decompose(sig.signature, value, key);
    if (!shape.ok) {
        qWarning() << "MemoryProvider: malformed value for" << full << ":" << shape.error;
        return CommitResult::rejected(shape.error);
    }
    QString why;
    if (!e->meta.range.allows(value, &why)) {
        qWarning() << "MemoryProvider: out-of-range value for" << full << ":" << why;
        return CommitResult::rejected(why);
    }

    e->values.insert(path, value);
    m_writeCount++;
    qDebug() << "MemoryProvider: Stored" << full << (path.isEmpty() ? QString() : path)
             << "=" << value.print();
    return CommitResult::success();
}

} // namespace gsx
