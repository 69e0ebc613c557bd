#pragma once
#include "provider.h"
#include <QHash>
#include <QMap>

namespace gsx {

// In-process settings store.
//
// Keys are registered with their metadata up front; values live per
// relocation path. Writes are checked the way a real store checks them:
// unknown or read-only keys, values of the wrong type and values outside
// the key's range are rejected with PersistenceRejected and leave the
// stored value untouched.
class MemoryProvider : public SettingsProvider {
public:
    explicit MemoryProvider(QString name = QStringLiteral("memory"));

    // False when the declared type or the default value is unusable
    bool addKey(const KeyMeta& meta, bool writable = true);
    void setWritable(const QString& schemaId, const QString& key, bool writable);

    // Seeds a value without the write checks (store loading, tests)
    bool setStoredValue(const QString& schemaId, const QString& key,
                        const QString& path, const Value& value);
    void unset(const QString& schemaId, const QString& key, const QString& path);

    int writeCount() const { return m_writeCount; }
    void clear();

    QStringList schemas() const override;
    QStringList keys(const QString& schemaId) const override;
    bool lookup(const QString& schemaId, const QString& key, KeyMeta* out) const override;
    Value read(const QString& schemaId, const QString& key, const QString& path) const override;
    bool isWritable(const QString& schemaId, const QString& key) const override;
    CommitResult write(const QString& schemaId, const QString& key,
                       const QString& path, const Value& value) override;
    QString name() const override { return m_name; }

protected:
    struct Entry {
        KeyMeta               meta;
        bool                  writable = true;
        QHash<QString, Value> values;   // relocation path -> stored value
    };
    using KeyMap = QMap<QString, Entry>;

    const Entry* entry(const QString& schemaId, const QString& key) const;
    Entry*       entry(const QString& schemaId, const QString& key);

    QMap<QString, KeyMap> m_schemas;
    QString               m_name;
    int                   m_writeCount = 0;
};

} // namespace gsx
