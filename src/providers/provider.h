#pragma once
#include "core.h"
#include <QStringList>

namespace gsx {

// A settings store: schema metadata on one side, stored values keyed by
// schema id + key name + optional relocation path on the other.
class SettingsProvider {
public:
    virtual ~SettingsProvider() = default;

    // --- Subclasses MUST implement these ---
    virtual QStringList schemas() const = 0;
    virtual QStringList keys(const QString& schemaId) const = 0;
    virtual bool lookup(const QString& schemaId, const QString& key, KeyMeta* out) const = 0;

    // Invalid Value when nothing is stored for the key at this path.
    // An empty path selects the schema's own location.
    virtual Value read(const QString& schemaId, const QString& key,
                       const QString& path) const = 0;

    // --- Optional overrides ---
    virtual bool isWritable(const QString& schemaId, const QString& key) const {
        Q_UNUSED(schemaId); Q_UNUSED(key);
        return false;
    }

    virtual CommitResult write(const QString& schemaId, const QString& key,
                               const QString& path, const Value& value) {
        Q_UNUSED(schemaId); Q_UNUSED(key); Q_UNUSED(path); Q_UNUSED(value);
        return CommitResult::rejected(QStringLiteral("settings store is read-only"));
    }

    // Human-readable label for this store.
    // Examples: "memory", "settings.json"
    virtual QString name() const { return {}; }

    // --- Derived convenience (non-virtual, never override) ---

    bool hasKey(const QString& schemaId, const QString& key) const {
        KeyMeta m;
        return lookup(schemaId, key, &m);
    }
};

} // namespace gsx
