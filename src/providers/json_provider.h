#pragma once
#include "memory_provider.h"

class QJsonObject;

namespace gsx {

// MemoryProvider backed by a JSON file. The whole store (schema metadata
// and stored values) is written back after every accepted write.
//
// {
//   "schemas": [
//     { "id": "org.example.app",
//       "keys": [
//         { "name": "volume", "type": "i", "summary": "...", "description": "...",
//           "default": 5, "range": { "type": "range", "values": [0, 10] },
//           "writable": true, "values": { "": 7 } } ] } ]
// }
class JsonProvider : public MemoryProvider {
public:
    explicit JsonProvider(QString filePath);

    bool load();
    bool save() const;

    const QString& filePath() const { return m_filePath; }
    const QString& errorString() const { return m_error; }

    CommitResult write(const QString& schemaId, const QString& key,
                       const QString& path, const Value& value) override;

private:
    bool loadKey(const QString& schemaId, const QJsonObject& obj);

    QString         m_filePath;
    mutable QString m_error;
};

} // namespace gsx
