#pragma once
#include "core.h"
#include "providers/provider.h"
#include <QObject>
#include <memory>

namespace gsx {

// ── Controller ──
//
// Drives one edit session at a time against a settings store: decompose the
// stored value, accept single-leaf edits, recompose and commit each edit,
// then rebuild from the store.

class SettingsController : public QObject {
    Q_OBJECT
public:
    explicit SettingsController(std::shared_ptr<SettingsProvider> provider,
                                QObject* parent = nullptr);

    SettingsProvider* provider() const { return m_provider.get(); }

    bool openKey(const QString& schemaId, const QString& key,
                 const QString& relocationPath = {});
    void closeKey();
    bool isOpen() const { return m_open; }
    const KeyTree& tree() const { return m_tree; }
    const TypeSignature& signature() const { return m_sig; }

    // Decodes every key of a schema; keys that cannot be shown are reported
    // through keyUnavailable and left out.
    QVector<KeyTree> loadSchema(const QString& schemaId,
                                const QString& relocationPath = {});

    // Single-field edit followed by an immediate commit
    bool setNodeValue(const QVector<int>& path, const QString& text);

    ComposeResult compose() const;
    QString describe(const QVector<int>& path) const;

    ErrorKind lastErrorKind() const { return m_lastErrorKind; }
    const QString& lastError() const { return m_lastError; }

signals:
    void keyOpened(const QString& schemaId, const QString& key);
    void keyUnavailable(const QString& schemaId, const QString& key, const QString& error);
    void commitFailed(const QString& error);
    void valueCommitted(const QString& schemaId, const QString& key);

private:
    bool buildTree(const QString& schemaId, const QString& key,
                   const QString& relocationPath, KeyTree* out, TypeSignature* sig);
    bool failCommit(ErrorKind kind, const QString& error);

    std::shared_ptr<SettingsProvider> m_provider;
    KeyTree       m_tree;
    TypeSignature m_sig;
    bool          m_open = false;
    ErrorKind     m_lastErrorKind = ErrorKind::None;
    QString       m_lastError;
};

} // namespace gsx
