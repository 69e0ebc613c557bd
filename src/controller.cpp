#include "controller.h"
#include "signature.h"
#include <QDebug>

namespace gsx {

SettingsController::SettingsController(std::shared_ptr<SettingsProvider> provider,
                                       QObject* parent)
    : QObject(parent)
    , m_provider(std::move(provider)) {}

// ── Tree construction ──

bool SettingsController::buildTree(const QString& schemaId, const QString& key,
                                   const QString& relocationPath,
                                   KeyTree* out, TypeSignature* sig) {
    if (!m_provider) {
        m_lastErrorKind = ErrorKind::PersistenceRejected;
        m_lastError = QStringLiteral("no settings store");
        return false;
    }

    KeyMeta meta;
    if (!m_provider->lookup(schemaId, key, &meta)) {
        m_lastErrorKind = ErrorKind::IndexOutOfRange;
        m_lastError = QStringLiteral("no key '%1' in schema '%2'").arg(key, schemaId);
        return false;
    }

    auto parsed = SignatureParser::parse(meta.type);
    if (!parsed.ok) {
        m_lastErrorKind = ErrorKind::MalformedSignature;
        m_lastError = QStringLiteral("'%1': %2 (at %3)")
                          .arg(key, parsed.error).arg(parsed.errorPos);
        return false;
    }

    // Unset keys show their default, or the zero value of the type
    Value value = m_provider->read(schemaId, key, relocationPath);
    if (!value.isValid())
        value = meta.defaultValue.isValid() ? meta.defaultValue
                                            : Value::defaultFor(parsed.signature);

    auto dec = decompose(parsed.signature, value, key);
    if (!dec.ok) {
        m_lastErrorKind = dec.errorKind;
        m_lastError = dec.error;
        return false;
    }

    out->meta = meta;
    out->relocationPath = relocationPath;
    out->root = std::move(dec.node);
    *sig = parsed.signature;
    return true;
}

bool SettingsController::openKey(const QString& schemaId, const QString& key,
                                 const QString& relocationPath) {
    KeyTree t;
    TypeSignature sig;
    if (!buildTree(schemaId, key, relocationPath, &t, &sig)) {
        qWarning() << "SettingsController: cannot display" << schemaId + QLatin1Char('.') + key
                   << ":" << m_lastError;
        emit keyUnavailable(schemaId, key, m_lastError);
        return false;
    }
    m_tree = std::move(t);
    m_sig = sig;
    m_open = true;
    m_lastErrorKind = ErrorKind::None;
    m_lastError.clear();
    emit keyOpened(schemaId, key);
    return true;
}

void SettingsController::closeKey() {
    m_tree = KeyTree{};
    m_sig = TypeSignature{};
    m_open = false;
}

QVector<KeyTree> SettingsController::loadSchema(const QString& schemaId,
                                                const QString& relocationPath) {
    QVector<KeyTree> trees;
    if (!m_provider) return trees;
    for (const QString& key : m_provider->keys(schemaId)) {
        KeyTree t;
        TypeSignature sig;
        if (!buildTree(schemaId, key, relocationPath, &t, &sig)) {
            qWarning() << "SettingsController: cannot display" << schemaId + QLatin1Char('.') + key
                       << ":" << m_lastError;
            emit keyUnavailable(schemaId, key, m_lastError);
            continue;
        }
        trees.append(std::move(t));
    }
    return trees;
}

// ── Editing ──

bool SettingsController::failCommit(ErrorKind kind, const QString& error) {
    m_lastErrorKind = kind;
    m_lastError = error;
    qWarning() << "SettingsController: commit of" << m_tree.meta.key << "failed:"
               << errorKindName(kind) << error;
    emit commitFailed(error);
    return false;
}

bool SettingsController::setNodeValue(const QVector<int>& path, const QString& text) {
    if (!m_open)
        return failCommit(ErrorKind::StructuralMismatch, QStringLiteral("no key is open"));

    ValueNode* node = m_tree.root.nodeAt(path);
    if (!node)
        return failCommit(ErrorKind::IndexOutOfRange,
                          QStringLiteral("no node at '%1'").arg(nodePathToString(path)));
    if (node->compound)
        return failCommit(ErrorKind::StructuralMismatch,
                          QStringLiteral("'%1' is a %2, not a single value")
                              .arg(node->name, fmt::typeTag(node->signature)));

    // The edit stays in the tree even when the commit fails, so it can be corrected
    node->setLeafText(text);

    auto rec = recompose(m_tree.root, m_sig);
    if (!rec.ok)
        return failCommit(rec.errorKind, rec.error);

    const QString schemaId = m_tree.meta.schemaId;
    const QString key = m_tree.meta.key;
    CommitResult cr = m_provider->write(schemaId, key, m_tree.relocationPath, rec.value);
    if (!cr.ok)
        return failCommit(cr.errorKind, cr.error);

    qDebug() << "SettingsController: committed" << schemaId + QLatin1Char('.') + key
             << "=" << rec.value.print();

    m_lastErrorKind = ErrorKind::None;
    m_lastError.clear();
    emit valueCommitted(schemaId, key);

    // Each edit session starts again from the live store. If the stored value
    // no longer decodes, the edited tree is stale and the key is closed.
    KeyTree t;
    TypeSignature sig;
    if (!buildTree(schemaId, key, m_tree.relocationPath, &t, &sig)) {
        qWarning() << "SettingsController: cannot display" << schemaId + QLatin1Char('.') + key
                   << "after commit:" << m_lastError;
        closeKey();
        emit keyUnavailable(schemaId, key, m_lastError);
        return true;
    }
    m_tree = std::move(t);
    m_sig = sig;
    return true;
}

// ── Display ──

ComposeResult SettingsController::compose() const {
    if (!m_open) return {};
    return gsx::compose(m_tree);
}

QString SettingsController::describe(const QVector<int>& path) const {
    if (!m_open) return {};
    return gsx::describe(m_tree, path);
}

} // namespace gsx
