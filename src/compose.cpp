#include "core.h"
#include "signature.h"

namespace gsx {

namespace {

// Kept variant wrappers and present maybes hand their own name down to
// their single child; such a child adds nothing to a dotted path.
bool passesNameThrough(const ValueNode& parent) {
    if (parent.signature.kind == SigKind::Maybe) return true;
    return parent.signature.kind == SigKind::Variant && !parent.isVariantWrapped();
}

struct ComposeState {
    QString           text;
    QVector<LineMeta> meta;
    int               currentLine = 0;

    void emitLine(const QString& lineText, LineMeta lm) {
        if (currentLine > 0) text += '\n';
        // 3-char fold indicator column: arrow for heads, blank otherwise
        if (lm.foldHead)
            text += QStringLiteral(" \u25BE ");
        else
            text += QStringLiteral("   ");
        text += lineText;
        meta.append(lm);
        currentLine++;
    }
};

void composeNode(ComposeState& state, const ValueNode& node,
                 QVector<int>& path, int depth) {
    LineMeta lm;
    lm.path      = path;
    lm.depth     = depth;
    lm.isLeaf    = !node.compound;
    lm.foldHead  = node.compound && !node.children.empty();
    lm.variant   = node.isVariantWrapped() || node.signature.kind == SigKind::Variant;
    lm.name      = node.name;
    lm.valueText = fmt::displayValue(node);

    QString line = fmt::indent(depth) + node.name + QStringLiteral(" = ") + lm.valueText;
    if (node.isVariantWrapped() && !node.compound)
        line += QStringLiteral("  <") + fmt::typeTag(node.signature) + QLatin1Char('>');
    state.emitLine(line, lm);

    for (int i = 0; i < (int)node.children.size(); i++) {
        path.append(i);
        composeNode(state, node.children[i], path, depth + 1);
        path.removeLast();
    }
}

} // namespace

// ── Compose ──

ComposeResult compose(const KeyTree& tree) {
    ComposeState state;
    QVector<int> path;
    composeNode(state, tree.root, path, 0);
    return {state.text, state.meta};
}

// ── Paths ──

QString KeyTree::fullPath(const QVector<int>& path) const {
    QString out = meta.schemaId + QLatin1Char('.') + meta.key;
    const ValueNode* node = &root;
    for (int idx : path) {
        if (idx < 0 || idx >= (int)node->children.size()) break;
        const bool skip = passesNameThrough(*node);
        node = &node->children[idx];
        if (!skip) { out += QLatin1Char('.'); out += node->name; }
    }
    return out;
}

QVector<int> parseNodePath(const QString& text, bool* ok) {
    *ok = false;
    QString s = text.trimmed();
    if (s.startsWith('/')) s.remove(0, 1);
    if (s.isEmpty()) { *ok = true; return {}; }

    QVector<int> path;
    for (const QString& part : s.split(QLatin1Char('/'))) {
        bool partOk = false;
        int idx = part.toInt(&partOk, 10);
        if (!partOk || idx < 0) return {};
        path.append(idx);
    }
    *ok = true;
    return path;
}

QString nodePathToString(const QVector<int>& path) {
    QStringList parts;
    for (int idx : path) parts << QString::number(idx);
    return parts.join(QLatin1Char('/'));
}

// ── Details pane ──

QString describe(const KeyTree& tree, const QVector<int>& path) {
    const ValueNode* node = tree.root.nodeAt(path);
    if (!node) return {};

    QStringList lines;
    lines << tree.fullPath(path);
    lines << QStringLiteral("Schema ID: ") + tree.meta.schemaId;

    QString key = QStringLiteral("Key: ") + tree.meta.key;
    if (!tree.meta.summary.isEmpty())
        key += QStringLiteral(" (") + tree.meta.summary + QLatin1Char(')');
    lines << key;

    if (!tree.meta.description.isEmpty())
        lines << QStringLiteral("Description: ") + tree.meta.description;
    if (!path.isEmpty())
        lines << QStringLiteral("Name: ") + node->name;
    lines << QStringLiteral("Type: ") + fmt::typeTag(node->signature);

    // Current value: recompose the whole key, then walk to the element the
    // same way defaults are walked. An uncommitted bad edit shows raw text.
    QString valueText = fmt::displayValue(*node);
    auto declared = SignatureParser::parse(tree.meta.type);
    if (declared.ok) {
        auto whole = recompose(tree.root, declared.signature);
        if (whole.ok) {
            auto at = resolveDefaultAt(whole.value, tree.root, path);
            if (at.ok && at.value.isValid()) valueText = at.value.print();
        }
    }
    lines << QStringLiteral("Value: ") + valueText;

    auto def = resolveDefaultAt(tree.meta.defaultValue, tree.root, path);
    if (!def.ok)
        lines << QStringLiteral("Default Value: <") + def.error + QLatin1Char('>');
    else if (def.value.isValid())
        lines << QStringLiteral("Default Value: ") + def.value.print();
    else
        lines << QStringLiteral("Default Value: <none>");

    if (!tree.meta.range.isEmpty())
        lines << QStringLiteral("Range: ") + tree.meta.range.print();

    return lines.join(QLatin1Char('\n'));
}

} // namespace gsx
