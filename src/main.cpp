// gsx: browse and edit typed settings stored in a JSON settings store.
//
//   gsx [--store FILE] [--path PATH] [--remember] list [SCHEMA]
//   gsx ... show SCHEMA KEY
//   gsx ... describe SCHEMA KEY [NODE]
//   gsx ... set SCHEMA KEY NODE TEXT
//
// NODE is a '/'-separated index path from the key's root ("" or "/" is the
// root itself, "2/0" the first child of the third child).

#include "controller.h"
#include "providers/json_provider.h"
#include "signature.h"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSettings>
#include <QTextStream>

using namespace gsx;

namespace {

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& err() {
    static QTextStream s(stderr);
    return s;
}

int usageError(const QCommandLineParser& parser, const QString& msg) {
    err() << "gsx: " << msg << "\n\n" << parser.helpText();
    err().flush();
    return 2;
}

int listCommand(SettingsController& ctrl, const QStringList& args,
                const QString& relocationPath) {
    SettingsProvider* prov = ctrl.provider();
    if (args.isEmpty()) {
        for (const QString& s : prov->schemas())
            out() << s << '\n';
        return 0;
    }

    const QString schema = args[0];
    if (!prov->schemas().contains(schema)) {
        err() << "gsx: no schema '" << schema << "'\n";
        return 1;
    }
    // Keys that fail to decode were already reported through keyUnavailable
    for (const KeyTree& t : ctrl.loadSchema(schema, relocationPath)) {
        auto sig = SignatureParser::parse(t.meta.type);
        auto v = sig.ok ? recompose(t.root, sig.signature) : RecomposeResult{};
        out() << t.meta.key << "  " << t.meta.type << "  "
              << (v.ok ? v.value.print() : fmt::displayValue(t.root)) << '\n';
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("gsx"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Browse and edit typed settings."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption storeOpt(QStringList{"s", "store"},
                                QStringLiteral("JSON settings store to open."),
                                QStringLiteral("file"));
    QCommandLineOption pathOpt(QStringList{"p", "path"},
                               QStringLiteral("Relocation path of the keys."),
                               QStringLiteral("path"));
    QCommandLineOption rememberOpt(QStringLiteral("remember"),
                                   QStringLiteral("Keep --store and --path as the defaults."));
    parser.addOption(storeOpt);
    parser.addOption(pathOpt);
    parser.addOption(rememberOpt);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("list | show | describe | set"));
    parser.process(app);

    QSettings settings("GSettingsX", "gsx");
    QString storePath = settings.value("storePath").toString();
    QString relocationPath = settings.value("relocationPath").toString();
    if (parser.isSet(storeOpt)) storePath = parser.value(storeOpt);
    if (parser.isSet(pathOpt))  relocationPath = parser.value(pathOpt);
    if (parser.isSet(rememberOpt)) {
        settings.setValue("storePath", storePath);
        settings.setValue("relocationPath", relocationPath);
    }

    QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usageError(parser, QStringLiteral("missing command"));
    if (storePath.isEmpty())
        return usageError(parser, QStringLiteral("no settings store given (--store)"));

    auto store = std::make_shared<JsonProvider>(storePath);
    if (!store->load()) {
        err() << "gsx: " << store->errorString() << '\n';
        return 1;
    }

    SettingsController ctrl(store);
    QObject::connect(&ctrl, &SettingsController::keyUnavailable,
                     [](const QString& schema, const QString& key, const QString& error) {
        err() << "gsx: cannot display " << schema << '.' << key << ": " << error << '\n';
    });
    QObject::connect(&ctrl, &SettingsController::commitFailed, [](const QString& error) {
        err() << "gsx: not saved: " << error << '\n';
    });

    const QString command = args.takeFirst();

    if (command == QLatin1String("list")) {
        if (args.size() > 1)
            return usageError(parser, QStringLiteral("list takes at most one schema"));
        return listCommand(ctrl, args, relocationPath);
    }

    if (command == QLatin1String("show")) {
        if (args.size() != 2)
            return usageError(parser, QStringLiteral("show needs SCHEMA KEY"));
        if (!ctrl.openKey(args[0], args[1], relocationPath))
            return 1;
        out() << ctrl.compose().text << '\n';
        return 0;
    }

    if (command == QLatin1String("describe")) {
        if (args.size() != 2 && args.size() != 3)
            return usageError(parser, QStringLiteral("describe needs SCHEMA KEY [NODE]"));
        bool ok = true;
        QVector<int> path = args.size() == 3 ? parseNodePath(args[2], &ok) : QVector<int>{};
        if (!ok)
            return usageError(parser, QStringLiteral("bad node path '%1'").arg(args[2]));
        if (!ctrl.openKey(args[0], args[1], relocationPath))
            return 1;
        const QString text = ctrl.describe(path);
        if (text.isEmpty()) {
            err() << "gsx: no node at '" << nodePathToString(path) << "'\n";
            return 1;
        }
        out() << text << '\n';
        return 0;
    }

    if (command == QLatin1String("set")) {
        if (args.size() != 4)
            return usageError(parser, QStringLiteral("set needs SCHEMA KEY NODE TEXT"));
        bool ok = false;
        QVector<int> path = parseNodePath(args[2], &ok);
        if (!ok)
            return usageError(parser, QStringLiteral("bad node path '%1'").arg(args[2]));
        if (!ctrl.openKey(args[0], args[1], relocationPath))
            return 1;
        if (!ctrl.setNodeValue(path, args[3]))
            return 1;
        out() << ctrl.compose().text << '\n';
        return 0;
    }

    return usageError(parser, QStringLiteral("unknown command '%1'").arg(command));
}
