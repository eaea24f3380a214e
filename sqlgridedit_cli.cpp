#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTextStream>

#include "editrequest.h"
#include "editsession.h"
#include "metadatacache.h"

Q_LOGGING_CATEGORY(lcCli, "sqlgridedit.cli", QtInfoMsg)

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sqlgridedit");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Clasifica qué celdas de una consulta son editables y genera los UPDATE "
        "correspondientes a las ediciones de la petición.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("request", "Petición JSON (\"-\" = stdin).");

    QCommandLineOption outputOpt(QStringList{"o", "output"}, "Archivo de salida (por defecto stdout).", "file");
    QCommandLineOption statementsOpt("statements", "Solo las sentencias, una por línea terminada en ';'.");
    QCommandLineOption verboseOpt(QStringList{"v", "verbose"}, "Log de depuración.");
    parser.addOption(outputOpt);
    parser.addOption(statementsOpt);
    parser.addOption(verboseOpt);
    parser.process(app);

    if (parser.isSet(verboseOpt))
        QLoggingCategory::setFilterRules("sqlgridedit.*.debug=true");

    QTextStream err(stderr);
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << "Uso: sqlgridedit [opciones] <request.json|->\n";
        return 1;
    }

    QString msg;
    EditRequest req;
    if (!loadEditRequest(args.first(), req, &msg)) {
        err << msg << "\n";
        return 1;
    }

    MetadataCache cache;
    EditSession session(req.name, &cache);
    session.applyResult(req.sql, req.columns, req.rows);
    qCDebug(lcCli) << "sesión" << session.name() << "filas:" << session.current().size();

    if (!applyEdits(session, req, &msg)) {
        err << msg << "\n";
        return 1;
    }

    QByteArray out;
    if (parser.isSet(statementsOpt)) {
        out = statementsText(session);
    } else {
        out = QJsonDocument(sessionToJson(session)).toJson(QJsonDocument::Indented);
    }

    if (!writeOutput(parser.value(outputOpt), out, &msg)) {
        err << msg << "\n";
        return 1;
    }
    return 0;
}
