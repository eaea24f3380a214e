#include <QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QTemporaryDir>

#include "editrequest.h"

// Ruta del ejecutable, la pone CMake
#ifndef SQLGRIDEDIT_BIN
#error "SQLGRIDEDIT_BIN no definido"
#endif

static const char* kRequest = R"({
    "sql": "SELECT * FROM users",
    "columns": ["id", "name", "bio"],
    "rows": [ {"id": 1, "name": "Ann", "bio": null}, {"id": 2, "name": "Bob", "bio": "hi"} ],
    "edits": [ {"row": 1, "column": "name", "value": "O'Brien"},
               {"row": 0, "column": "bio", "value": "{\"a\":1}"} ]
})";

static const char* kStatements =
    "UPDATE \"users\" SET \"bio\" = '{\"a\":1}'::jsonb WHERE \"id\" = '1';\n"
    "UPDATE \"users\" SET \"name\" = 'O''Brien' WHERE \"id\" = '2';\n";

struct RunResult {
    int        exitCode = -1;
    QByteArray out;
    QByteArray err;
};

static RunResult run(const QStringList& args, const QByteArray& input = QByteArray()){
    QProcess p;
    p.start(QString::fromUtf8(SQLGRIDEDIT_BIN), args);
    RunResult r;
    if (!p.waitForStarted()) return r;
    if (!input.isEmpty()) p.write(input);
    p.closeWriteChannel();
    if (!p.waitForFinished() || p.exitStatus() != QProcess::NormalExit) return r;
    r.exitCode = p.exitCode();
    r.out = p.readAllStandardOutput();
    r.err = p.readAllStandardError();
    return r;
}

class TstCli : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void statementsFromFile();
    void statementsFromStdin();
    void jsonToOutputFile();
    void invalidRequestExitsOne();
    void missingFileExitsOne();
    void readOnlyEditExitsOne();
    void noArgumentsExitsOne();

private:
    QTemporaryDir m_dir;
    QString       m_request;
};

void TstCli::initTestCase(){
    QVERIFY(m_dir.isValid());
    m_request = m_dir.filePath("request.json");
    QString err;
    QVERIFY2(writeOutput(m_request, QByteArray(kRequest), &err), qPrintable(err));
}

void TstCli::statementsFromFile(){
    const RunResult r = run({ "--statements", m_request });
    QCOMPARE(r.exitCode, 0);
    QCOMPARE(r.out, QByteArray(kStatements));
    QVERIFY(r.err.isEmpty());
}

void TstCli::statementsFromStdin(){
    const RunResult r = run({ "--statements", "-" }, QByteArray(kRequest));
    QCOMPARE(r.exitCode, 0);
    QCOMPARE(r.out, QByteArray(kStatements));
}

void TstCli::jsonToOutputFile(){
    const QString outPath = m_dir.filePath("out.json");
    const RunResult r = run({ "-o", outPath, m_request });
    QCOMPARE(r.exitCode, 0);
    QVERIFY(r.out.isEmpty());

    QFile f(outPath);
    QVERIFY(f.open(QIODevice::ReadOnly));
    const QJsonObject doc = QJsonDocument::fromJson(f.readAll()).object();
    QCOMPARE(doc.value("name").toString(), QStringLiteral("users"));
    QVERIFY(doc.value("editable").toBool());
    QCOMPARE(doc.value("summary").toObject().value("totalChanges").toInt(), 2);
    QCOMPARE(doc.value("statements").toArray().size(), 2);
}

void TstCli::invalidRequestExitsOne(){
    const QByteArray bad = R"({"sql": "SELECT * FROM users", "columns": ["id", "name"],
                               "rows": [{"id": 1, "name": "Ann"}],
                               "edits": [{"row": 0, "column": "name", "value": {"a": 1}}]})";
    const RunResult r = run({ "--statements", "-" }, bad);
    QCOMPARE(r.exitCode, 1);
    QVERIFY(r.out.isEmpty());
    QVERIFY(r.err.contains("value"));
}

void TstCli::missingFileExitsOne(){
    const RunResult r = run({ m_dir.filePath("missing.json") });
    QCOMPARE(r.exitCode, 1);
    QVERIFY(!r.err.isEmpty());
}

void TstCli::readOnlyEditExitsOne(){
    const QByteArray req = R"({"sql": "SELECT * FROM users", "columns": ["id", "name"],
                               "rows": [{"id": 1, "name": "Ann"}],
                               "edits": [{"row": 0, "column": "id", "value": "7"}]})";
    const RunResult r = run({ "--statements", "-" }, req);
    QCOMPARE(r.exitCode, 1);
    QVERIFY(r.out.isEmpty());
    QVERIFY(r.err.contains("solo lectura"));
}

void TstCli::noArgumentsExitsOne(){
    const RunResult r = run({});
    QCOMPARE(r.exitCode, 1);
}

QTEST_GUILESS_MAIN(TstCli)
#include "tst_cli.moc"
