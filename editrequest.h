#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>

class EditSession;

/**
 * Petición JSON para el driver de línea de comandos:
 * {
 *   "name":    "Untitled",                 (opcional)
 *   "sql":     "SELECT * FROM users",
 *   "columns": ["id","name"],              (opcional: claves de la 1ª fila)
 *   "rows":    [ {"id":1,"name":"Ann"} ]   (objetos o arrays posicionales)
 *   "edits":   [ {"row":0,"column":"name","value":"Bob"} ]  (null => NULL)
 * }
 */
struct EditRequest {
    struct Edit { int row = -1; QString column; QString value; };

    QString            name = QStringLiteral("Untitled");
    QString            sql;
    QStringList        columns;
    QVector<QVariantMap> rows;
    QVector<Edit>      edits;
};

bool parseEditRequest(const QByteArray& json, EditRequest& out, QString* err = nullptr);
// path "-" => stdin
bool loadEditRequest(const QString& path, EditRequest& out, QString* err = nullptr);

// Aplica los edits en orden; se detiene en el primero inválido
bool applyEdits(EditSession& session, const EditRequest& req, QString* err = nullptr);

// Metadatos, readOnly por columna, cambios, resumen y sentencias
QJsonObject sessionToJson(const EditSession& session);

// Una sentencia por línea, terminada en ';'
QByteArray statementsText(const EditSession& session);

// path "-" o vacío => stdout
bool writeOutput(const QString& path, const QByteArray& data, QString* err = nullptr);
