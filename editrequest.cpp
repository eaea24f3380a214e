#include "editrequest.h"

#include "cellsnapshot.h"
#include "editability.h"
#include "editsession.h"
#include "mutationsynthesizer.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

static QVariantMap rowFromJson(const QJsonValue& v, const QStringList& columns){
    if (v.isObject()) return v.toObject().toVariantMap();

    // Array posicional: mismo orden que "columns"
    QVariantMap row;
    const QJsonArray a = v.toArray();
    for (int i = 0; i < columns.size() && i < a.size(); ++i)
        row.insert(columns[i], a.at(i).toVariant());
    return row;
}

bool parseEditRequest(const QByteArray& json, EditRequest& out, QString* err){
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &pe);
    if (pe.error != QJsonParseError::NoError) {
        if (err) *err = QStringLiteral("JSON inválido: %1").arg(pe.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (err) *err = QStringLiteral("La petición debe ser un objeto JSON");
        return false;
    }
    const QJsonObject root = doc.object();

    if (!root.value("sql").isString() || root.value("sql").toString().trimmed().isEmpty()) {
        if (err) *err = QStringLiteral("Falta \"sql\"");
        return false;
    }
    out = EditRequest();
    out.sql = root.value("sql").toString();
    if (root.value("name").isString()) out.name = root.value("name").toString();

    // "columns", "rows" y "edits" son opcionales, pero si vienen son arrays
    for (const char* key : { "columns", "rows", "edits" }) {
        const QJsonValue v = root.value(QLatin1String(key));
        if (!v.isUndefined() && !v.isArray()) {
            if (err) *err = QStringLiteral("\"%1\" debe ser un array").arg(QLatin1String(key));
            return false;
        }
    }

    const QJsonArray jrows = root.value("rows").toArray();
    for (const auto& c : root.value("columns").toArray()) {
        if (!c.isString()) {
            if (err) *err = QStringLiteral("\"columns\" debe contener solo strings");
            return false;
        }
        out.columns << c.toString();
    }
    // Sin "columns": claves de la primera fila (orden alfabético de QJsonObject)
    if (out.columns.isEmpty() && !jrows.isEmpty() && jrows.first().isObject())
        out.columns = jrows.first().toObject().keys();

    for (const auto& r : jrows) {
        if (!r.isObject() && !r.isArray()) {
            if (err) *err = QStringLiteral("Cada fila debe ser objeto o array");
            return false;
        }
        out.rows << rowFromJson(r, out.columns);
    }

    const QJsonArray jedits = root.value("edits").toArray();
    for (int i = 0; i < jedits.size(); ++i) {
        const QJsonObject o = jedits.at(i).toObject();
        if (!o.value("row").isDouble() || !o.value("column").isString()) {
            if (err) *err = QStringLiteral("Edit %1 inválido: requiere \"row\" y \"column\"").arg(i);
            return false;
        }
        // value: string o null (ausente = null)
        const QJsonValue v = o.value("value");
        if (!v.isString() && !v.isNull() && !v.isUndefined()) {
            if (err) *err = QStringLiteral("Edit %1 inválido: \"value\" debe ser string o null").arg(i);
            return false;
        }
        EditRequest::Edit ed;
        ed.row    = o.value("row").toInt(-1);
        ed.column = o.value("column").toString();
        ed.value  = v.isString() ? v.toString() : kNullSentinel;
        out.edits << ed;
    }
    return true;
}

bool loadEditRequest(const QString& path, EditRequest& out, QString* err){
    QFile f;
    bool opened = false;
    if (path == QLatin1String("-")) {
        opened = f.open(stdin, QIODevice::ReadOnly);
    } else {
        f.setFileName(path);
        opened = f.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        if (err) *err = QStringLiteral("No se puede abrir %1").arg(path);
        return false;
    }
    return parseEditRequest(f.readAll(), out, err);
}

bool applyEdits(EditSession& session, const EditRequest& req, QString* err){
    for (const auto& e : req.edits) {
        QString why;
        if (!session.setCellValue(e.row, e.column, e.value, &why)) {
            if (err) *err = QStringLiteral("Edit fila %1, \"%2\": %3").arg(e.row).arg(e.column, why);
            return false;
        }
    }
    return true;
}

static QJsonObject tableToJson(const TableRef& t){
    QJsonObject o;
    o["name"]             = t.name;
    o["alias"]            = t.alias.isEmpty() ? QJsonValue() : QJsonValue(t.alias);
    o["primaryKeyColumn"] = t.hasPrimaryKey() ? QJsonValue(t.primaryKeyColumn) : QJsonValue();
    o["primaryKeyField"]  = t.primaryKeyField;
    return o;
}

static QJsonObject columnToJson(const QueryMetadata& md, int i){
    const ColumnInfo& c = md.columns[i];
    QJsonObject o;
    o["resultName"]   = c.resultName;
    o["tableName"]    = c.tableName.isEmpty() ? QJsonValue() : QJsonValue(c.tableName);
    o["fieldName"]    = c.fieldName;
    o["isComputed"]   = c.isComputed;
    o["isPrimaryKey"] = c.isPrimaryKey;
    o["readOnly"]     = isColumnReadOnly(md, i);
    return o;
}

static QJsonArray changesToJson(const QVector<RowChanges>& rows){
    QJsonArray out;
    for (const auto& rc : rows) {
        QJsonArray jtables;
        for (const auto& tc : rc.tableChanges) {
            QJsonArray jfields;
            for (const auto& fc : tc.changes) {
                QJsonObject jf;
                jf["field"]    = fc.fieldName;
                jf["oldValue"] = fc.oldValue;
                jf["newValue"] = fc.newValue;
                jfields.append(jf);
            }
            QJsonObject jt;
            jt["tableName"]        = tc.tableName;
            jt["primaryKeyColumn"] = tc.primaryKeyColumn;
            jt["primaryKeyField"]  = tc.primaryKeyField;
            jt["primaryKeyValue"]  = tc.primaryKeyValue;
            jt["changes"]          = jfields;
            jtables.append(jt);
        }
        QJsonObject jr;
        jr["rowIndex"]     = rc.rowIndex;
        jr["tableChanges"] = jtables;
        out.append(jr);
    }
    return out;
}

QJsonObject sessionToJson(const EditSession& session){
    QJsonObject root;
    root["name"] = session.name();
    root["sql"]  = session.sql();

    const QueryMetadata& md = session.metadata();
    root["editable"] = session.hasMetadata() && md.isEditable;

    QJsonArray jt;
    for (const auto& t : md.tables) jt.append(tableToJson(t));
    root["tables"] = jt;

    QJsonArray jc;
    for (int i = 0; i < md.columns.size(); ++i) jc.append(columnToJson(md, i));
    root["columns"] = jc;

    const QVector<RowChanges> changes = session.changes();
    root["changes"] = changesToJson(changes);

    const ChangeSummary s = summarizeChanges(changes);
    QJsonObject js;
    js["totalChanges"] = s.totalChanges;
    js["rowCount"]     = s.rowCount;
    js["tableCount"]   = s.tableCount;
    root["summary"] = js;

    root["statements"] = QJsonArray::fromStringList(generateUpdateStatements(changes));
    return root;
}

QByteArray statementsText(const EditSession& session){
    QByteArray out;
    for (const QString& s : session.pendingStatements())
        out += s.toUtf8() + ";\n";
    return out;
}

bool writeOutput(const QString& path, const QByteArray& data, QString* err){
    QFile f;
    bool opened = false;
    if (path.isEmpty() || path == QLatin1String("-")) {
        opened = f.open(stdout, QIODevice::WriteOnly);
    } else {
        f.setFileName(path);
        opened = f.open(QIODevice::WriteOnly | QIODevice::Truncate);
    }
    if (!opened) {
        if (err) *err = QStringLiteral("No se puede escribir %1").arg(path);
        return false;
    }
    if (f.write(data) != data.size()) {
        if (err) *err = QStringLiteral("Escritura incompleta en %1").arg(path);
        return false;
    }
    return true;
}
