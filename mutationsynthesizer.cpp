#include "mutationsynthesizer.h"
#include "cellsnapshot.h"

bool isJsonString(const QString& value){
    if (value == kNullSentinel) return false;
    const QString t = value.trimmed();
    return (t.startsWith('{') && t.endsWith('}')) ||
           (t.startsWith('[') && t.endsWith(']'));
}

QString encodeLiteral(const QString& value){
    if (value == kNullSentinel) return QStringLiteral("NULL");

    // Único escape: ' -> ''
    const QString quoted = QStringLiteral("'%1'").arg(QString(value).replace('\'', QLatin1String("''")));
    if (isJsonString(value)) return quoted + QLatin1String("::jsonb");
    return quoted;
}

QString quoteIdentifier(const QString& ident){
    return QStringLiteral("\"%1\"").arg(QString(ident).replace('"', QLatin1String("\"\"")));
}

QString generateUpdateSql(const TableChange& change){
    QStringList sets;
    for (const auto& fc : change.changes)
        sets << QStringLiteral("%1 = %2").arg(quoteIdentifier(fc.fieldName), encodeLiteral(fc.newValue));

    return QStringLiteral("UPDATE %1 SET %2 WHERE %3 = %4")
        .arg(quoteIdentifier(change.tableName),
             sets.join(QLatin1String(", ")),
             quoteIdentifier(change.primaryKeyField),
             encodeLiteral(change.primaryKeyValue));
}

QStringList generateUpdateStatements(const QVector<RowChanges>& rows){
    QStringList out;
    for (const auto& row : rows)
        for (const auto& tc : row.tableChanges)
            out << generateUpdateSql(tc);
    return out;
}
