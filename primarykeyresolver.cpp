#include "primarykeyresolver.h"

#include <QString>
#include <algorithm>

static void claim(TableRef& t, ColumnInfo& c, const QString& pkName){
    t.primaryKeyColumn = c.resultName;
    t.primaryKeyField  = pkName;
    c.isPrimaryKey     = true;
}

void resolvePrimaryKeys(QVector<TableRef>& tables, QVector<ColumnInfo>& columns){
    for (auto& t : tables) {
        // 1) PK ya mapeada a esta tabla
        for (const char* name : kPrimaryKeyNames) {
            const QString pk = QLatin1String(name);
            auto it = std::find_if(columns.begin(), columns.end(), [&](const ColumnInfo& c){
                return c.tableName == t.name && c.fieldName.compare(pk, Qt::CaseInsensitive) == 0;
            });
            if (it != columns.end()) { claim(t, *it, pk); break; }
        }
        if (t.hasPrimaryKey()) continue;

        // 2) columna suelta con nombre de PK, aún no reclamada
        for (const char* name : kPrimaryKeyNames) {
            const QString pk = QLatin1String(name);
            auto it = std::find_if(columns.begin(), columns.end(), [&](const ColumnInfo& c){
                return c.resultName.compare(pk, Qt::CaseInsensitive) == 0 && !c.isPrimaryKey;
            });
            if (it == columns.end()) continue;
            claim(t, *it, pk);
            if (it->tableName.isEmpty()) it->tableName = t.name;
            qCDebug(lcMetadata) << "PK suelta" << it->resultName << "->" << t.name;
            break;
        }
    }
}
