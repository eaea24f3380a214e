#include "querymetadata.h"

#include "tableextractor.h"
#include "columnmapper.h"
#include "primarykeyresolver.h"
#include "editability.h"

Q_LOGGING_CATEGORY(lcMetadata, "sqlgridedit.metadata", QtInfoMsg)

const TableRef* QueryMetadata::table(const QString& name) const {
    for (const auto& t : tables)
        if (t.name == name) return &t;
    return nullptr;
}

int QueryMetadata::columnIndex(const QString& resultName) const {
    for (int i = 0; i < columns.size(); ++i)
        if (columns[i].resultName == resultName) return i;
    return -1;
}

QueryMetadata buildQueryMetadata(const QString& sql, const QStringList& resultColumns){
    QueryMetadata md;
    md.tables  = extractTables(sql);
    md.columns = mapColumns(sql, resultColumns, md.tables);
    resolvePrimaryKeys(md.tables, md.columns);
    md.isEditable = isQueryEditable(sql, md.tables);

    qCDebug(lcMetadata) << "editable:" << md.isEditable
                        << "tablas:" << md.tables.size()
                        << "columnas:" << md.columns.size();
    return md;
}
