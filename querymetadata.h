#ifndef QUERYMETADATA_H
#define QUERYMETADATA_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcMetadata)

/* ======================== Tablas referenciadas ======================== */
// Una por tabla en FROM / JOIN (mismo orden que en el texto).
struct TableRef {
    QString name;                     // en minúsculas, sin esquema
    QString alias;                    // en minúsculas; vacío = sin alias
    QString primaryKeyColumn;         // nombre de columna en el resultado; vacío = sin PK
    QString primaryKeyField = "id";   // campo real usado en el WHERE

    bool hasPrimaryKey() const { return !primaryKeyColumn.isEmpty(); }
};

/* ======================== Columnas del resultado ======================== */
struct ColumnInfo {
    QString resultName;     // como viene en el resultado
    QString tableName;      // tabla dueña; vacío = no asignada
    QString fieldName;      // campo real en la tabla
    bool    isComputed   = false;
    bool    isPrimaryKey = false;
};

/* ========================= Metadatos de consulta ========================= */
// Se construye una vez por ejecución; los consumidores la guardan const.
struct QueryMetadata {
    QVector<TableRef>   tables;
    QVector<ColumnInfo> columns;
    bool                isEditable = false;

    // Primera tabla con ese nombre (nullptr si no hay)
    const TableRef* table(const QString& name) const;
    // Índice de la columna con ese resultName (-1 si no hay)
    int columnIndex(const QString& resultName) const;
};

// Extractor → Mapper → Resolver → Clasificador
QueryMetadata buildQueryMetadata(const QString& sql, const QStringList& resultColumns);

#endif // QUERYMETADATA_H
