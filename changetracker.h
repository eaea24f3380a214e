#ifndef CHANGETRACKER_H
#define CHANGETRACKER_H

#include <QString>
#include <QVector>
#include <QLoggingCategory>
#include "cellsnapshot.h"
#include "querymetadata.h"

Q_DECLARE_LOGGING_CATEGORY(lcChanges)

/* ===================== Cambios detectados ===================== */
struct FieldChange {
    QString fieldName;
    QString oldValue;
    QString newValue;
};

// Cambios de UNA fila para UNA tabla, identificada por el valor de su PK
struct TableChange {
    QString tableName;
    QString primaryKeyColumn;   // columna del resultado
    QString primaryKeyField;    // campo usado en el WHERE
    QString primaryKeyValue;
    QVector<FieldChange> changes; // orden de inserción; un campo aparece una vez

    // Inserta o sobreescribe (conservando la posición)
    void setChange(const QString& field, const QString& oldValue, const QString& newValue);
    const FieldChange* change(const QString& field) const;
};

struct RowChanges {
    int rowIndex = -1;
    QVector<TableChange> tableChanges;
};

struct ChangeSummary {
    int totalChanges = 0;  // campos modificados
    int rowCount     = 0;
    int tableCount   = 0;  // tablas distintas afectadas
};

/**
 * Diff entre la matriz actual y la original, agrupado por fila y por
 * (tabla, valor de PK). Celdas sin PK resoluble se descartan sin abortar
 * el resto. Función pura: dos llamadas con la misma entrada dan lo mismo.
 */
QVector<RowChanges> computeChanges(const CellMatrix& current,
                                   const CellMatrix& original,
                                   const QueryMetadata& md);

ChangeSummary summarizeChanges(const QVector<RowChanges>& rows);

#endif // CHANGETRACKER_H
