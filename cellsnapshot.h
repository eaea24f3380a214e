#ifndef CELLSNAPSHOT_H
#define CELLSNAPSHOT_H

#include <QString>
#include <QVariant>
#include <QVariantMap>
#include <QVector>
#include "querymetadata.h"

// Centinela de NULL dentro del grid (distinto de "")
extern const QString kNullSentinel;

/* ======================= Celdas del grid ======================= */
struct CellData {
    QString value;
    bool    readOnly = false;
};

using CellRow    = QVector<CellData>;
using CellMatrix = QVector<CellRow>;   // fila-mayor

// NULL -> "NULL"; mapas/listas -> JSON compacto; resto -> toString()
QString formatCellValue(const QVariant& v);

// Filas del resultado (columna -> valor) -> matriz en el orden de md.columns,
// con el flag readOnly ya aplicado.
CellMatrix buildSnapshot(const QVector<QVariantMap>& rows, const QueryMetadata& md);

// Mismas dimensiones y mismos readOnly (solo los valores pueden diferir)
bool sameShape(const CellMatrix& a, const CellMatrix& b);

#endif // CELLSNAPSHOT_H
