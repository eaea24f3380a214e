#ifndef COLUMNMAPPER_H
#define COLUMNMAPPER_H

#include <QString>
#include <QStringList>
#include <QVector>
#include "querymetadata.h"

/**
 * Asigna cada columna del resultado a su tabla/campo:
 *  - SELECT *       -> todas a la única tabla (si hay exactamente una)
 *  - lista explícita -> busca <alias|tabla>.<campo> en la cláusula SELECT
 *  - sin match y una sola tabla -> esa tabla
 * Marca como calculadas las columnas que vienen de expresiones (heurística
 * por patrones, no gramática).
 * Devuelve exactamente una ColumnInfo por columna, en el orden del resultado.
 */
QVector<ColumnInfo> mapColumns(const QString& sql,
                               const QStringList& resultColumns,
                               const QVector<TableRef>& tables);

// ¿La columna aparece en la cláusula SELECT como resultado de una expresión?
bool isComputedColumn(const QString& selectClause, const QString& resultName);

// Texto entre SELECT y FROM; null si no hay
QString selectClause(const QString& sql);

#endif // COLUMNMAPPER_H
