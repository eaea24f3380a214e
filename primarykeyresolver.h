#ifndef PRIMARYKEYRESOLVER_H
#define PRIMARYKEYRESOLVER_H

#include <QVector>
#include "querymetadata.h"

// Nombres de PK reconocidos, en orden de prioridad (política cerrada)
constexpr const char* kPrimaryKeyNames[] = { "id", "uuid", "pk", "_id" };

/**
 * Asigna a cada tabla (en orden FROM, JOINs) su columna PK:
 *  1) columna ya mapeada a la tabla cuyo fieldName sea un nombre PK
 *  2) si no, cualquier columna con resultName = nombre PK que no sea PK de otra;
 *     si no tenía tabla se le asigna esta.
 * Modifica tablas y columnas in-place.
 */
void resolvePrimaryKeys(QVector<TableRef>& tables, QVector<ColumnInfo>& columns);

#endif // PRIMARYKEYRESOLVER_H
