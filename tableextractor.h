#ifndef TABLEEXTRACTOR_H
#define TABLEEXTRACTOR_H

#include <QString>
#include <QVector>
#include "querymetadata.h"

/**
 * Tablas base y alias de una consulta:
 *  - primer  FROM <tabla> [[AS] alias]
 *  - todos los JOIN <tabla> [[AS] alias], en orden
 * Nombres y alias en minúsculas; el esquema (s.tabla) se descarta.
 * Sin tablas => vector vacío (la consulta no será editable).
 */
QVector<TableRef> extractTables(const QString& sql);

#endif // TABLEEXTRACTOR_H
