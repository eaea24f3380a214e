#ifndef EDITABILITY_H
#define EDITABILITY_H

#include <QString>
#include <QVector>
#include "querymetadata.h"

// GROUP BY, HAVING, UNION, INTERSECT, EXCEPT, DISTINCT, COUNT/SUM/AVG/MIN/MAX(
bool hasNonEditableConstructs(const QString& sql);

// Sin construcciones prohibidas, con al menos una tabla y alguna tabla con PK
bool isQueryEditable(const QString& sql, const QVector<TableRef>& tables);

// Regla por celda; solo depende de los metadatos y la posición de la columna.
// Una columna fuera de rango es de solo lectura.
bool isColumnReadOnly(const QueryMetadata& md, int column);

#endif // EDITABILITY_H
