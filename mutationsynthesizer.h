#ifndef MUTATIONSYNTHESIZER_H
#define MUTATIONSYNTHESIZER_H

#include <QString>
#include <QStringList>
#include <QVector>
#include "changetracker.h"

// ¿Parece JSON? ({...} o [...] tras recortar; "NULL" nunca lo es)
bool isJsonString(const QString& value);

// "NULL" -> NULL | JSON -> '...'::jsonb | resto -> '...' con ' duplicada
QString encodeLiteral(const QString& value);

// "ident" con " duplicada
QString quoteIdentifier(const QString& ident);

// UPDATE "t" SET "f1" = v1, ... WHERE "pk" = v
QString generateUpdateSql(const TableChange& change);

// Una sentencia por TableChange, en orden de filas y tablas.
// Sin transacción: si hace falta atomicidad la añade quien ejecuta.
QStringList generateUpdateStatements(const QVector<RowChanges>& rows);

#endif // MUTATIONSYNTHESIZER_H
