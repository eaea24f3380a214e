#pragma once
#include <QString>

/**
 * Utilidades de texto SQL compartidas por el extractor y el mapper.
 * No es un parser: solo patrones fijos sobre texto normalizado.
 */

// Colapsa espacios/saltos de línea consecutivos y recorta
QString normalizeSql(const QString& sql);

// Patrones de identificador (para componer expresiones regulares)
//   tabla:  t, s.t, "t", "s"."t", s."t", "s".t
//   simple: t, "t"
QString tableIdentifierPattern();
QString simpleIdentifierPattern();

// "tabla" -> tabla (solo si viene entre comillas dobles)
QString unquoteIdentifier(const QString& ident);

// esquema.tabla -> tabla (el esquema se descarta)
QString tableFromReference(const QString& ref);

// Tabla del primer FROM (sin pasar a minúsculas); vacío si no hay
QString primaryTableName(const QString& sql);
