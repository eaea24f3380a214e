#pragma once
#include <QCache>
#include <QMutex>
#include <QString>
#include <QStringList>
#include "querymetadata.h"

/**
 * Memo opcional de QueryMetadata.
 * Clave: texto normalizado exacto + lista ordenada exacta de columnas;
 * si cambia cualquiera de los dos es otra entrada.
 * Se puede compartir entre pestañas/hilos (protegido con QMutex).
 */
class MetadataCache {
public:
    explicit MetadataCache(int maxEntries = 64);

    QueryMetadata lookup(const QString& sql, const QStringList& resultColumns);
    bool contains(const QString& sql, const QStringList& resultColumns) const;
    int  size() const;
    void clear();

    static QString keyFor(const QString& sql, const QStringList& resultColumns);

private:
    Q_DISABLE_COPY(MetadataCache)

    mutable QMutex m_mutex;
    QCache<QString, QueryMetadata> m_cache;
};
