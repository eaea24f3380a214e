#include "metadatacache.h"
#include "querytext.h"

#include <QMutexLocker>

// Separador que no aparece en SQL ni en nombres de columna
static const QChar kSep(0x1F);

MetadataCache::MetadataCache(int maxEntries) : m_cache(maxEntries) {}

QString MetadataCache::keyFor(const QString& sql, const QStringList& resultColumns){
    QString key = normalizeSql(sql);
    key += kSep;
    key += QString::number(resultColumns.size());
    for (const QString& c : resultColumns) {
        key += kSep;
        key += c;
    }
    return key;
}

QueryMetadata MetadataCache::lookup(const QString& sql, const QStringList& resultColumns){
    const QString key = keyFor(sql, resultColumns);
    {
        QMutexLocker lock(&m_mutex);
        if (const QueryMetadata* hit = m_cache.object(key))
            return *hit;
    }

    // Se construye fuera del lock; es una función pura
    QueryMetadata md = buildQueryMetadata(sql, resultColumns);

    QMutexLocker lock(&m_mutex);
    m_cache.insert(key, new QueryMetadata(md));
    return md;
}

bool MetadataCache::contains(const QString& sql, const QStringList& resultColumns) const {
    QMutexLocker lock(&m_mutex);
    return m_cache.contains(keyFor(sql, resultColumns));
}

int MetadataCache::size() const {
    QMutexLocker lock(&m_mutex);
    return m_cache.size();
}

void MetadataCache::clear(){
    QMutexLocker lock(&m_mutex);
    m_cache.clear();
}
