#include "editsession.h"

#include "metadatacache.h"
#include "mutationsynthesizer.h"
#include "querytext.h"

EditSession::EditSession(const QString& name, MetadataCache* cache)
    : m_name(name), m_cache(cache) {}

void EditSession::clear(){
    m_columns.clear();
    m_hasMetadata = false;
    m_metadata = QueryMetadata();
    m_current.clear();
    m_original.clear();
}

void EditSession::applyResult(const QString& sql, const QStringList& resultColumns,
                              const QVector<QVariantMap>& rows){
    m_sql = sql;
    if (rows.isEmpty() || resultColumns.isEmpty()) { clear(); return; }

    m_columns  = resultColumns;
    m_metadata = m_cache ? m_cache->lookup(sql, resultColumns)
                         : buildQueryMetadata(sql, resultColumns);
    m_hasMetadata = true;

    m_current  = buildSnapshot(rows, m_metadata);
    m_original = m_current;

    // Pestaña nueva: toma el nombre de la tabla principal
    if (m_name == QLatin1String("Untitled")) {
        const QString t = primaryTableName(sql);
        if (!t.isEmpty()) m_name = t;
    }
}

bool EditSession::setCellValue(int row, int column, const QString& value, QString* err){
    if (row < 0 || row >= m_current.size()) {
        if (err) *err = QStringLiteral("Fila fuera de rango: %1").arg(row);
        return false;
    }
    CellRow& cells = m_current[row];
    if (column < 0 || column >= cells.size()) {
        if (err) *err = QStringLiteral("Columna fuera de rango: %1").arg(column);
        return false;
    }
    if (cells[column].readOnly) {
        if (err) *err = QStringLiteral("La columna \"%1\" es de solo lectura")
                            .arg(m_metadata.columns.value(column).resultName);
        return false;
    }
    cells[column].value = value;
    return true;
}

bool EditSession::setCellValue(int row, const QString& resultName, const QString& value, QString* err){
    const int col = m_metadata.columnIndex(resultName);
    if (col < 0) {
        if (err) *err = QStringLiteral("Columna desconocida: %1").arg(resultName);
        return false;
    }
    return setCellValue(row, col, value, err);
}

bool EditSession::setCurrent(const CellMatrix& matrix, QString* err){
    if (!sameShape(matrix, m_original)) {
        if (err) *err = QStringLiteral("La matriz no coincide con el resultado (filas, columnas o solo lectura)");
        return false;
    }
    m_current = matrix;
    return true;
}

QVector<RowChanges> EditSession::changes() const {
    if (!m_hasMetadata) return {};
    return computeChanges(m_current, m_original, m_metadata);
}

ChangeSummary EditSession::summary() const {
    return summarizeChanges(changes());
}

bool EditSession::hasChanges() const {
    return summary().totalChanges > 0;
}

QStringList EditSession::pendingStatements() const {
    return generateUpdateStatements(changes());
}

void EditSession::discardChanges(){
    m_current = m_original;
}

void EditSession::markSaved(){
    m_original = m_current;
}
