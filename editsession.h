#ifndef EDITSESSION_H
#define EDITSESSION_H

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>
#include "cellsnapshot.h"
#include "changetracker.h"
#include "querymetadata.h"

class MetadataCache;

/**
 * Estado de edición de UNA pestaña de consulta:
 *  - applyResult()   tras ejecutar (metadatos + actual + original)
 *  - setCellValue()  edición del usuario sobre la matriz actual
 *  - setCurrent()    matriz completa devuelta por el grid
 *  - changes()/pendingStatements()  diff y UPDATEs a ejecutar
 *  - discardChanges() actual := original
 *  - markSaved()      original := actual (cuando el llamador ejecutó todo bien)
 * No ejecuta nada ni guarda estado compartido; cada pestaña tiene la suya.
 */
class EditSession {
public:
    explicit EditSession(const QString& name = QStringLiteral("Untitled"),
                         MetadataCache* cache = nullptr);

    const QString& name() const { return m_name; }
    void setName(const QString& n) { m_name = n; }

    const QString& sql() const { return m_sql; }
    const QStringList& resultColumns() const { return m_columns; }
    bool hasMetadata() const { return m_hasMetadata; }
    const QueryMetadata& metadata() const { return m_metadata; }

    const CellMatrix& current()  const { return m_current; }
    const CellMatrix& original() const { return m_original; }

    // Resultado vacío => sin metadatos ni matrices
    void applyResult(const QString& sql, const QStringList& resultColumns,
                     const QVector<QVariantMap>& rows);
    void clear();

    bool setCellValue(int row, int column, const QString& value, QString* err = nullptr);
    bool setCellValue(int row, const QString& resultName, const QString& value, QString* err = nullptr);
    // Matriz editada fuera (vista del grid); misma forma y readOnly que la original
    bool setCurrent(const CellMatrix& matrix, QString* err = nullptr);

    QVector<RowChanges> changes() const;
    ChangeSummary summary() const;
    bool hasChanges() const;
    QStringList pendingStatements() const;

    void discardChanges();
    void markSaved();

private:
    QString        m_name;
    MetadataCache* m_cache = nullptr;   // no es dueño

    QString        m_sql;
    QStringList    m_columns;
    bool           m_hasMetadata = false;
    QueryMetadata  m_metadata;
    CellMatrix     m_current;
    CellMatrix     m_original;
};

#endif // EDITSESSION_H
