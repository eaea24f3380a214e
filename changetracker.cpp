#include "changetracker.h"

#include <QHash>
#include <QPair>
#include <QSet>

Q_LOGGING_CATEGORY(lcChanges, "sqlgridedit.changes", QtInfoMsg)

void TableChange::setChange(const QString& field, const QString& oldValue, const QString& newValue){
    for (auto& fc : changes) {
        if (fc.fieldName == field) {
            fc.oldValue = oldValue;
            fc.newValue = newValue;
            return;
        }
    }
    changes.push_back({ field, oldValue, newValue });
}

const FieldChange* TableChange::change(const QString& field) const {
    for (const auto& fc : changes)
        if (fc.fieldName == field) return &fc;
    return nullptr;
}

// nullptr si la fila es más corta
static const CellData* cellAt(const CellRow& row, int col){
    return (col >= 0 && col < row.size()) ? &row[col] : nullptr;
}

QVector<RowChanges> computeChanges(const CellMatrix& current,
                                   const CellMatrix& original,
                                   const QueryMetadata& md){
    QVector<RowChanges> out;
    if (!md.isEditable) return out;

    const int rows = qMin(current.size(), original.size());
    for (int r = 0; r < rows; ++r) {
        const CellRow& cur  = current[r];
        const CellRow& orig = original[r];

        QVector<TableChange> tableChanges;
        QHash<QPair<QString, QString>, int> byKey; // (tabla, pk) -> índice

        for (int c = 0; c < md.columns.size(); ++c) {
            const ColumnInfo& col = md.columns[c];
            const CellData* curCell  = cellAt(cur, c);
            const CellData* origCell = cellAt(orig, c);

            if (curCell && curCell->readOnly) continue;
            if (col.isComputed || col.isPrimaryKey || col.tableName.isEmpty()) continue;

            const QString curValue  = curCell  ? curCell->value  : QString();
            const QString origValue = origCell ? origCell->value : QString();
            if (curValue == origValue) continue;

            const TableRef* t = md.table(col.tableName);
            if (!t || !t->hasPrimaryKey()) {
                qCDebug(lcChanges) << "fila" << r << col.resultName << "descartada: tabla sin PK";
                continue;
            }

            const CellData* pkCell = cellAt(cur, md.columnIndex(t->primaryKeyColumn));
            if (!pkCell || pkCell->value.isEmpty()) {
                qCDebug(lcChanges) << "fila" << r << col.resultName << "descartada: PK vacía";
                continue;
            }

            const auto key = qMakePair(t->name, pkCell->value);
            auto it = byKey.constFind(key);
            int idx;
            if (it == byKey.constEnd()) {
                TableChange tc;
                tc.tableName        = t->name;
                tc.primaryKeyColumn = t->primaryKeyColumn;
                tc.primaryKeyField  = t->primaryKeyField;
                tc.primaryKeyValue  = pkCell->value;
                idx = tableChanges.size();
                tableChanges << tc;
                byKey.insert(key, idx);
            } else {
                idx = it.value();
            }
            tableChanges[idx].setChange(col.fieldName, origValue, curValue);
        }

        if (!tableChanges.isEmpty())
            out.push_back({ r, tableChanges });
    }
    return out;
}

ChangeSummary summarizeChanges(const QVector<RowChanges>& rows){
    ChangeSummary s;
    QSet<QString> tables;
    for (const auto& row : rows) {
        for (const auto& tc : row.tableChanges) {
            s.totalChanges += tc.changes.size();
            tables.insert(tc.tableName);
        }
    }
    s.rowCount   = rows.size();
    s.tableCount = tables.size();
    return s;
}
