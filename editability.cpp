#include "editability.h"
#include "querytext.h"

#include <QRegularExpression>
#include <algorithm>

bool hasNonEditableConstructs(const QString& sql){
    static const QRegularExpression patterns[] = {
        QRegularExpression("\\bgroup\\s+by\\b"),
        QRegularExpression("\\bhaving\\b"),
        QRegularExpression("\\bunion\\b"),
        QRegularExpression("\\bintersect\\b"),
        QRegularExpression("\\bexcept\\b"),
        QRegularExpression("\\bdistinct\\b"),
        QRegularExpression("\\bcount\\s*\\("),
        QRegularExpression("\\bsum\\s*\\("),
        QRegularExpression("\\bavg\\s*\\("),
        QRegularExpression("\\bmin\\s*\\("),
        QRegularExpression("\\bmax\\s*\\("),
    };
    const QString s = normalizeSql(sql).toLower();
    for (const auto& rx : patterns) {
        if (rx.match(s).hasMatch()) {
            qCDebug(lcMetadata) << "no editable por" << rx.pattern();
            return true;
        }
    }
    return false;
}

bool isQueryEditable(const QString& sql, const QVector<TableRef>& tables){
    if (hasNonEditableConstructs(sql)) return false;
    if (tables.isEmpty()) return false;
    return std::any_of(tables.begin(), tables.end(),
                       [](const TableRef& t){ return t.hasPrimaryKey(); });
}

bool isColumnReadOnly(const QueryMetadata& md, int column){
    if (!md.isEditable) return true;
    if (column < 0 || column >= md.columns.size()) return true;

    const ColumnInfo& c = md.columns[column];
    if (c.isComputed || c.isPrimaryKey || c.tableName.isEmpty()) return true;

    const TableRef* t = md.table(c.tableName);
    return t && !t->hasPrimaryKey();
}
