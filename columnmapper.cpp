#include "columnmapper.h"
#include "querytext.h"

#include <QHash>
#include <QRegularExpression>

static const auto kCI = QRegularExpression::CaseInsensitiveOption;

QString selectClause(const QString& sql){
    static const QRegularExpression rx("select\\s+(.+?)\\s+from\\s", kCI);
    const auto m = rx.match(normalizeSql(sql));
    return m.hasMatch() ? m.captured(1) : QString();
}

bool isComputedColumn(const QString& clause, const QString& resultName){
    const QString col = QRegularExpression::escape(resultName);
    const QString patterns[] = {
        // (subconsulta | expresión) [AS] col
        QStringLiteral("\\([^)]+\\)\\s+(?:as\\s+)?%1\\b"),
        // a + b ... [AS] col
        QStringLiteral("\\w+\\s*[+\\-*/]\\s*\\w+.*?(?:as\\s+)?%1\\b"),
        // a || b ... [AS] col
        QStringLiteral("\\w+\\s*\\|\\|\\s*\\w+.*?(?:as\\s+)?%1\\b"),
        QStringLiteral("\\b(?:coalesce|case|nullif|concat)\\s*\\(.*?(?:as\\s+)?%1\\b"),
    };
    for (const QString& p : patterns) {
        if (QRegularExpression(p.arg(col), kCI).match(clause).hasMatch())
            return true;
    }
    return false;
}

// alias -> tabla y tabla -> tabla
static QHash<QString, QString> aliasMap(const QVector<TableRef>& tables){
    QHash<QString, QString> map;
    for (const auto& t : tables) {
        if (!t.alias.isEmpty()) map.insert(t.alias, t.name);
        map.insert(t.name, t.name);
    }
    return map;
}

// Primer <prefijo>.<campo> de la cláusula que corresponda a la columna
static bool matchQualifiedField(const QString& clause, const QString& resultName,
                                const QHash<QString, QString>& aliases,
                                QString& table, QString& field){
    const QRegularExpression rx(
        QStringLiteral("\\b([a-z_][a-z0-9_]*)\\.([a-z_][a-z0-9_]*)(?:\\s+(?:as\\s+)?%1)?\\b")
            .arg(QRegularExpression::escape(resultName)),
        kCI);

    auto it = rx.globalMatch(clause);
    while (it.hasNext()) {
        const auto m = it.next();
        const QString full = m.captured(0);
        const QString prefix = m.captured(1);
        const QString f = m.captured(2);
        if (!full.contains(resultName, Qt::CaseInsensitive) &&
            f.compare(resultName, Qt::CaseInsensitive) != 0)
            continue;
        const QString t = aliases.value(prefix.toLower());
        if (t.isEmpty()) continue;
        table = t;
        field = f;
        return true;
    }
    return false;
}

QVector<ColumnInfo> mapColumns(const QString& sql,
                               const QStringList& resultColumns,
                               const QVector<TableRef>& tables){
    QVector<ColumnInfo> out;
    out.reserve(resultColumns.size());

    const QString clause = selectClause(sql);
    if (clause.isNull()) {
        // Sin SELECT ... FROM reconocible: nada asignado
        for (const QString& col : resultColumns) {
            ColumnInfo c;
            c.resultName = col;
            c.fieldName  = col;
            out << c;
        }
        return out;
    }

    const bool isStar = clause.trimmed() == "*";
    const auto aliases = aliasMap(tables);

    for (const QString& col : resultColumns) {
        ColumnInfo c;
        c.resultName = col;
        c.fieldName  = col;

        if (!isStar) {
            QString table, field;
            if (matchQualifiedField(clause, col, aliases, table, field)) {
                c.tableName = table;
                c.fieldName = field;
            }
        }

        if (c.tableName.isEmpty() && tables.size() == 1)
            c.tableName = tables.first().name;

        if (!isStar)
            c.isComputed = isComputedColumn(clause, col);

        out << c;
    }
    return out;
}
