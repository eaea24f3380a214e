#include "tableextractor.h"
#include "querytext.h"

#include <QRegularExpression>

// <kw> <tabla> [[AS] alias]
static QRegularExpression clauseRegex(const char* keyword){
    return QRegularExpression(
        QStringLiteral("\\b%1\\s+(%2)(?:\\s+(?:as\\s+)?(%3))?")
            .arg(QLatin1String(keyword), tableIdentifierPattern(), simpleIdentifierPattern()),
        QRegularExpression::CaseInsensitiveOption);
}

static TableRef tableFromMatch(const QRegularExpressionMatch& m){
    TableRef t;
    t.name = tableFromReference(m.captured(1)).toLower();
    if (!m.captured(2).isEmpty())
        t.alias = unquoteIdentifier(m.captured(2)).toLower();
    return t;
}

QVector<TableRef> extractTables(const QString& sql){
    static const QRegularExpression fromRx = clauseRegex("from");
    static const QRegularExpression joinRx = clauseRegex("join");

    const QString s = normalizeSql(sql);
    QVector<TableRef> out;

    const auto fm = fromRx.match(s);
    if (fm.hasMatch()) out << tableFromMatch(fm);

    auto it = joinRx.globalMatch(s);
    while (it.hasNext()) out << tableFromMatch(it.next());

    qCDebug(lcMetadata) << "tablas:" << out.size() << "en" << s.left(80);
    return out;
}
