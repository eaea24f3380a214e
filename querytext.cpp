#include "querytext.h"

#include <QRegularExpression>
#include <QStringList>

QString normalizeSql(const QString& sql){
    static const QRegularExpression ws("\\s+");
    return QString(sql).replace(ws, " ").trimmed();
}

QString tableIdentifierPattern(){
    return QStringLiteral(
        "(?:\"[^\"]+\"(?:\\.\"[^\"]+\")?"
        "|[a-z_][a-z0-9_]*(?:\\.[a-z_][a-z0-9_]*)?(?:\\.\"[^\"]+\")?"
        "|\"[^\"]+\"\\.[a-z_][a-z0-9_]*)");
}

QString simpleIdentifierPattern(){
    return QStringLiteral("(?:\"[^\"]+\"|[a-z_][a-z0-9_]*)");
}

QString unquoteIdentifier(const QString& ident){
    if (ident.size() >= 2 && ident.startsWith('"') && ident.endsWith('"'))
        return ident.mid(1, ident.size()-2);
    return ident;
}

QString tableFromReference(const QString& ref){
    const QStringList parts = ref.split('.');
    if (parts.size() == 2) return unquoteIdentifier(parts[1]);
    return unquoteIdentifier(ref);
}

QString primaryTableName(const QString& sql){
    static const QRegularExpression rx(
        QStringLiteral("\\bfrom\\s+(%1)").arg(tableIdentifierPattern()),
        QRegularExpression::CaseInsensitiveOption);
    const auto m = rx.match(normalizeSql(sql));
    return m.hasMatch() ? tableFromReference(m.captured(1)) : QString();
}
