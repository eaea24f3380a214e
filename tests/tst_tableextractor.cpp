#include <QtTest>

#include "tableextractor.h"
#include "querytext.h"

class TstTableExtractor : public QObject {
    Q_OBJECT
private slots:
    void singleFrom();
    void fromWithAsAlias();
    void joinsInSourceOrder();
    void schemaQualifierIsDropped_data();
    void schemaQualifierIsDropped();
    void quotedAliasIsLowered();
    void whitespaceIsCollapsed();
    void keywordAfterTableIsTakenAsAlias();
    void noTable();
    void primaryTableNameKeepsCase();
};

void TstTableExtractor::singleFrom(){
    const auto t = extractTables("SELECT * FROM users");
    QCOMPARE(t.size(), 1);
    QCOMPARE(t[0].name, QStringLiteral("users"));
    QVERIFY(t[0].alias.isEmpty());
    QVERIFY(!t[0].hasPrimaryKey());
    QCOMPARE(t[0].primaryKeyField, QStringLiteral("id"));
}

void TstTableExtractor::fromWithAsAlias(){
    const auto t = extractTables("select u.id from Users AS U");
    QCOMPARE(t.size(), 1);
    QCOMPARE(t[0].name, QStringLiteral("users"));
    QCOMPARE(t[0].alias, QStringLiteral("u"));
}

void TstTableExtractor::joinsInSourceOrder(){
    const auto t = extractTables(
        "SELECT u.id, o.total, p.name FROM users u "
        "JOIN orders o ON o.user_id = u.id "
        "LEFT JOIN products AS p ON p.id = o.product_id");
    QCOMPARE(t.size(), 3);
    QCOMPARE(t[0].name, QStringLiteral("users"));
    QCOMPARE(t[0].alias, QStringLiteral("u"));
    QCOMPARE(t[1].name, QStringLiteral("orders"));
    QCOMPARE(t[1].alias, QStringLiteral("o"));
    QCOMPARE(t[2].name, QStringLiteral("products"));
    QCOMPARE(t[2].alias, QStringLiteral("p"));
}

void TstTableExtractor::schemaQualifierIsDropped_data(){
    QTest::addColumn<QString>("sql");
    QTest::addColumn<QString>("table");

    QTest::newRow("schema.table")     << "SELECT * FROM public.users"         << "users";
    QTest::newRow("\"s\".\"t\"")      << "SELECT * FROM \"Public\".\"Users\"" << "users";
    QTest::newRow("s.\"t\"")          << "SELECT * FROM public.\"Users\""     << "users";
    QTest::newRow("\"t\"")            << "SELECT * FROM \"Order Items\""      << "order items";
}

void TstTableExtractor::schemaQualifierIsDropped(){
    QFETCH(QString, sql);
    QFETCH(QString, table);
    const auto t = extractTables(sql);
    QCOMPARE(t.size(), 1);
    QCOMPARE(t[0].name, table);
}

void TstTableExtractor::quotedAliasIsLowered(){
    const auto t = extractTables("SELECT * FROM a x JOIN \"Order Items\" AS \"OI\" ON \"OI\".a_id = x.id");
    QCOMPARE(t.size(), 2);
    QCOMPARE(t[1].name, QStringLiteral("order items"));
    QCOMPARE(t[1].alias, QStringLiteral("oi"));
}

void TstTableExtractor::whitespaceIsCollapsed(){
    const auto t = extractTables("SELECT *\n  FROM\n\tusers\n");
    QCOMPARE(t.size(), 1);
    QCOMPARE(t[0].name, QStringLiteral("users"));
}

void TstTableExtractor::keywordAfterTableIsTakenAsAlias(){
    // Limitación conocida del patrón: no distingue palabras clave
    const auto t = extractTables("SELECT * FROM users WHERE id = 1");
    QCOMPARE(t.size(), 1);
    QCOMPARE(t[0].name, QStringLiteral("users"));
    QCOMPARE(t[0].alias, QStringLiteral("where"));
}

void TstTableExtractor::noTable(){
    QVERIFY(extractTables("SELECT 1").isEmpty());
    QVERIFY(extractTables("").isEmpty());
}

void TstTableExtractor::primaryTableNameKeepsCase(){
    QCOMPARE(primaryTableName("SELECT * FROM public.\"Users\" u"), QStringLiteral("Users"));
    QCOMPARE(primaryTableName("select *\nfrom   orders"), QStringLiteral("orders"));
    QVERIFY(primaryTableName("SELECT now()").isEmpty());
}

QTEST_APPLESS_MAIN(TstTableExtractor)
#include "tst_tableextractor.moc"
