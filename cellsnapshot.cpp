#include "cellsnapshot.h"
#include "editability.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

const QString kNullSentinel = QStringLiteral("NULL");

static QString compactJson(const QJsonDocument& doc){
    return QString::fromUtf8(doc.toJson(QJsonDocument::Compact));
}

QString formatCellValue(const QVariant& v){
    if (!v.isValid() || v.isNull()) return kNullSentinel;

    switch (v.typeId()) {
    case QMetaType::QVariantMap:
        return compactJson(QJsonDocument(QJsonObject::fromVariantMap(v.toMap())));
    case QMetaType::QVariantHash:
        return compactJson(QJsonDocument(QJsonObject::fromVariantHash(v.toHash())));
    case QMetaType::QJsonObject:
        return compactJson(QJsonDocument(v.toJsonObject()));
    case QMetaType::QVariantList:
    case QMetaType::QStringList:
        return compactJson(QJsonDocument(QJsonArray::fromVariantList(v.toList())));
    case QMetaType::QJsonArray:
        return compactJson(QJsonDocument(v.toJsonArray()));
    case QMetaType::QJsonValue: {
        const QJsonValue j = v.toJsonValue();
        if (j.isNull() || j.isUndefined()) return kNullSentinel;
        if (j.isObject()) return compactJson(QJsonDocument(j.toObject()));
        if (j.isArray())  return compactJson(QJsonDocument(j.toArray()));
        return j.toVariant().toString();
    }
    default:
        return v.toString();
    }
}

CellMatrix buildSnapshot(const QVector<QVariantMap>& rows, const QueryMetadata& md){
    // readOnly por columna: depende solo de metadatos + posición
    QVector<bool> ro(md.columns.size());
    for (int c = 0; c < md.columns.size(); ++c) ro[c] = isColumnReadOnly(md, c);

    CellMatrix out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        CellRow cells;
        cells.reserve(md.columns.size());
        for (int c = 0; c < md.columns.size(); ++c) {
            CellData cell;
            cell.value    = formatCellValue(row.value(md.columns[c].resultName));
            cell.readOnly = ro[c];
            cells << cell;
        }
        out << cells;
    }
    return out;
}

bool sameShape(const CellMatrix& a, const CellMatrix& b){
    if (a.size() != b.size()) return false;
    for (int r = 0; r < a.size(); ++r) {
        if (a[r].size() != b[r].size()) return false;
        for (int c = 0; c < a[r].size(); ++c)
            if (a[r][c].readOnly != b[r][c].readOnly) return false;
    }
    return true;
}
