#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>

namespace cdir {

// Payload sent whenever a WindowedResultCache changes its content.
struct DataStatePayload {
    QString objectsType;
    bool isEmpty = true;
};

// Signal carrier for WindowedResultCache (a template cannot be a Q_OBJECT).
class ResultCacheNotifier : public QObject {
    Q_OBJECT

public:
    explicit ResultCacheNotifier(const QString& objectsType, QObject* parent = nullptr);

    const QString& objectsType() const { return m_objectsType; }

    void publish(bool isEmpty);

signals:
    void dataStateChanged(const cdir::DataStatePayload& payload);

private:
    QString m_objectsType;
};

} // namespace cdir

Q_DECLARE_METATYPE(cdir::DataStatePayload)
