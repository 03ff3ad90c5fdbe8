#include "core/query/result_cache_notifier.h"
#include "core/shared/logging.h"

namespace cdir {

ResultCacheNotifier::ResultCacheNotifier(const QString& objectsType, QObject* parent)
    : QObject(parent)
    , m_objectsType(objectsType)
{
    qRegisterMetaType<cdir::DataStatePayload>();
}

void ResultCacheNotifier::publish(bool isEmpty)
{
    LOG_DEBUG(cdirCache, "data.payload objectsType=%s isEmpty=%d",
              qUtf8Printable(m_objectsType), isEmpty ? 1 : 0);
    emit dataStateChanged(DataStatePayload{m_objectsType, isEmpty});
}

} // namespace cdir
