#include "core/feedback/room_category_provider.h"

namespace tp {

ConfiguredRoomCategoryProvider::ConfiguredRoomCategoryProvider(QHash<QString, QString> categories,
                                                               QString defaultCategory)
    : m_categories(std::move(categories))
    , m_defaultCategory(std::move(defaultCategory))
{
}

QString ConfiguredRoomCategoryProvider::roomCategory(const QString& entityId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_categories.value(entityId, m_defaultCategory);
}

void ConfiguredRoomCategoryProvider::setRoomCategory(const QString& entityId, const QString& category)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_categories.insert(entityId, category);
}

RoomCategory resolveRoomCategory(const RoomCategoryProvider* provider, const QString& entityId)
{
    if (!provider) {
        return RoomCategory::Medium;
    }
    return roomCategoryFromString(provider->roomCategory(entityId));
}

} // namespace tp
