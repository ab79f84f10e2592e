#pragma once

#include "core/shared/types.h"

#include <QHash>
#include <QString>

#include <mutex>

namespace tp {

class RoomCategoryProvider {
public:
    virtual ~RoomCategoryProvider() = default;

    // Free-form label ("small", "medium", ...). An empty label means unknown.
    virtual QString roomCategory(const QString& entityId) const = 0;
};

// Room categories from configuration, with runtime overrides.
class ConfiguredRoomCategoryProvider final : public RoomCategoryProvider {
public:
    explicit ConfiguredRoomCategoryProvider(QHash<QString, QString> categories = {},
                                            QString defaultCategory = QStringLiteral("medium"));

    QString roomCategory(const QString& entityId) const override;
    void setRoomCategory(const QString& entityId, const QString& category);

private:
    mutable std::mutex m_mutex;
    QHash<QString, QString> m_categories;
    QString m_defaultCategory;
};

// Resolves the category for an entity, degrading to Medium when no provider
// is wired in or it has nothing to say.
RoomCategory resolveRoomCategory(const RoomCategoryProvider* provider, const QString& entityId);

} // namespace tp
