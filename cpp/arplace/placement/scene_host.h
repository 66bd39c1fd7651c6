#pragma once

#include "arplace/core/types.h"
#include <cstdint>

namespace arplace {

// Object instantiation and transform access supplied by the host engine.
class SceneHost {
public:
    virtual ~SceneHost() = default;

    virtual ObjectId instantiate(std::uint32_t assetIndex, const Vec3& position, const Quat& rotation) = 0;
    virtual void destroy(ObjectId id) = 0;
    virtual bool isAlive(ObjectId id) const = 0;

    virtual void setPosition(ObjectId id, const Vec3& position) = 0;
    virtual void setRotation(ObjectId id, const Quat& rotation) = 0;
    virtual void setScale(ObjectId id, const Vec3& scale) = 0;
    virtual Vec3 position(ObjectId id) const = 0;
    virtual Quat rotation(ObjectId id) const = 0;
    virtual Vec3 scale(ObjectId id) const = 0;

    // Kinematic, fully frozen body with a solid collider; tags the object for viewing.
    virtual void configureStatic(ObjectId id) = 0;

    virtual Vec3 cameraPosition() const = 0;
};

} // namespace arplace
