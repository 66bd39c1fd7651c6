#pragma once

#include <gtest/gtest.h>
#include "arplace/navigation/screen_sink.h"
#include "arplace/placement/asset_catalog.h"
#include "arplace/placement/scene_host.h"
#include "arplace/protocol/event_queue.h"
#include "arplace/tracking/plane_visibility.h"
#include "arplace/tracking/raycast_provider.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace arplace_test {

using namespace arplace;

// Returns a single hit at `pose` while `valid`.
class FakeRaycastProvider : public RaycastProvider {
public:
    bool raycast(const Vec2& viewportPoint, TrackableFilter filter, std::vector<RaycastHit>& hits) override {
        lastPoint = viewportPoint;
        lastFilter = filter;
        calls++;
        hits.clear();
        if (!valid) return false;
        RaycastHit hit;
        hit.pose = pose;
        hits.push_back(hit);
        return true;
    }

    void setHit(const Vec3& position, const Quat& rotation = Quat{}) {
        valid = true;
        pose = Pose{position, rotation};
    }

    bool valid = false;
    Pose pose{};
    Vec2 lastPoint{};
    TrackableFilter lastFilter{TrackableFilter::None};
    int calls = 0;
};

// In-memory scene. `log` records create/destroy in call order as "+id" / "-id".
class FakeSceneHost : public SceneHost {
public:
    struct Object {
        std::uint32_t assetIndex = 0;
        Vec3 position{};
        Quat rotation{};
        Vec3 scale{1.0f, 1.0f, 1.0f};
        bool isStatic = false;
    };

    ObjectId instantiate(std::uint32_t assetIndex, const Vec3& position, const Quat& rotation) override {
        if (refuseInstantiate) return kInvalidObjectId;
        const ObjectId id = nextId++;
        Object obj;
        obj.assetIndex = assetIndex;
        obj.position = position;
        obj.rotation = rotation;
        objects[id] = obj;
        log.push_back("+" + std::to_string(id));
        maxAlive = std::max(maxAlive, objects.size());
        return id;
    }

    void destroy(ObjectId id) override {
        if (objects.erase(id) > 0) log.push_back("-" + std::to_string(id));
    }

    bool isAlive(ObjectId id) const override { return objects.count(id) > 0; }

    void setPosition(ObjectId id, const Vec3& p) override {
        if (auto* o = find(id)) o->position = p;
    }
    void setRotation(ObjectId id, const Quat& r) override {
        if (auto* o = find(id)) o->rotation = r;
    }
    void setScale(ObjectId id, const Vec3& s) override {
        if (auto* o = find(id)) o->scale = s;
    }
    Vec3 position(ObjectId id) const override { return objects.count(id) ? objects.at(id).position : Vec3{}; }
    Quat rotation(ObjectId id) const override { return objects.count(id) ? objects.at(id).rotation : Quat{}; }
    Vec3 scale(ObjectId id) const override { return objects.count(id) ? objects.at(id).scale : Vec3{}; }

    void configureStatic(ObjectId id) override {
        if (auto* o = find(id)) o->isStatic = true;
    }

    Vec3 cameraPosition() const override { return camera; }

    Object* find(ObjectId id) {
        auto it = objects.find(id);
        return it == objects.end() ? nullptr : &it->second;
    }

    std::map<ObjectId, Object> objects;
    std::vector<std::string> log;
    std::size_t maxAlive = 0;
    ObjectId nextId = 1;
    Vec3 camera{0.0f, 1.5f, 0.0f};
    bool refuseInstantiate = false;
};

class FakeScreenSink : public ScreenSink {
public:
    void applyScreenVisual(ScreenId screen, const ScreenVisual& visual) override {
        visuals[screen] = visual;
        applyCount++;
    }

    std::map<ScreenId, ScreenVisual> visuals;
    int applyCount = 0;
};

class FakePlaneSource : public PlaneEventSource {
public:
    std::uint32_t subscribe(PlaneChangeCallback callback) override {
        const std::uint32_t id = nextId++;
        subscribers[id] = std::move(callback);
        return id;
    }
    void unsubscribe(std::uint32_t subscriptionId) override {
        subscribers.erase(subscriptionId);
        unsubscribeCount++;
    }
    std::vector<std::uint32_t> trackedPlanes() const override { return tracked; }

    void fire(const PlaneChange& change) {
        auto copy = subscribers;
        for (auto& entry : copy) entry.second(change);
    }

    std::map<std::uint32_t, PlaneChangeCallback> subscribers;
    std::vector<std::uint32_t> tracked;
    std::uint32_t nextId = 1;
    int unsubscribeCount = 0;
};

class FakePlaneVisualSink : public PlaneVisualSink {
public:
    void setPlaneVisualsEnabled(std::uint32_t planeId, bool enabled) override { planes[planeId] = enabled; }
    std::map<std::uint32_t, bool> planes;
};

inline std::vector<protocol::SessionEvent> drainEvents(EventQueue& queue) {
    const auto meta = queue.poll(1024);
    const auto* events = reinterpret_cast<const protocol::SessionEvent*>(meta.ptr);
    if (!events) return {};
    return std::vector<protocol::SessionEvent>(events, events + meta.count);
}

inline std::size_t countEvents(const std::vector<protocol::SessionEvent>& events, protocol::EventType type) {
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), [&](const protocol::SessionEvent& e) {
        return e.type == static_cast<std::uint16_t>(type);
    }));
}

inline AssetDescriptor makeAsset(const std::string& name, float pivotOffsetY = 0.0f) {
    AssetDescriptor desc;
    desc.name = name;
    desc.pivot.localPivotOffsetY = pivotOffsetY;
    return desc;
}

inline void expectVecNear(const Vec3& actual, const Vec3& expected, float eps = 1e-4f) {
    EXPECT_NEAR(actual.x, expected.x, eps);
    EXPECT_NEAR(actual.y, expected.y, eps);
    EXPECT_NEAR(actual.z, expected.z, eps);
}

} // namespace arplace_test
