#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#endif

#include "arplace/protocol/host_bridge.h"
#include "arplace/session.h"

#ifdef EMSCRIPTEN
#include <memory>
#include <string>
#include <vector>

namespace {

using arplace::protocol::HostBridge;

// JS-owned runtime: assets are registered first, then initialize() builds the session
// over the buffered host bridge.
class ArRuntime {
public:
    void registerAsset(const std::string& name, bool present, float scaleX, float scaleY, float scaleZ, float pivotOffsetY) {
        arplace::AssetDescriptor desc;
        desc.name = name;
        desc.present = present;
        desc.localScale = arplace::Vec3{scaleX, scaleY, scaleZ};
        desc.pivot.localPivotOffsetY = pivotOffsetY;
        assets_.push_back(desc);
    }

    void setAssetBounds(std::uint32_t index, float minY, float centerY, float pivotWorldY) {
        if (index >= assets_.size()) return;
        auto& pivot = assets_[index].pivot;
        pivot.hasBounds = true;
        pivot.boundsMin.y = minY;
        pivot.boundsCenter.y = centerY;
        pivot.pivotWorldY = pivotWorldY;
    }

    void registerScreen(std::uint32_t id, const std::string& name) { screens_.emplace_back(id, name); }
    void setDefaultScreen(std::uint32_t id) { config_.navigator.defaultScreen = id; }
    void setHomeScreen(std::uint32_t id) { config_.navigator.homeScreen = id; }

    void initialize() {
        arplace::SessionCollaborators c;
        c.raycast = &bridge_;
        c.scene = &bridge_;
        c.screens = &bridge_;
        c.planes = &bridge_;
        c.planeVisuals = &bridge_;
        session_ = std::make_unique<arplace::ArSession>(assets_, c, config_);
        for (const auto& s : screens_) session_->navigator().registerScreen(s.first, s.second);
        session_->navigator().start();
        session_->quiz().start();
    }

    bool ready() const { return session_ != nullptr; }

    void setSurfaceHit(bool valid, float px, float py, float pz, float qx, float qy, float qz, float qw) {
        bridge_.setSurfaceHit(valid, arplace::Pose{{px, py, pz}, {qx, qy, qz, qw}});
    }
    void setCameraPosition(float x, float y, float z) { bridge_.setCameraPosition({x, y, z}); }
    void planeAdded(std::uint32_t id) {
        arplace::PlaneChange change;
        change.added.push_back(id);
        bridge_.notifyPlanes(change);
    }

    void tick(float dt) {
        if (session_) session_->tick(dt);
    }

    bool place(std::int32_t index) { return session_ && session_->placer().place(index); }
    void clear() {
        if (session_) session_->placer().clear();
    }
    void unlock() {
        if (session_) session_->placer().unlock();
    }
    bool forceReposition() { return session_ && session_->placer().forceReposition(); }
    void setOffset(float forward, float right, float up) {
        if (session_) session_->placer().setOffset(forward, right, up);
    }
    void setFaceCamera(bool faceCamera) {
        if (session_) session_->placer().setFaceCamera(faceCamera);
    }
    void setRotationOffset(float x, float y, float z) {
        if (session_) session_->placer().setRotationOffset({x, y, z});
    }
    void setScaleFactor(float scale) {
        if (session_) session_->placer().setScaleFactor(scale);
    }
    bool isLocked() const { return session_ && session_->placer().isLocked(); }
    bool hasPlacedObject() const { return session_ && session_->placer().hasPlacedObject(); }

    bool navigateTo(std::uint32_t screen) { return session_ && session_->navigator().navigateTo(screen); }
    bool navigateToByName(const std::string& name) { return session_ && session_->navigator().navigateToByName(name); }
    bool goBack() { return session_ && session_->navigator().goBack(); }
    std::uint32_t currentScreen() const { return session_ ? session_->navigator().currentScreen() : arplace::kNoScreen; }

    bool selectAnswer(std::int32_t index) { return session_ && session_->quiz().selectAnswer(index); }
    std::string questionText() const { return session_ ? session_->quiz().questionText() : std::string(); }
    bool sendChat(const std::string& text) { return session_ && session_->chat().send(text); }

    arplace::protocol::EventBufferMeta pollEvents(std::uint32_t maxEvents) {
        if (!session_) return arplace::protocol::EventBufferMeta{0, 0, 0};
        return session_->pollEvents(maxEvents);
    }
    void ackResync(std::uint32_t generation) {
        if (session_) session_->ackResync(generation);
    }
    arplace::protocol::CommandBufferMeta commandBufferMeta() const { return bridge_.commandBufferMeta(); }
    void clearCommands() { bridge_.clearCommands(); }

private:
    HostBridge bridge_;
    std::vector<arplace::AssetDescriptor> assets_;
    std::vector<std::pair<std::uint32_t, std::string>> screens_;
    arplace::SessionConfig config_;
    std::unique_ptr<arplace::ArSession> session_;
};

} // namespace

EMSCRIPTEN_BINDINGS(arplace_module) {
    emscripten::class_<ArRuntime>("ArRuntime")
        .constructor<>()
        .function("registerAsset", &ArRuntime::registerAsset)
        .function("setAssetBounds", &ArRuntime::setAssetBounds)
        .function("registerScreen", &ArRuntime::registerScreen)
        .function("setDefaultScreen", &ArRuntime::setDefaultScreen)
        .function("setHomeScreen", &ArRuntime::setHomeScreen)
        .function("initialize", &ArRuntime::initialize)
        .function("ready", &ArRuntime::ready)
        .function("setSurfaceHit", &ArRuntime::setSurfaceHit)
        .function("setCameraPosition", &ArRuntime::setCameraPosition)
        .function("planeAdded", &ArRuntime::planeAdded)
        .function("tick", &ArRuntime::tick)
        // Placement
        .function("place", &ArRuntime::place)
        .function("clear", &ArRuntime::clear)
        .function("unlock", &ArRuntime::unlock)
        .function("forceReposition", &ArRuntime::forceReposition)
        .function("setOffset", &ArRuntime::setOffset)
        .function("setFaceCamera", &ArRuntime::setFaceCamera)
        .function("setRotationOffset", &ArRuntime::setRotationOffset)
        .function("setScaleFactor", &ArRuntime::setScaleFactor)
        .function("isLocked", &ArRuntime::isLocked)
        .function("hasPlacedObject", &ArRuntime::hasPlacedObject)
        // Screens
        .function("navigateTo", &ArRuntime::navigateTo)
        .function("navigateToByName", &ArRuntime::navigateToByName)
        .function("goBack", &ArRuntime::goBack)
        .function("currentScreen", &ArRuntime::currentScreen)
        // Quiz and chat
        .function("selectAnswer", &ArRuntime::selectAnswer)
        .function("questionText", &ArRuntime::questionText)
        .function("sendChat", &ArRuntime::sendChat)
        // Buffers
        .function("pollEvents", &ArRuntime::pollEvents)
        .function("ackResync", &ArRuntime::ackResync)
        .function("getCommandBufferMeta", &ArRuntime::commandBufferMeta)
        .function("clearCommands", &ArRuntime::clearCommands);

    emscripten::value_object<arplace::protocol::EventBufferMeta>("EventBufferMeta")
        .field("generation", &arplace::protocol::EventBufferMeta::generation)
        .field("count", &arplace::protocol::EventBufferMeta::count)
        .field("ptr", &arplace::protocol::EventBufferMeta::ptr);

    emscripten::value_object<arplace::protocol::CommandBufferMeta>("CommandBufferMeta")
        .field("generation", &arplace::protocol::CommandBufferMeta::generation)
        .field("count", &arplace::protocol::CommandBufferMeta::count)
        .field("ptr", &arplace::protocol::CommandBufferMeta::ptr);
}
#endif
