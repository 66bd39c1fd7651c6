#include "arplace/navigation/screen_navigator.h"
#include "arplace/core/logging.h"
#include "arplace/core/math.h"
#include "arplace/protocol/event_queue.h"

#include <algorithm>

namespace arplace {

using protocol::ErrorSource;
using protocol::EventType;

ScreenNavigator::ScreenNavigator(NavigatorConfig config, ScreenSink* sink, EventQueue* events)
    : config_(std::move(config)), sink_(sink), events_(events) {
    if (config_.maxHistory == 0) config_.maxHistory = 1;
}

ScreenNavigator::ScreenEntry* ScreenNavigator::entry(ScreenId screen) noexcept {
    for (auto& e : screens_) {
        if (e.id == screen) return &e;
    }
    return nullptr;
}

const ScreenNavigator::ScreenEntry* ScreenNavigator::entry(ScreenId screen) const noexcept {
    for (const auto& e : screens_) {
        if (e.id == screen) return &e;
    }
    return nullptr;
}

bool ScreenNavigator::registerScreen(ScreenId screen, const std::string& name) {
    if (screen == kNoScreen || entry(screen)) {
        fail(ArError::InvalidArgument);
        return false;
    }
    screens_.push_back(ScreenEntry{screen, name, ScreenVisual{}});
    return true;
}

bool ScreenNavigator::unregisterScreen(ScreenId screen) {
    auto it = std::find_if(screens_.begin(), screens_.end(), [&](const ScreenEntry& e) { return e.id == screen; });
    if (it == screens_.end()) return false;
    screens_.erase(it);
    if (current_ == screen) current_ = kNoScreen;
    return true;
}

bool ScreenNavigator::isRegistered(ScreenId screen) const noexcept {
    return entry(screen) != nullptr;
}

ScreenId ScreenNavigator::findByName(const std::string& name) const noexcept {
    for (const auto& e : screens_) {
        if (e.name == name) return e.id;
    }
    return kNoScreen;
}

std::string ScreenNavigator::currentScreenName() const {
    const ScreenEntry* e = entry(current_);
    return e ? e->name : std::string("None");
}

ScreenVisual ScreenNavigator::visual(ScreenId screen) const noexcept {
    const ScreenEntry* e = entry(screen);
    return e ? e->visual : ScreenVisual{};
}

void ScreenNavigator::fail(ArError error) {
    lastError_ = error;
    if (events_) events_->recordWarning(error, ErrorSource::Navigator);
}

void ScreenNavigator::setVisual(ScreenId screen, const ScreenVisual& visual) {
    ScreenEntry* e = entry(screen);
    if (!e) return;
    e->visual = visual;
    if (sink_) sink_->applyScreenVisual(screen, visual);
}

void ScreenNavigator::setAlpha(ScreenId screen, float alpha) {
    ScreenEntry* e = entry(screen);
    if (!e) return;
    ScreenVisual v = e->visual;
    v.alpha = alpha;
    setVisual(screen, v);
}

void ScreenNavigator::activate(ScreenId screen) {
    setVisual(screen, ScreenVisual{1.0f, true, true, true});
}

void ScreenNavigator::hide(ScreenId screen) {
    setVisual(screen, ScreenVisual{0.0f, false, false, config_.preloadScreens});
}

// ==============================================================================
// Startup
// ==============================================================================

void ScreenNavigator::start() {
    history_.clear();
    transition_ = Transition{};
    started_ = false;

    for (const auto& e : screens_) {
        setVisual(e.id, ScreenVisual{0.0f, false, false, config_.startInvisible || config_.preloadScreens});
    }

    const ScreenId starting = config_.homeScreen != kNoScreen ? config_.homeScreen : config_.defaultScreen;
    current_ = isRegistered(starting) ? starting : kNoScreen;

    if (config_.startInvisible) {
        if (config_.showHomeAtStart && isRegistered(config_.homeScreen)) {
            activate(config_.homeScreen);
            started_ = true;
            ARPLACE_LOG_DEBUG("ScreenNavigator: home screen shown at start: %s", currentScreenName().c_str());
        } else {
            ARPLACE_LOG_DEBUG("ScreenNavigator: all screens invisible until the first navigation");
        }
        return;
    }

    if (current_ != kNoScreen) activate(current_);
    started_ = true;
}

// ==============================================================================
// Navigation
// ==============================================================================

void ScreenNavigator::pushHistory(ScreenId screen) {
    if (screen == kNoScreen) return;
    if (!history_.empty() && history_.back() == screen) return;

    history_.push_back(screen);
    if (history_.size() > config_.maxHistory) {
        history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - config_.maxHistory));
    }
    ARPLACE_LOG_DEBUG("ScreenNavigator: history size %zu", history_.size());
}

bool ScreenNavigator::navigateTo(ScreenId screen, bool addToHistory) {
    if (transition_.active) {
        ARPLACE_LOG_DEBUG("ScreenNavigator: transition already in progress, ignoring request");
        fail(ArError::TransitionInProgress);
        return false;
    }
    if (!isRegistered(screen)) {
        ARPLACE_LOG_WARN("ScreenNavigator: unknown screen %u", screen);
        fail(ArError::InvalidArgument);
        return false;
    }

    // First navigation out of the invisible start shows the target without a fade.
    if (!started_ && config_.startInvisible) {
        started_ = true;
        activate(screen);
        const ScreenId previous = kNoScreen;
        current_ = screen;
        lastError_ = ArError::Ok;
        changed(previous, current_);
        return true;
    }

    if (current_ == kNoScreen) {
        activate(screen);
        current_ = screen;
        started_ = true;
        lastError_ = ArError::Ok;
        return true;
    }

    if (current_ == screen) {
        ARPLACE_LOG_DEBUG("ScreenNavigator: already on target screen");
        return false;
    }

    if (addToHistory && config_.enableHistory) pushHistory(current_);

    ARPLACE_LOG_DEBUG("ScreenNavigator: %u -> %u", current_, screen);
    transition_ = Transition{true, current_, screen, 0.0f};

    ScreenVisual from = visual(current_);
    from.alpha = 1.0f;
    from.interactable = false;
    from.blocksRaycasts = false;
    setVisual(current_, from);
    setVisual(screen, ScreenVisual{0.0f, false, true, true});

    lastError_ = ArError::Ok;
    if (config_.transitionDuration <= 0.0f) finishTransition();
    return true;
}

bool ScreenNavigator::navigateToByName(const std::string& name, bool addToHistory) {
    const ScreenId screen = findByName(name);
    if (screen == kNoScreen) {
        ARPLACE_LOG_WARN("ScreenNavigator: screen '%s' not found", name.c_str());
        fail(ArError::InvalidArgument);
        return false;
    }
    return navigateTo(screen, addToHistory);
}

bool ScreenNavigator::goBack() {
    if (transition_.active) {
        fail(ArError::TransitionInProgress);
        return false;
    }
    if (!started_ && config_.startInvisible) {
        ARPLACE_LOG_DEBUG("ScreenNavigator: back ignored before the first navigation");
        return false;
    }

    while (!history_.empty()) {
        const ScreenId previous = history_.back();
        history_.pop_back();
        // Screens unregistered since they were pushed are skipped.
        if (isRegistered(previous)) return navigateTo(previous, false);
    }

    if (config_.defaultScreen != kNoScreen && current_ != config_.defaultScreen && isRegistered(config_.defaultScreen)) {
        ARPLACE_LOG_DEBUG("ScreenNavigator: no history, returning to default screen");
        return navigateTo(config_.defaultScreen, false);
    }

    backAtRoot();
    return false;
}

bool ScreenNavigator::handleBackKey() {
    if (!config_.enableBackKey) return false;
    return goBack();
}

void ScreenNavigator::setScreenDirectly(ScreenId screen) {
    if (transition_.active) {
        fail(ArError::TransitionInProgress);
        return;
    }
    if (!isRegistered(screen)) {
        fail(ArError::InvalidArgument);
        return;
    }
    if (current_ != kNoScreen && current_ != screen) hide(current_);
    activate(screen);
    current_ = screen;
    started_ = true;
    lastError_ = ArError::Ok;
}

void ScreenNavigator::showHomeScreen() {
    if (config_.homeScreen == kNoScreen) {
        ARPLACE_LOG_WARN("ScreenNavigator: home screen not assigned");
        fail(ArError::InvalidOperation);
        return;
    }
    navigateTo(config_.homeScreen, false);
}

void ScreenNavigator::showFirstScreen() {
    if (started_) return;
    const ScreenId first = config_.homeScreen != kNoScreen ? config_.homeScreen : config_.defaultScreen;
    if (first != kNoScreen) navigateTo(first);
}

bool ScreenNavigator::canGoBack() const noexcept {
    return !history_.empty() || (config_.defaultScreen != kNoScreen && current_ != config_.defaultScreen);
}

// ==============================================================================
// Fade
// ==============================================================================

void ScreenNavigator::tick(float dt) {
    if (!transition_.active) return;

    transition_.elapsed += std::max(0.0f, dt);
    if (transition_.elapsed >= config_.transitionDuration) {
        finishTransition();
        return;
    }
    const float k = config_.transitionCurve.evaluate(transition_.elapsed / config_.transitionDuration);
    setAlpha(transition_.from, lerp(1.0f, 0.0f, k));
    setAlpha(transition_.to, lerp(0.0f, 1.0f, k));
}

void ScreenNavigator::finishTransition() {
    const Transition done = transition_;
    transition_ = Transition{};

    if (ScreenEntry* from = entry(done.from)) {
        ScreenVisual v = from->visual;
        v.alpha = 0.0f;
        v.blocksRaycasts = false;
        v.active = config_.preloadScreens;
        setVisual(done.from, v);
    }
    if (ScreenEntry* to = entry(done.to)) {
        ScreenVisual v = to->visual;
        v.alpha = 1.0f;
        v.interactable = true;
        v.active = true;
        setVisual(done.to, v);
    }

    const ScreenId previous = current_;
    current_ = done.to;
    ARPLACE_LOG_DEBUG("ScreenNavigator: transition complete, current %s", currentScreenName().c_str());
    changed(previous, current_);
}

void ScreenNavigator::changed(ScreenId previous, ScreenId current) {
    if (events_) events_->push(EventType::ScreenChanged, previous, current);
    if (onScreenChanged_) onScreenChanged_(previous, current);
}

void ScreenNavigator::backAtRoot() {
    ARPLACE_LOG_DEBUG("ScreenNavigator: back pressed at root");
    if (events_) events_->push(EventType::BackAtRoot, current_);
    if (onBackAtRoot_) onBackAtRoot_();
}

} // namespace arplace
