#pragma once

#include "arplace/core/easing.h"
#include "arplace/core/types.h"
#include "arplace/navigation/screen_sink.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace arplace {

class EventQueue;

struct NavigatorConfig {
    float transitionDuration{0.5f};
    EasingCurve transitionCurve{EasingCurve::easeInOut()};
    bool enableBackKey{true};
    bool enableHistory{true};
    std::size_t maxHistory{10};
    ScreenId defaultScreen{kNoScreen};
    ScreenId homeScreen{kNoScreen};
    // Keep non-current screens active at alpha 0 instead of deactivating them.
    bool preloadScreens{true};
    bool startInvisible{true};
    bool showHomeAtStart{true};
};

// Screen stack with timed cross-fades. Navigation requests during a fade are rejected.
class ScreenNavigator {
public:
    using ScreenChangedCallback = std::function<void(ScreenId previous, ScreenId current)>;
    using BackAtRootCallback = std::function<void()>;

    explicit ScreenNavigator(NavigatorConfig config = {}, ScreenSink* sink = nullptr, EventQueue* events = nullptr);

    bool registerScreen(ScreenId screen, const std::string& name);
    bool unregisterScreen(ScreenId screen);
    bool isRegistered(ScreenId screen) const noexcept;
    ScreenId findByName(const std::string& name) const noexcept;

    // Applies the initial visibility once every screen is registered.
    void start();

    bool navigateTo(ScreenId screen, bool addToHistory = true);
    bool navigateToByName(const std::string& name, bool addToHistory = true);
    bool goBack();
    bool handleBackKey();
    void setScreenDirectly(ScreenId screen);
    void showHomeScreen();
    void showFirstScreen();
    void clearHistory() noexcept { history_.clear(); }

    void tick(float dt);

    void setOnScreenChanged(ScreenChangedCallback callback) { onScreenChanged_ = std::move(callback); }
    void setOnBackAtRoot(BackAtRootCallback callback) { onBackAtRoot_ = std::move(callback); }

    ScreenId currentScreen() const noexcept { return current_; }
    std::string currentScreenName() const;
    bool isTransitioning() const noexcept { return transition_.active; }
    bool hasStarted() const noexcept { return started_; }
    bool canGoBack() const noexcept;
    std::size_t historyCount() const noexcept { return history_.size(); }
    const std::vector<ScreenId>& history() const noexcept { return history_; }
    ScreenVisual visual(ScreenId screen) const noexcept;
    const NavigatorConfig& config() const noexcept { return config_; }
    ArError lastError() const noexcept { return lastError_; }

private:
    struct ScreenEntry {
        ScreenId id;
        std::string name;
        ScreenVisual visual;
    };

    struct Transition {
        bool active = false;
        ScreenId from = kNoScreen;
        ScreenId to = kNoScreen;
        float elapsed = 0.0f;
    };

    ScreenEntry* entry(ScreenId screen) noexcept;
    const ScreenEntry* entry(ScreenId screen) const noexcept;
    void setVisual(ScreenId screen, const ScreenVisual& visual);
    void setAlpha(ScreenId screen, float alpha);
    void activate(ScreenId screen);
    void hide(ScreenId screen);
    void pushHistory(ScreenId screen);
    void finishTransition();
    void changed(ScreenId previous, ScreenId current);
    void backAtRoot();
    void fail(ArError error);

    NavigatorConfig config_;
    ScreenSink* sink_;
    EventQueue* events_;

    std::vector<ScreenEntry> screens_;
    std::vector<ScreenId> history_;  // back() is the top of the stack
    ScreenId current_ = kNoScreen;
    Transition transition_{};
    bool started_ = false;
    ArError lastError_ = ArError::Ok;

    ScreenChangedCallback onScreenChanged_;
    BackAtRootCallback onBackAtRoot_;
};

} // namespace arplace
