#pragma once

#include "arplace/core/types.h"

namespace arplace {

// Canvas-group style visibility for one screen.
struct ScreenVisual {
    float alpha{0.0f};
    bool interactable{false};
    bool blocksRaycasts{false};
    bool active{true};
};

// Receives the visual state of a screen whenever the navigator changes it.
class ScreenSink {
public:
    virtual ~ScreenSink() = default;
    virtual void applyScreenVisual(ScreenId screen, const ScreenVisual& visual) = 0;
};

} // namespace arplace
