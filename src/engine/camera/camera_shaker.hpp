#pragma once

/**
 * Something that can shake the camera, usually the player's camera controller
 */
class CameraShaker {
public:
    virtual ~CameraShaker() = default;

    /**
     * Shakes the camera for the given duration. Once a shake starts it can't be stopped
     */
    virtual void shake_camera(float frequency, float amplitude, float duration) = 0;
};
