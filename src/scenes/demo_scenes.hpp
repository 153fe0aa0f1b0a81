#pragma once

#include "scenes/scene.hpp"
#include <random>
#include <vector>

namespace braille {

class WaveScene : public Scene {
public:
    const char* name() const override { return "wave"; }
    void draw(uint64_t frame, DotGrid& grid) override;
};

// Position is a pure function of the frame index, so replays match.
class BounceScene : public Scene {
public:
    const char* name() const override { return "bounce"; }
    void draw(uint64_t frame, DotGrid& grid) override;
};

class RainScene : public Scene {
public:
    explicit RainScene(uint32_t seed = 0x5eed);

    const char* name() const override { return "rain"; }
    void draw(uint64_t frame, DotGrid& grid) override;

private:
    struct Drop {
        float y = 0.0f;
        float speed = 1.0f;
        int length = 4;
    };

    std::mt19937 rng_;
    std::vector<Drop> drops_;
    int dot_height_ = 0;

    void reset_drop(Drop& drop, bool anywhere);
};

class SpinnerScene : public Scene {
public:
    const char* name() const override { return "spinner"; }
    void draw(uint64_t frame, DotGrid& grid) override;
};

}
