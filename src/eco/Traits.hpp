// src/eco/Traits.hpp
#pragma once

namespace fractal::eco {

// The six behavioural traits, each in [0, 1].
struct Traits {
    float aggression   = 0.0f;
    float intelligence = 0.0f;
    float social       = 0.0f;
    float territorial  = 0.0f;
    float predator     = 0.0f; // predator affinity
    float prey         = 0.0f; // prey affinity
};

} // namespace fractal::eco
