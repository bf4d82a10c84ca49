#pragma once
#include "Particles.hpp"

// Confines a particle to [0, boxSize]^3. On each axis a position at or past a
// wall is snapped exactly onto the wall and that velocity component is negated.
// Overshoot is not mirrored back into the box.
// Returns the number of axes on which a reflection happened (0..3).
int enforceBoundaries(Particle& particle, double boxSize);
