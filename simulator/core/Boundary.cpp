#include "Boundary.hpp"

int enforceBoundaries(Particle& particle, double boxSize)
{
    int reflections = 0;
    for (int dim = 0; dim < 3; ++dim) {
        if (particle.position[dim] <= 0.0) {
            particle.position[dim] = 0.0;
            particle.velocity[dim] = -particle.velocity[dim];
            ++reflections;
        } else if (particle.position[dim] >= boxSize) {
            particle.position[dim] = boxSize;
            particle.velocity[dim] = -particle.velocity[dim];
            ++reflections;
        }
    }
    return reflections;
}
