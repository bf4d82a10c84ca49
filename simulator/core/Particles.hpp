#pragma once
#include <cstddef>
#include <stdexcept>
#include <vector>
#include "Vec3.hpp"

// State of a single point particle. The force member holds the force from the
// most recent evaluation and is consumed by the next position half-step.
struct Particle {
    Vec3 position;
    Vec3 velocity;
    Vec3 force;

    Particle() = default;
    Particle(const Vec3& pos, const Vec3& vel) : position(pos), velocity(vel), force() {}
};

// Fixed-size particle ensemble. Particles are never added or removed once the
// ensemble is built.
struct Particles {
    size_t n;
    std::vector<Particle> data;

    Particles() : n(0) {}

    explicit Particles(size_t nParticles) : n(nParticles), data(nParticles) {}

    // Set particle data at index i; the force accumulator is reset to zero
    void setParticle(size_t i, double px, double py, double pz,
                     double vxVal, double vyVal, double vzVal) {
        if (i >= n) throw std::out_of_range("Invalid particle index");
        data[i] = Particle(Vec3(px, py, pz), Vec3(vxVal, vyVal, vzVal));
    }

    Particle& operator[](size_t i) { return data[i]; }
    const Particle& operator[](size_t i) const { return data[i]; }

    Particle& at(size_t i) {
        if (i >= n) throw std::out_of_range("Invalid particle index");
        return data[i];
    }

    const Particle& at(size_t i) const {
        if (i >= n) throw std::out_of_range("Invalid particle index");
        return data[i];
    }

    std::vector<Particle>::iterator begin() { return data.begin(); }
    std::vector<Particle>::iterator end() { return data.end(); }
    std::vector<Particle>::const_iterator begin() const { return data.begin(); }
    std::vector<Particle>::const_iterator end() const { return data.end(); }
};
