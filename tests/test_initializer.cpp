#include <gtest/gtest.h>
#include "Initializer.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace {
    std::filesystem::path writeParticleFile(const std::string& name, const std::string& contents) {
        std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << contents;
        return path;
    }
}

TEST(RandomInitializer, SameSeedSameEnsemble) {
    InitResult a = Initializer::initRandomParticles(10, 10.0, 2.0, 2.0, 42);
    InitResult b = Initializer::initRandomParticles(10, 10.0, 2.0, 2.0, 42);

    ASSERT_EQ(a.particles.n, 10u);
    for (size_t i = 0; i < a.particles.n; ++i) {
        EXPECT_EQ(a.particles[i].position, b.particles[i].position);
        EXPECT_EQ(a.particles[i].velocity, b.particles[i].velocity);
    }
}

TEST(RandomInitializer, DrawsPositionsThenVelocitiesPerParticle) {
    InitResult result = Initializer::initRandomParticles(3, 10.0, 2.0, 2.0, 42);

    std::mt19937 gen(42);
    std::uniform_real_distribution<double> posDist(2.0, 8.0);
    std::uniform_real_distribution<double> velDist(-2.0, 2.0);
    for (size_t i = 0; i < 3; ++i) {
        double px = posDist(gen);
        double py = posDist(gen);
        double pz = posDist(gen);
        double vx = velDist(gen);
        double vy = velDist(gen);
        double vz = velDist(gen);
        EXPECT_EQ(result.particles[i].position, Vec3(px, py, pz));
        EXPECT_EQ(result.particles[i].velocity, Vec3(vx, vy, vz));
    }
}

TEST(RandomInitializer, ValuesStayInRanges) {
    InitResult result = Initializer::initRandomParticles(500, 10.0, 2.0, 1.5, 123);

    for (const Particle& particle : result.particles) {
        for (int d = 0; d < 3; ++d) {
            EXPECT_GE(particle.position[d], 2.0);
            EXPECT_LE(particle.position[d], 8.0);
            EXPECT_GE(particle.velocity[d], -1.5);
            EXPECT_LE(particle.velocity[d], 1.5);
        }
        EXPECT_EQ(particle.force, Vec3());
    }
    EXPECT_NE(result.metadata.find("# Seed: 123"), std::string::npos);
}

TEST(RandomInitializer, RejectsImpossibleParameters) {
    EXPECT_THROW(Initializer::initRandomParticles(0, 10.0, 2.0, 2.0, 1), ConfigError);
    EXPECT_THROW(Initializer::initRandomParticles(5, 4.0, 2.0, 2.0, 1), ConfigError);
    EXPECT_THROW(Initializer::initRandomParticles(5, 10.0, -1.0, 2.0, 1), ConfigError);
    EXPECT_THROW(Initializer::initRandomParticles(5, 10.0, 2.0, -2.0, 1), ConfigError);
}

TEST(FileInitializer, ReadsParticlesSkippingComments) {
    std::filesystem::path path = writeParticleFile("ljbox_particles.dat",
        "# px py pz vx vy vz\n"
        "1.0 2.0 3.0 0.1 0.2 0.3\n"
        "\n"
        "  4.5 5.5 6.5 -1 -2 -3\n");

    InitResult result = Initializer::initFromFile(path.string());
    std::filesystem::remove(path);

    ASSERT_EQ(result.particles.n, 2u);
    EXPECT_EQ(result.particles[0].position, Vec3(1.0, 2.0, 3.0));
    EXPECT_EQ(result.particles[0].velocity, Vec3(0.1, 0.2, 0.3));
    EXPECT_EQ(result.particles[1].position, Vec3(4.5, 5.5, 6.5));
    EXPECT_EQ(result.particles[1].velocity, Vec3(-1.0, -2.0, -3.0));
}

TEST(FileInitializer, MalformedOrMissingFilesAreConfigErrors) {
    EXPECT_THROW(Initializer::initFromFile("no_such_ljbox_file.dat"), ConfigError);

    std::filesystem::path shortRow = writeParticleFile("ljbox_short_row.dat", "1 2 3 4 5\n");
    EXPECT_THROW(Initializer::initFromFile(shortRow.string()), ConfigError);
    std::filesystem::remove(shortRow);

    std::filesystem::path empty = writeParticleFile("ljbox_empty.dat", "# nothing here\n");
    EXPECT_THROW(Initializer::initFromFile(empty.string()), ConfigError);
    std::filesystem::remove(empty);
}
