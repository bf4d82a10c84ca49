#include <gtest/gtest.h>
#include "OutputUtils.hpp"
#include "OutputData.hpp"
#include "TrajectoryReader.hpp"
#include "NpyFormat.hpp"
#include "System.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace {
    std::filesystem::path tempFile(const std::string& name) {
        return std::filesystem::temp_directory_path() / name;
    }

    OutputData sampleTrajectory() {
        OutputData data(2, 3);
        for (size_t t = 0; t < 3; ++t) {
            for (size_t p = 0; p < 2; ++p) {
                Particle particle(Vec3(t + 0.25, p + 0.5, -1.0 * t),
                                  Vec3(0.1 * p, 0.0, 1.0));
                data.setParticleData(p, t, particle);
            }
            data.setSystemData(t, 0.005 * (t + 1), 1.0, -0.5);
        }
        return data;
    }

    // Writes a v1.0 .npy with the given header dict followed by raw data bytes
    void writeRawNpy(const std::filesystem::path& path, const std::string& dict, size_t dataBytes) {
        std::string header = dict;
        size_t unpadded = npy::preambleSize + header.size() + 1;
        header.append((npy::headerAlignment - unpadded % npy::headerAlignment) % npy::headerAlignment, ' ');
        header.push_back('\n');

        std::ofstream out(path, std::ios::binary);
        out.write(npy::magic, npy::magicSize);
        out.put('\x01');
        out.put('\x00');
        out.put(static_cast<char>(header.size() & 0xFF));
        out.put(static_cast<char>((header.size() >> 8) & 0xFF));
        out << header;
        out << std::string(dataBytes, '\0');
    }

    std::string readAll(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
}

TEST(NpyOutput, HeaderDescribesShapeAndIsAligned) {
    std::filesystem::path path = tempFile("ljbox_header.npy");
    flushNPYOutput(sampleTrajectory(), path.string());
    std::string bytes = readAll(path);
    std::filesystem::remove(path);

    ASSERT_GT(bytes.size(), npy::preambleSize);
    EXPECT_EQ(bytes.substr(0, npy::magicSize), std::string(npy::magic, npy::magicSize));
    EXPECT_EQ(bytes[6], '\x01');
    EXPECT_EQ(bytes[7], '\x00');

    size_t headerLen = static_cast<unsigned char>(bytes[8]) |
                       (static_cast<size_t>(static_cast<unsigned char>(bytes[9])) << 8);
    EXPECT_EQ((npy::preambleSize + headerLen) % npy::headerAlignment, 0u);

    std::string header = bytes.substr(npy::preambleSize, headerLen);
    EXPECT_NE(header.find("'descr': '<f8'"), std::string::npos);
    EXPECT_NE(header.find("'fortran_order': False"), std::string::npos);
    EXPECT_NE(header.find("'shape': (3, 2, 3)"), std::string::npos);
    EXPECT_EQ(header.back(), '\n');

    EXPECT_EQ(bytes.size(), npy::preambleSize + headerLen + 3 * 2 * 3 * 8);
}

TEST(NpyOutput, ReaderLoadsWrittenPositions) {
    std::filesystem::path path = tempFile("ljbox_positions.npy");
    OutputData data = sampleTrajectory();
    flushNPYOutput(data, path.string());

    TrajectoryData loaded = readTrajectoryNpy(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(loaded.numTimeSteps, 3u);
    EXPECT_EQ(loaded.numParticles, 2u);
    EXPECT_EQ(loaded.positions, data.positions);
    EXPECT_EQ(loaded.position(2, 1), Vec3(2.25, 1.5, -2.0));
}

TEST(NpyOutput, SimulationRunPersistsTrajectory) {
    Particles p(2);
    p.setParticle(0, 4.0, 5.0, 5.0, 0.5, 0.0, 0.0);
    p.setParticle(1, 6.0, 5.0, 5.0, -0.5, 0.0, 0.0);
    SimulationConfig cfg;
    cfg.numSteps = 25;

    std::filesystem::path path = tempFile("ljbox_run.npy");
    System sys(std::move(p), cfg);
    sys.runSimulation(path.string(), cfg.describe());

    TrajectoryData loaded = readTrajectoryNpy(path.string());
    std::filesystem::remove(path);

    ASSERT_EQ(loaded.numTimeSteps, 25u);
    ASSERT_EQ(loaded.numParticles, 2u);
    EXPECT_EQ(loaded.positions, sys.getTrajectory().positions);
    EXPECT_EQ(loaded.position(24, 0), sys.getParticles()[0].position);
}

TEST(NpyOutput, UnwritablePathIsOutputError) {
    EXPECT_THROW(flushNPYOutput(sampleTrajectory(), "/nonexistent_ljbox_dir/out.npy"), OutputError);
}

TEST(TrajectoryReader, MissingFileIsReportedAsNotFound) {
    try {
        readTrajectoryNpy("missing_ljbox_trajectory.npy");
        FAIL() << "expected TrajectoryNotFoundError";
    } catch (const TrajectoryNotFoundError& ex) {
        EXPECT_EQ(ex.path(), "missing_ljbox_trajectory.npy");
    }
}

TEST(TrajectoryReader, RejectsNonNpyFiles) {
    std::filesystem::path path = tempFile("ljbox_not_npy.npy");
    {
        std::ofstream out(path);
        out << "particle_id,time,x,y,z\n";
    }
    EXPECT_THROW(readTrajectoryNpy(path.string()), OutputError);
    std::filesystem::remove(path);
}

TEST(TrajectoryReader, RejectsTruncatedData) {
    std::filesystem::path path = tempFile("ljbox_truncated.npy");
    flushNPYOutput(sampleTrajectory(), path.string());
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 8);

    EXPECT_THROW(readTrajectoryNpy(path.string()), OutputError);
    std::filesystem::remove(path);
}

TEST(TrajectoryReader, RejectsShapeWhoseSizeOverflows) {
    std::filesystem::path path = tempFile("ljbox_overflow.npy");
    writeRawNpy(path, "{'descr': '<f8', 'fortran_order': False, 'shape': (6148914691236517206, 1, 3), }", 16);

    EXPECT_THROW(readTrajectoryNpy(path.string()), OutputError);
    std::filesystem::remove(path);
}

TEST(TrajectoryReader, RejectsShapeLargerThanTheFile) {
    std::filesystem::path path = tempFile("ljbox_oversized.npy");
    writeRawNpy(path, "{'descr': '<f8', 'fortran_order': False, 'shape': (100000000000, 10, 3), }", 0);

    EXPECT_THROW(readTrajectoryNpy(path.string()), OutputError);
    std::filesystem::remove(path);
}

TEST(TrajectoryReader, RejectsTrailingBytesAfterData) {
    std::filesystem::path path = tempFile("ljbox_trailing.npy");
    writeRawNpy(path, "{'descr': '<f8', 'fortran_order': False, 'shape': (1, 1, 3), }", 4 * 8);

    EXPECT_THROW(readTrajectoryNpy(path.string()), OutputError);
    std::filesystem::remove(path);
}

TEST(TrajectoryReader, AcceptsHandWrittenHeader) {
    std::filesystem::path path = tempFile("ljbox_handwritten.npy");
    writeRawNpy(path, "{'descr': '<f8', 'fortran_order': False, 'shape': (2, 1, 3), }", 2 * 3 * 8);

    TrajectoryData loaded = readTrajectoryNpy(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(loaded.numTimeSteps, 2u);
    EXPECT_EQ(loaded.numParticles, 1u);
    EXPECT_EQ(loaded.position(1, 0), Vec3(0.0, 0.0, 0.0));
}

TEST(CsvOutput, WritesMetadataHeaderAndOneRowPerParticlePerStep) {
    std::filesystem::path path = tempFile("ljbox_output.csv");
    flushCSVOutput(sampleTrajectory(), path.string(), "# dt: 0.005\n");

    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "# dt: 0.005");
    std::getline(in, line);
    EXPECT_EQ(line, "particle_id,time,x,y,z,vx,vy,vz,kinetic,potential,total");

    int rows = 0;
    std::string first;
    while (std::getline(in, line)) {
        if (rows == 0) first = line;
        ++rows;
    }
    in.close();
    std::filesystem::remove(path);

    EXPECT_EQ(rows, 6);
    EXPECT_EQ(first.rfind("0,0.00500000,0.25000000,0.50000000", 0), 0u);
}

TEST(CsvOutput, UnwritablePathIsOutputError) {
    EXPECT_THROW(flushCSVOutput(sampleTrajectory(), "/nonexistent_ljbox_dir/out.csv", ""), OutputError);
}
