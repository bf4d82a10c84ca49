#include "TrajectoryReader.hpp"
#include "NpyFormat.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace {
    // Value that follows "'key':" in the header dict, trimmed of spaces
    std::string headerField(const std::string &header, const std::string &key,
                            const std::string &filename) {
        std::string quoted = "'" + key + "'";
        size_t keyPos = header.find(quoted);
        if (keyPos == std::string::npos)
            throw OutputError("Missing '" + key + "' in .npy header of " + filename);
        size_t colon = header.find(':', keyPos + quoted.size());
        if (colon == std::string::npos)
            throw OutputError("Malformed .npy header in " + filename);
        size_t start = header.find_first_not_of(' ', colon + 1);
        if (start == std::string::npos)
            throw OutputError("Malformed .npy header in " + filename);

        size_t end;
        if (header[start] == '(') {
            end = header.find(')', start);
            if (end == std::string::npos)
                throw OutputError("Malformed shape in .npy header of " + filename);
            ++end;
        } else {
            end = header.find(',', start);
            if (end == std::string::npos) end = header.find('}', start);
        }
        return header.substr(start, end - start);
    }

    std::vector<size_t> parseShape(const std::string &shape, const std::string &filename) {
        std::vector<size_t> dims;
        std::string inner = shape.substr(1, shape.size() - 2);
        std::istringstream fields(inner);
        std::string item;
        while (std::getline(fields, item, ',')) {
            size_t first = item.find_first_not_of(' ');
            if (first == std::string::npos) continue;
            try {
                dims.push_back(static_cast<size_t>(std::stoull(item.substr(first))));
            } catch (const std::exception &) {
                throw OutputError("Invalid dimension '" + item + "' in " + filename);
            }
        }
        return dims;
    }
}

Vec3 TrajectoryData::position(size_t timeIdx, size_t particleIdx) const
{
    if (timeIdx >= numTimeSteps || particleIdx >= numParticles)
        throw std::out_of_range("Trajectory index out of range");
    size_t idx = (timeIdx * numParticles + particleIdx) * 3;
    return Vec3(positions[idx], positions[idx + 1], positions[idx + 2]);
}

TrajectoryData readTrajectoryNpy(const std::string &filename)
{
    if (!std::filesystem::exists(filename)) {
        throw TrajectoryNotFoundError(filename);
    }

    std::error_code ec;
    const std::uintmax_t fileSize = std::filesystem::file_size(filename, ec);
    if (ec) {
        throw OutputError("Could not stat trajectory file " + filename + ": " + ec.message());
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw OutputError("Could not open trajectory file " + filename);
    }

    char preamble[npy::preambleSize];
    if (!in.read(preamble, npy::preambleSize) ||
        std::string(preamble, npy::magicSize) != std::string(npy::magic, npy::magicSize)) {
        throw OutputError(filename + " is not a .npy file");
    }

    const unsigned char major = static_cast<unsigned char>(preamble[6]);
    size_t headerLen;
    if (major == 1) {
        headerLen = static_cast<unsigned char>(preamble[8]) |
                    (static_cast<size_t>(static_cast<unsigned char>(preamble[9])) << 8);
    } else if (major == 2 || major == 3) {
        // Versions 2 and 3 use a 4-byte header length
        unsigned char extra[2];
        if (!in.read(reinterpret_cast<char*>(extra), 2))
            throw OutputError("Truncated .npy header in " + filename);
        headerLen = static_cast<unsigned char>(preamble[8]) |
                    (static_cast<size_t>(static_cast<unsigned char>(preamble[9])) << 8) |
                    (static_cast<size_t>(extra[0]) << 16) |
                    (static_cast<size_t>(extra[1]) << 24);
    } else {
        throw OutputError("Unsupported .npy version " + std::to_string(major) + " in " + filename);
    }

    const std::uintmax_t headerStart = static_cast<std::uintmax_t>(in.tellg());
    if (headerLen > fileSize - headerStart)
        throw OutputError("Truncated .npy header in " + filename);

    std::string header(headerLen, '\0');
    if (!in.read(&header[0], static_cast<std::streamsize>(headerLen)))
        throw OutputError("Truncated .npy header in " + filename);

    std::string descr = headerField(header, "descr", filename);
    if (descr != "'" + std::string(npy::float64Descr) + "'")
        throw OutputError("Expected little-endian float64 data in " + filename + ", got " + descr);
    if (headerField(header, "fortran_order", filename) != "False")
        throw OutputError("Fortran-ordered arrays are not supported: " + filename);

    std::vector<size_t> dims = parseShape(headerField(header, "shape", filename), filename);
    if (dims.size() != 3 || dims[2] != 3)
        throw OutputError("Expected a (steps, particles, 3) array in " + filename);

    // The shape must describe exactly the bytes that follow the header
    const size_t maxSize = std::numeric_limits<size_t>::max();
    const size_t valueSize = 8;
    if (dims[1] > maxSize / (dims[2] * valueSize) ||
        (dims[1] != 0 && dims[0] > maxSize / (dims[1] * dims[2] * valueSize)))
        throw OutputError("Array shape in " + filename + " is too large");

    const size_t count = dims[0] * dims[1] * dims[2];
    const std::uintmax_t dataStart = headerStart + headerLen;
    if (static_cast<std::uintmax_t>(count) * valueSize != fileSize - dataStart)
        throw OutputError("Data size in " + filename + " does not match its shape");

    TrajectoryData traj;
    traj.numTimeSteps = dims[0];
    traj.numParticles = dims[1];

    std::vector<unsigned char> bytes(count * 8);
    if (!in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())))
        throw OutputError("Truncated trajectory data in " + filename);

    traj.positions.resize(count);
    for (size_t i = 0; i < count; ++i) {
        traj.positions[i] = npy::decodeDouble(&bytes[i * 8]);
    }
    return traj;
}
