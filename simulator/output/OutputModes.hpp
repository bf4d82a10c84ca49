#pragma once

// Persistence format of the trajectory written at the end of a run
enum class OutputMode {
    FILE_NPY,         // dense (steps, particles, 3) float64 array in NumPy .npy format
    FILE_CSV          // one CSV row per particle per step, with energies
};
