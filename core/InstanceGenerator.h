#pragma once

#include <random>
#include "Common.h"
#include "DistanceModel.h"

struct GeneratorParams {
    int pool_size = DEFAULT_POOL_SIZE;
    int min_distance = 50;
    int max_distance = 100;
};

struct GeneratedInstance {
    DistanceModel model;
    int home = 0;
};

namespace InstanceGenerator {

    // Throws ConfigurationError unless 2 <= pool_size <= 26 and 0 <= min <= max.
    void validate(const GeneratorParams& P);

    /**
     * @brief Generates a fresh random round.
     * The upper triangle gets independent uniform draws in [min, max], mirrored
     * into the lower triangle; the diagonal is zero. The home city is drawn
     * uniformly from the generated cities.
     */
    GeneratedInstance generate(const GeneratorParams& P, std::mt19937& rng);

} // namespace InstanceGenerator
