#include "../include/random.h"
#include <cstdint>
#include <stdexcept>
#include <string>

RandomGenerator::RandomGenerator(long int seed)
    : uniform_dist(0.0, 1.0), normal_dist(0.0, 1.0) {
    reseed(seed);
}

void RandomGenerator::reseed(long int seed)
{
    // |seed| without negating a long, so LONG_MIN is well defined
    unsigned long magnitude = seed < 0 ? 0UL - static_cast<unsigned long>(seed)
                                       : static_cast<unsigned long>(seed);
    if (magnitude > UINT32_MAX) {
        throw std::invalid_argument("Seed " + std::to_string(seed) + " does not fit in 32 bits");
    }
    uint32_t value = static_cast<uint32_t>(magnitude);
    if (value == 0) value = 1;  // Avoid seed = 0

    rng.seed(value);
    uniform_dist.reset();
    normal_dist.reset();
}

int RandomGenerator::uniform_index(int n)
{
    int index = static_cast<int>(uniform() * n);
    // uniform() * n may round up to n
    return index < n ? index : n - 1;
}
