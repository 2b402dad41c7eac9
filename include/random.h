/*
 * Random Number Generation Header
 * 
 * Seeded Mersenne Twister owned by each engine run. A seed and its
 * negation give the same stream; |seed| must fit in 32 bits.
 */

#ifndef RANDOM_H
#define RANDOM_H

#include <random>

class RandomGenerator {
private:
    std::mt19937 rng;
    std::uniform_real_distribution<double> uniform_dist;  // [0,1)
    std::normal_distribution<double> normal_dist;         // N(0,1)

public:
    explicit RandomGenerator(long int seed = -12345);

    // Re-seed the generator
    // @throws std::invalid_argument if |seed| exceeds 32 bits
    void reseed(long int seed);

    // Random double in range [0, 1)
    double uniform() { return uniform_dist(rng); }

    // Random integer in range [0, n)
    int uniform_index(int n);

    // Gaussian sample with zero mean and the given standard deviation
    double gaussian(double stddev) { return stddev * normal_dist(rng); }
};

#endif // RANDOM_H
