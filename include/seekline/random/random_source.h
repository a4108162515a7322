#ifndef SEEKLINE_RANDOM_RANDOM_SOURCE_H
#define SEEKLINE_RANDOM_RANDOM_SOURCE_H

#include <cstdint>
#include <random>

namespace seekline {

/**
 * Source of uniformly distributed integers used for random line selection
 */
class RandomSource {
   public:
    virtual ~RandomSource() = default;

    /**
     * Draw a value uniformly from [0, upper)
     * @throws ReaderError(INVALID_ARGUMENT) if upper is 0
     */
    virtual std::uint64_t uniform(std::uint64_t upper) = 0;
};

class Mt19937RandomSource : public RandomSource {
   public:
    /**
     * Seeded from std::random_device
     */
    Mt19937RandomSource();

    /**
     * Deterministic sequence for a fixed seed
     */
    explicit Mt19937RandomSource(std::uint64_t seed);

    std::uint64_t uniform(std::uint64_t upper) override;

   private:
    std::mt19937_64 engine_;
};

}  // namespace seekline

#endif  // SEEKLINE_RANDOM_RANDOM_SOURCE_H
