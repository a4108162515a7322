#include <seekline/random/random_source.h>
#include <seekline/reader/error.h>

namespace seekline {

Mt19937RandomSource::Mt19937RandomSource() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    engine_.seed(seq);
}

Mt19937RandomSource::Mt19937RandomSource(std::uint64_t seed) : engine_(seed) {}

std::uint64_t Mt19937RandomSource::uniform(std::uint64_t upper) {
    if (upper == 0) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Random upper bound must be greater than 0");
    }
    std::uniform_int_distribution<std::uint64_t> dis(0, upper - 1);
    return dis(engine_);
}

}  // namespace seekline
