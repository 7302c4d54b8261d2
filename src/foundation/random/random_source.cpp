#include "dqe/foundation/random_source.hpp"

#include <cmath>

namespace dqe::foundation {

MersenneRandomSource MersenneRandomSource::fromEntropy() {
    std::random_device device;
    auto seed = (static_cast<uint64_t>(device()) << 32) | device();
    return MersenneRandomSource(seed);
}

double MersenneRandomSource::uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    // uniform_real_distribution is half-open; nextafter makes hi reachable.
    std::uniform_real_distribution<double> dist(lo, std::nextafter(hi, hi + 1.0));
    return dist(engine_);
}

double MersenneRandomSource::chance() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

}  // namespace dqe::foundation
