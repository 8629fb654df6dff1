#include <Random.hpp>
#include <mutex>
#include <random>
#include <stdexcept>

#include <AbslLogCompat.hpp>

Random::Random() : engine_(std::random_device{}()) {
    LOG(INFO) << "Using " << getName() << " as RNG impl";
}

Random::ret_type Random::generate(const ret_type min,
                                  const ret_type max) const {
    if (min > max) {
        throw std::invalid_argument("min must not be greater than max");
    }
    std::uniform_int_distribution<ret_type> distribution(min, max);
    const std::lock_guard<std::mutex> lock(mutex_);
    return distribution(engine_);
}
