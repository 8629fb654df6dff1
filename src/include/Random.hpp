#pragma once

#include <memory>
#include <mutex>
#include <random>
#include <string_view>

// Interface for random number generation, mocked in tests.
class RandomBase {
   public:
    using ret_type = long;

    RandomBase() = default;
    virtual ~RandomBase() = default;

    /**
     * generate - Generate a uniformly distributed number in [min, max].
     *
     * @param min min value (inclusive)
     * @param max max value (inclusive)
     * @throws std::invalid_argument if min > max
     * @return Generated number
     */
    virtual ret_type generate(const ret_type min, const ret_type max) const = 0;

    // Alias for generate(0, max)
    ret_type generate(const ret_type max) const { return generate(0, max); }
};

class Random : public RandomBase {
   public:
    Random();
    ~Random() override = default;

    using RandomBase::generate;
    ret_type generate(const ret_type min, const ret_type max) const override;

    [[nodiscard]] std::string_view getName() const { return "STD C++ mt19937"; }

   private:
    mutable std::mutex mutex_;
    mutable std::mt19937_64 engine_;
};
