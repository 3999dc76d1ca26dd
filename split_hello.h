#ifndef SPLIT_HELLO_H
#define SPLIT_HELLO_H

#include <span>
#include <random>
#include <cstddef>
#include <cstdint>

namespace tunnel
{

class split_strategy
{
   public:
    virtual ~split_strategy() = default;

    // Length of the first segment for a hello of `length` bytes, in [0, length].
    [[nodiscard]] virtual std::size_t split_point(std::size_t length) = 0;
};

// Draws the split offset uniformly from [min_split, max_split] and clamps it
// to half the hello, so a short hello is never cut more than halfway. An empty
// hello always splits at 0.
class random_split final : public split_strategy
{
   public:
    static constexpr std::size_t kMinSplit = 32;
    static constexpr std::size_t kMaxSplit = 64;

    explicit random_split(std::size_t min_split = kMinSplit, std::size_t max_split = kMaxSplit);
    random_split(std::size_t min_split, std::size_t max_split, std::uint64_t seed);

    [[nodiscard]] std::size_t split_point(std::size_t length) override;

    [[nodiscard]] std::size_t min_split() const { return min_split_; }
    [[nodiscard]] std::size_t max_split() const { return max_split_; }

   private:
    std::size_t min_split_;
    std::size_t max_split_;
    std::mt19937_64 gen_;
};

struct hello_segments
{
    std::span<const std::uint8_t> first;
    std::span<const std::uint8_t> second;
};

[[nodiscard]] hello_segments split_hello(std::span<const std::uint8_t> hello, split_strategy& strategy);

}    // namespace tunnel

#endif
