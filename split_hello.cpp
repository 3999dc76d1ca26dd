#include <span>
#include <random>
#include <cstddef>
#include <cstdint>
#include <algorithm>

#include "split_hello.h"

namespace tunnel
{

random_split::random_split(const std::size_t min_split, const std::size_t max_split)
    : random_split(min_split, max_split, std::random_device{}())
{
}

random_split::random_split(const std::size_t min_split, const std::size_t max_split, const std::uint64_t seed)
    : min_split_(min_split), max_split_(std::max(min_split, max_split)), gen_(seed)
{
}

std::size_t random_split::split_point(const std::size_t length)
{
    if (length == 0)
    {
        return 0;
    }
    std::uniform_int_distribution<std::size_t> dist(min_split_, max_split_);
    const std::size_t split = dist(gen_);
    const std::size_t limit = length / 2;
    return std::min(split, limit);
}

hello_segments split_hello(const std::span<const std::uint8_t> hello, split_strategy& strategy)
{
    if (hello.empty())
    {
        return hello_segments{.first = hello, .second = hello};
    }
    const std::size_t split = std::min(strategy.split_point(hello.size()), hello.size());
    return hello_segments{.first = hello.first(split), .second = hello.subspan(split)};
}

}    // namespace tunnel
