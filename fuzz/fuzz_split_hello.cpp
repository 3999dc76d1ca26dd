#include <span>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include "split_hello.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size < 10)
    {
        return 0;
    }

    std::uint64_t seed = 0;
    std::memcpy(&seed, data, sizeof(seed));
    const std::size_t min_split = data[8];
    const std::size_t max_split = data[9];
    const std::span<const std::uint8_t> hello(data + 10, size - 10);

    tunnel::random_split splitter(min_split, max_split, seed);
    const auto segments = tunnel::split_hello(hello, splitter);

    if (segments.first.size() + segments.second.size() != hello.size())
    {
        std::abort();
    }
    if (!hello.empty() && (segments.first.data() != hello.data() || segments.second.data() != hello.data() + segments.first.size()))
    {
        std::abort();
    }
    if (segments.first.size() > hello.size() / 2)
    {
        std::abort();
    }

    return 0;
}
