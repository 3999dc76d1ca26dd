#include <string>
#include <cstddef>
#include <cstdint>

#include "config.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return 0;
    }

    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto cfg = tunnel::parse_config_text(input);
    if (cfg)
    {
        (void)tunnel::parse_config_text(tunnel::dump_config(*cfg));
        (void)tunnel::decode_probe_payload(*cfg);
    }

    return 0;
}
