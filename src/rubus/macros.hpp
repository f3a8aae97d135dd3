#pragma once

// standard
#include <cstdint>
#include <cstddef>
#include <chrono>


namespace rubus {

    // framing
    inline constexpr std::size_t LengthFieldSize = 4;
    inline constexpr std::size_t MaxFrameSize = 256 * 1024 * 1024;

    // secure session
    inline constexpr std::size_t IvLength = 16;
    inline constexpr std::size_t NonceLength = 64;
    inline constexpr std::size_t CipherKeyLength = 32;
    inline constexpr std::size_t MacKeyLength = NonceLength - CipherKeyLength;
    inline constexpr std::size_t MacLength = 32;
    // response must fit one sealed frame, cipher padding included
    inline constexpr std::size_t MaxResponseSize = MaxFrameSize - LengthFieldSize - IvLength - MacLength - 16;

    // network
    inline constexpr int DefaultPort = 54300;
    inline constexpr std::size_t NetworkBufferSize = 4096;
    // requests are header only, larger input is treated as garbage
    inline constexpr std::size_t MaxRequestSize = 64 * 1024;
    inline constexpr std::chrono::milliseconds DefaultRequestTimeout {300};
    inline constexpr std::chrono::milliseconds DefaultAcceptTimeout {50};
    inline constexpr std::chrono::milliseconds DefaultHandshakeTimeout {2000};

}
