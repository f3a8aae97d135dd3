#pragma once

// standard
#include <string_view>
#include <cstdint>
#include <string>


namespace rubus {

    // Wire form of client requests, header terminated by "body-length 0" and blank line.
    class RequestBuilder {
    public:
        static std::string list(std::string_view titleContains = ".*");
        static std::string info(std::string_view mediaId);
        static std::string fetch(std::string_view mediaId, std::uint32_t firstPiece, std::uint32_t pieceCount);
    };

}
