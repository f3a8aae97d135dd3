#pragma once

// standard
#include <initializer_list>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string>

// local
#include "interfaces/i-socket.hpp"


namespace rubus {

    /*
     * Wire frame: 4 byte big endian length, counting the length field itself,
     * followed by opaque payload.
     */

    // Writes single frame with payload being concatenation of parts.
    void sendFrame(ISocket& socket, std::initializer_list<std::string_view> parts);
    // Reads exactly one frame under single deadline, zero timeout means no deadline.
    // Throws RubusEndOfStream, RubusTimeout or RubusCorruptMessage on bad length.
    std::string receiveFrame(ISocket& socket, std::chrono::milliseconds timeout);

    // Frame reader keeping partially received frame between calls,
    // timeout in the middle of frame does not lose already read bytes.
    class FrameReader {
    public:

        std::string receive(ISocket& socket, std::chrono::milliseconds timeout);
        bool hasPartialFrame() const;
        void reset();

    private:
        void fill(ISocket& socket, std::string& target, std::size_t& progress, 
            std::chrono::steady_clock::time_point deadline, bool bounded);

    private:
        std::string length_;
        std::size_t lengthRead_ = 0;
        std::string payload_;
        std::size_t payloadRead_ = 0;
        bool lengthKnown_ = false;
    };

}
