// boost
#include <boost/endian/conversion.hpp>

// Abseil
#include <absl/strings/str_format.h>

// standard
#include <initializer_list>
#include <string_view>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <chrono>
#include <string>

// rubus
#include <common/exceptions.hpp>
#include <rubus/macros.hpp>

// local
#include "framing.hpp"

using namespace rubus;
using namespace std::chrono;


void rubus::sendFrame(ISocket& socket, std::initializer_list<std::string_view> parts) {
    std::size_t total = LengthFieldSize;
    for (const auto& part : parts) {
        total += part.size();
    }

    if (total > MaxFrameSize) {
        throw RubusOverrun(absl::StrFormat("frame of %d bytes exceeds limit of %d bytes", total, MaxFrameSize));
    }

    std::string frame (LengthFieldSize, '\0');
    frame.reserve(total);
    std::uint32_t length = boost::endian::native_to_big(static_cast<std::uint32_t>(total));
    std::memcpy(frame.data(), &length, LengthFieldSize);
    for (const auto& part : parts) {
        frame.append(part);
    }

    socket.write(frame.data(), frame.size());
}

std::string rubus::receiveFrame(ISocket& socket, milliseconds timeout) {
    FrameReader reader;
    return reader.receive(socket, timeout);
}

std::string FrameReader::receive(ISocket& socket, milliseconds timeout) {
    bool bounded = timeout.count() > 0;
    auto deadline = steady_clock::now() + timeout;

    if (!lengthKnown_) {
        length_.resize(LengthFieldSize);
        fill(socket, length_, lengthRead_, deadline, bounded);

        std::uint32_t total = 0;
        std::memcpy(&total, length_.data(), LengthFieldSize);
        boost::endian::big_to_native_inplace(total);
        if (total < LengthFieldSize || total > MaxFrameSize) {
            reset();
            throw RubusCorruptMessage(absl::StrFormat("frame length %d is out of bounds", total));
        }

        lengthKnown_ = true;
        payload_.assign(total - LengthFieldSize, '\0');
        payloadRead_ = 0;
    }

    fill(socket, payload_, payloadRead_, deadline, bounded);

    std::string frame = std::move(payload_);
    reset();
    return frame;
}

void FrameReader::fill(ISocket& socket, std::string& target, std::size_t& progress, 
    steady_clock::time_point deadline, bool bounded) 
{
    while (progress < target.size()) {
        milliseconds wait {0};
        if (bounded) {
            wait = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (wait.count() <= 0) {
                throw RubusTimeout(absl::StrFormat(
                    "frame incomplete: %d of %d bytes received before deadline", progress, target.size()));
            }
        }

        try {
            progress += socket.read(target.data() + progress, target.size() - progress, wait);
        } catch (const RubusEndOfStream&) {
            bool partial = progress > 0 || lengthKnown_;
            reset();
            if (partial) {
                throw RubusEndOfStream("stream closed in the middle of frame");
            }
            throw;
        }
    }
}

bool FrameReader::hasPartialFrame() const {
    return lengthKnown_ || lengthRead_ > 0;
}

void FrameReader::reset() {
    length_.clear();
    lengthRead_ = 0;
    payload_.clear();
    payloadRead_ = 0;
    lengthKnown_ = false;
}
