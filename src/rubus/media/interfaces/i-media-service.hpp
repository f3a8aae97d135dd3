#pragma once

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>

// standard
#include <string_view>
#include <cstdint>
#include <string>
#include <vector>


namespace rubus {

    struct MediaEntry {
        std::string id;
        std::string title;
    };

    struct MediaDescription {
        std::string id;
        std::string title;
        // number of playback pieces
        std::uint32_t duration;
    };

    // Clip i of video and audio belongs to piece offset + i.
    struct MediaClips {
        std::vector<std::string> video;
        std::vector<std::string> audio;
    };

    // Catalogue lookup and clip storage.
    class IMediaService {
    public:
        // query is case insensitive pattern searched in titles,
        // InvalidArgument if it does not compile
        virtual absl::StatusOr<std::vector<MediaEntry>> list(std::string_view query) = 0;
        // NotFound for unknown id
        virtual absl::StatusOr<MediaDescription> info(std::string_view id) = 0;
        // NotFound for unknown id, OutOfRange if range is outside of medium
        virtual absl::StatusOr<MediaClips> fetch(std::string_view id, std::uint32_t offset, std::uint32_t amount) = 0;

        virtual ~IMediaService() = default;
    };

}
