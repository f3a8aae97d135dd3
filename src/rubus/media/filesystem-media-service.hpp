#pragma once

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/container/flat_hash_map.h>

// standard
#include <string_view>
#include <filesystem>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <mutex>

// local
#include "interfaces/i-media-service.hpp"


namespace rubus {

    // Catalogue is <root>/catalogue.json, array of {"id", "title", "duration"} objects.
    // Clip N of medium is stored in <root>/<id>/v<N> and <root>/<id>/a<N>, where <id>
    // is spelled as in catalogue. Ids are served in canonical lowercase uuid form.
    class FilesystemMediaService 
        : public IMediaService
        , public std::enable_shared_from_this<FilesystemMediaService> {
    private: struct Private { };
    public:

        struct Settings {
            std::filesystem::path rootDirectory;
        };

        static std::shared_ptr<FilesystemMediaService> configure(Settings settings);
        FilesystemMediaService(Settings settings, Private access);

        // loads catalogue, may be called once
        absl::Status init();

        // IMediaService implementation
        absl::StatusOr<std::vector<MediaEntry>> list(std::string_view query) override;
        absl::StatusOr<MediaDescription> info(std::string_view id) override;
        absl::StatusOr<MediaClips> fetch(std::string_view id, std::uint32_t offset, std::uint32_t amount) override;

    private:
        absl::StatusOr<std::string> readClip(const std::string& directory, char kind, std::uint32_t piece) const;

    private:
        const Settings settings_;
        std::once_flag init_;

        // catalogue is immutable after init
        std::vector<MediaDescription> catalogue_;
        // clip directory per catalogue entry
        std::vector<std::string> directories_;
        absl::flat_hash_map<std::string, std::size_t> index_;
    };

}
