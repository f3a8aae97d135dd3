// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

// nlohmann_json
#include <nlohmann/json.hpp>

// boost
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/string_generator.hpp>

// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// standard
#include <string_view>
#include <filesystem>
#include <stdexcept>
#include <iterator>
#include <optional>
#include <limits>
#include <fstream>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <regex>
#include <mutex>

// local
#include "filesystem-media-service.hpp"

using namespace rubus;

namespace {

    constexpr std::string_view CatalogueFile = "catalogue.json";

    absl::StatusOr<std::string> readFile(const std::filesystem::path& path) {
        std::ifstream ifs {path, std::ios::in | std::ios::binary};
        if (!ifs) {
            return absl::NotFoundError(absl::StrFormat("could not open %s", path.string()));
        }

        std::string contents {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
        if (ifs.bad()) {
            return absl::InternalError(absl::StrFormat("error while reading %s", path.string()));
        }
        return contents;
    }

    std::optional<std::string> canonicalId(const std::string& text) {
        try {
            return boost::uuids::to_string(boost::uuids::string_generator()(text));
        } catch (const std::runtime_error&) {
            return std::nullopt;
        }
    }

}


std::shared_ptr<FilesystemMediaService> FilesystemMediaService::configure(Settings settings) {
    return std::make_shared<FilesystemMediaService>(std::move(settings), Private());
}

FilesystemMediaService::FilesystemMediaService(Settings settings, Private access)
: settings_(std::move(settings))
{}

absl::Status FilesystemMediaService::init() {
    absl::Status status = absl::FailedPreconditionError("catalogue is already loaded");
    std::call_once(init_, [this, &status]() {
        auto contents = readFile(settings_.rootDirectory / CatalogueFile);
        if (!contents.ok()) {
            status = contents.status();
            return;
        }

        auto json = nlohmann::json::parse(*contents, nullptr, false);
        if (json.is_discarded() || !json.is_array()) {
            status = absl::InvalidArgumentError("catalogue must be json array of media descriptions");
            return;
        }

        for (const auto& entry : json) {
            if (!entry.is_object() 
                || !entry.contains("id") || !entry["id"].is_string()
                || !entry.contains("title") || !entry["title"].is_string()
                || !entry.contains("duration") || !entry["duration"].is_number_unsigned()) 
            {
                status = absl::InvalidArgumentError(absl::StrCat("malformed catalogue entry: ", entry.dump()));
                return;
            }

            std::string directory = entry["id"].get<std::string>();
            auto id = canonicalId(directory);
            if (!id) {
                status = absl::InvalidArgumentError(absl::StrCat("catalogue id is not uuid: ", directory));
                return;
            }
            if (entry["duration"].get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
                status = absl::InvalidArgumentError(absl::StrCat("catalogue duration is too large: ", entry.dump()));
                return;
            }

            MediaDescription description {
                .id = *std::move(id),
                .title = entry["title"].get<std::string>(),
                .duration = entry["duration"].get<std::uint32_t>()
            };
            if (index_.contains(description.id)) {
                PLOG(plog::warning) << "[media] duplicate catalogue id " << description.id << ", keeping first";
                continue;
            }
            index_.emplace(description.id, catalogue_.size());
            catalogue_.push_back(std::move(description));
            directories_.push_back(std::move(directory));
        }

        PLOG(plog::info) << "[media] loaded " << catalogue_.size() << " media from " << settings_.rootDirectory.string();
        status = absl::OkStatus();
    });

    return status;
}

absl::StatusOr<std::vector<MediaEntry>> FilesystemMediaService::list(std::string_view query) {
    std::regex pattern;
    try {
        pattern = std::regex(query.begin(), query.end(), std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& error) {
        return absl::InvalidArgumentError(absl::StrFormat("bad title pattern %s: %s", query, error.what()));
    }

    std::vector<MediaEntry> found;
    for (const auto& description : catalogue_) {
        if (std::regex_search(description.title, pattern)) {
            found.push_back(MediaEntry{.id = description.id, .title = description.title});
        }
    }
    return found;
}

absl::StatusOr<MediaDescription> FilesystemMediaService::info(std::string_view id) {
    if (auto position = index_.find(id); position != index_.end()) {
        return catalogue_[position->second];
    }
    return absl::NotFoundError(absl::StrFormat("no media with id %s", id));
}

absl::StatusOr<MediaClips> FilesystemMediaService::fetch(std::string_view id, std::uint32_t offset, std::uint32_t amount) {
    auto position = index_.find(id);
    if (position == index_.end()) {
        return absl::NotFoundError(absl::StrFormat("no media with id %s", id));
    }
    const auto& description = catalogue_[position->second];
    const auto& directory = directories_[position->second];

    if (static_cast<std::uint64_t>(offset) + amount > description.duration) {
        return absl::OutOfRangeError(absl::StrFormat(
            "pieces [%d, %d) are outside of media %s with duration %d", 
            offset, static_cast<std::uint64_t>(offset) + amount, id, description.duration));
    }

    MediaClips clips;
    clips.video.reserve(amount);
    clips.audio.reserve(amount);
    for (std::uint32_t piece = offset; piece < offset + amount; ++piece) {
        auto video = readClip(directory, 'v', piece);
        if (!video.ok()) {
            return video.status();
        }
        auto audio = readClip(directory, 'a', piece);
        if (!audio.ok()) {
            return audio.status();
        }
        clips.video.push_back(*std::move(video));
        clips.audio.push_back(*std::move(audio));
    }
    return clips;
}

absl::StatusOr<std::string> FilesystemMediaService::readClip(const std::string& directory, char kind, std::uint32_t piece) const {
    auto path = settings_.rootDirectory / directory / absl::StrCat(std::string_view(&kind, 1), piece);
    auto clip = readFile(path);
    if (!clip.ok()) {
        // catalogue promised this piece
        PLOG(plog::error) << "[media] clip is unavailable: " << clip.status().message();
        return absl::InternalError(absl::StrCat("clip is unavailable: ", clip.status().message()));
    }
    return clip;
}
