#pragma once

// nlohmann_json
#include <nlohmann/json.hpp>

// Abseil
#include <absl/strings/str_cat.h>

// standard
#include <filesystem>
#include <fstream>
#include <cstdint>
#include <string>
#include <vector>


namespace rubus {

    struct StoredMedia {
        std::string id;
        std::string title;
        std::uint32_t duration;
    };

    inline std::string videoClip(const std::string& id, std::uint32_t piece) {
        return absl::StrCat("video:", id, ":", piece);
    }

    inline std::string audioClip(const std::string& id, std::uint32_t piece) {
        return absl::StrCat("audio:", id, ":", piece);
    }

    // Writes catalogue.json and one clip pair per piece into fresh directory.
    inline std::filesystem::path writeMediaDirectory(const std::string& name, const std::vector<StoredMedia>& media) {
        auto root = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);

        nlohmann::json catalogue = nlohmann::json::array();
        for (const auto& medium : media) {
            catalogue.push_back({{"id", medium.id}, {"title", medium.title}, {"duration", medium.duration}});

            std::filesystem::create_directories(root / medium.id);
            for (std::uint32_t piece = 0; piece < medium.duration; ++piece) {
                std::ofstream video {root / medium.id / absl::StrCat("v", piece), std::ios::out | std::ios::binary};
                video << videoClip(medium.id, piece);
                std::ofstream audio {root / medium.id / absl::StrCat("a", piece), std::ios::out | std::ios::binary};
                audio << audioClip(medium.id, piece);
            }
        }

        std::ofstream ofs {root / "catalogue.json", std::ios::out | std::ios::binary};
        ofs << catalogue.dump(4);
        return root;
    }

}
