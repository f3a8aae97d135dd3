#pragma once

// Abseil
#include <absl/status/statusor.h>

// nlohmann_json
#include <nlohmann/json_fwd.hpp>

// standard
#include <filesystem>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <memory>
#include <string>

// rubus
#include <rubus/macros.hpp>
#include <rubus/protocol/interfaces/i-request-parser.hpp>


namespace rubus {

    enum class EParserStrategy {
        EAGER,
        LAZY
    };

    std::unique_ptr<IRequestParser> makeRequestParser(EParserStrategy strategy);

    // Section "server" of default config.
    struct ServerSettings {
        std::string protocol = "tcp";
        std::string bindAddress = "0.0.0.0";
        std::uint16_t listeningPort = DefaultPort;
        std::size_t openConnectionsLimit = 64;
        std::size_t availableThreadsLimit = 4;

        bool encryptionEnabled = false;
        bool secureConnectionRequired = false;
        std::optional<std::filesystem::path> certificateLocation;
        std::optional<std::filesystem::path> privateKeyLocation;

        std::chrono::milliseconds handshakeTimeout = DefaultHandshakeTimeout;
        std::chrono::milliseconds requestTimeout = DefaultRequestTimeout;
        std::chrono::milliseconds acceptTimeout = DefaultAcceptTimeout;
        EParserStrategy requestParser = EParserStrategy::EAGER;

        // Absent keys keep defaults, present ones are validated.
        static absl::StatusOr<ServerSettings> fromJson(const nlohmann::json& section);
    };

    // Section "media" of default config.
    struct MediaSettings {
        std::filesystem::path rootDirectory;

        static absl::StatusOr<MediaSettings> fromJson(const nlohmann::json& section);
    };

}
