// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>

// nlohmann_json
#include <nlohmann/json.hpp>

// standard
#include <string_view>
#include <optional>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

// rubus
#include <rubus/protocol/eager-request-parser.hpp>
#include <rubus/protocol/lazy-request-parser.hpp>

// local
#include "settings.hpp"

using namespace rubus;

namespace {

    absl::Status readUnsigned(const nlohmann::json& section, const char* key, std::uint64_t min, std::uint64_t max, std::uint64_t& target) {
        if (!section.contains(key)) {
            return absl::OkStatus();
        }
        const auto& value = section[key];
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() < min || value.get<std::uint64_t>() > max) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "%s must be integer in [%d, %d], got %s", key, min, max, value.dump()));
        }
        target = value.get<std::uint64_t>();
        return absl::OkStatus();
    }

    absl::Status readBool(const nlohmann::json& section, const char* key, bool& target) {
        if (!section.contains(key)) {
            return absl::OkStatus();
        }
        if (!section[key].is_boolean()) {
            return absl::InvalidArgumentError(absl::StrFormat("%s must be boolean, got %s", key, section[key].dump()));
        }
        target = section[key].get<bool>();
        return absl::OkStatus();
    }

    absl::Status readString(const nlohmann::json& section, const char* key, std::optional<std::string>& target) {
        if (!section.contains(key)) {
            return absl::OkStatus();
        }
        if (!section[key].is_string()) {
            return absl::InvalidArgumentError(absl::StrFormat("%s must be string, got %s", key, section[key].dump()));
        }
        target = section[key].get<std::string>();
        return absl::OkStatus();
    }

}


std::unique_ptr<IRequestParser> rubus::makeRequestParser(EParserStrategy strategy) {
    switch (strategy) {
        case EParserStrategy::EAGER:
            return std::make_unique<EagerRequestParser>();
        case EParserStrategy::LAZY:
            return std::make_unique<LazyRequestParser>();
    }
    return std::make_unique<EagerRequestParser>();
}

absl::StatusOr<ServerSettings> ServerSettings::fromJson(const nlohmann::json& section) {
    if (!section.is_object()) {
        return absl::InvalidArgumentError("server section must be object");
    }

    ServerSettings settings;
    absl::Status status;

    std::optional<std::string> protocol, address, certificate, key, parser;
    status.Update(readString(section, "protocol", protocol));
    status.Update(readString(section, "bind-address", address));
    status.Update(readString(section, "certificate-location", certificate));
    status.Update(readString(section, "private-key-location", key));
    status.Update(readString(section, "request-parser", parser));

    std::uint64_t port = settings.listeningPort;
    std::uint64_t connections = settings.openConnectionsLimit;
    std::uint64_t threads = settings.availableThreadsLimit;
    std::uint64_t handshake = settings.handshakeTimeout.count();
    std::uint64_t request = settings.requestTimeout.count();
    std::uint64_t accept = settings.acceptTimeout.count();
    // timeouts are bounded by a day
    constexpr std::uint64_t maxTimeout = 24 * 60 * 60 * 1000;

    status.Update(readUnsigned(section, "listening-port", 0, std::numeric_limits<std::uint16_t>::max(), port));
    status.Update(readUnsigned(section, "open-connections-limit", 1, 1 << 20, connections));
    status.Update(readUnsigned(section, "available-threads-limit", 1, 1024, threads));
    status.Update(readUnsigned(section, "handshake-timeout", 1, maxTimeout, handshake));
    status.Update(readUnsigned(section, "request-timeout", 1, maxTimeout, request));
    status.Update(readUnsigned(section, "accept-timeout", 1, maxTimeout, accept));

    status.Update(readBool(section, "encryption-enabled", settings.encryptionEnabled));
    status.Update(readBool(section, "secure-connection-required", settings.secureConnectionRequired));

    if (!status.ok()) {
        return status;
    }

    if (protocol) {
        if (*protocol != "tcp") {
            return absl::InvalidArgumentError(absl::StrFormat("unsupported transport protocol %s", *protocol));
        }
        settings.protocol = *protocol;
    }
    if (address) {
        settings.bindAddress = *address;
    }
    if (parser) {
        if (*parser == "eager") {
            settings.requestParser = EParserStrategy::EAGER;
        } else if (*parser == "lazy") {
            settings.requestParser = EParserStrategy::LAZY;
        } else {
            return absl::InvalidArgumentError(absl::StrFormat("unknown request parser %s, expected eager or lazy", *parser));
        }
    }
    if (certificate) {
        settings.certificateLocation = *certificate;
    }
    if (key) {
        settings.privateKeyLocation = *key;
    }

    settings.listeningPort = static_cast<std::uint16_t>(port);
    settings.openConnectionsLimit = connections;
    settings.availableThreadsLimit = threads;
    settings.handshakeTimeout = std::chrono::milliseconds(handshake);
    settings.requestTimeout = std::chrono::milliseconds(request);
    settings.acceptTimeout = std::chrono::milliseconds(accept);

    if (settings.secureConnectionRequired && !settings.encryptionEnabled) {
        return absl::InvalidArgumentError("secure-connection-required needs encryption-enabled");
    }
    if (settings.encryptionEnabled && (!settings.certificateLocation || !settings.privateKeyLocation)) {
        return absl::InvalidArgumentError("encryption needs certificate-location and private-key-location");
    }

    return settings;
}

absl::StatusOr<MediaSettings> MediaSettings::fromJson(const nlohmann::json& section) {
    if (!section.is_object()) {
        return absl::InvalidArgumentError("media section must be object");
    }

    std::optional<std::string> root;
    if (auto status = readString(section, "root-directory", root); !status.ok()) {
        return status;
    }
    if (!root) {
        return absl::InvalidArgumentError("media root-directory is required");
    }
    return MediaSettings{.rootDirectory = *root};
}
