// Abseil
#include <absl/strings/numbers.h>

// standard
#include <string_view>
#include <optional>

// local
#include "request.hpp"
#include "header-scanner.hpp"

using namespace rubus;


std::string_view rubus::toString(ERequestType type) {
    switch (type) {
        case ERequestType::LIST: return "LIST";
        case ERequestType::INFO: return "INFO";
        case ERequestType::FETCH: return "FETCH";
    }
    return "UNKNOWN";
}

std::string_view rubus::toString(EResponseType type) {
    switch (type) {
        case EResponseType::OK: return "OK";
        case EResponseType::BAD_REQUEST: return "BAD_REQUEST";
        case EResponseType::SERVER_ERROR: return "SERVER_ERROR";
    }
    return "UNKNOWN";
}

std::optional<ERequestType> rubus::parseRequestType(std::string_view tag) {
    for (auto type : {ERequestType::LIST, ERequestType::INFO, ERequestType::FETCH}) {
        if (toString(type) == tag) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<EResponseType> rubus::parseResponseType(std::string_view tag) {
    for (auto type : {EResponseType::OK, EResponseType::BAD_REQUEST, EResponseType::SERVER_ERROR}) {
        if (toString(type) == tag) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> rubus::completeMessageSize(std::string_view raw) {
    std::size_t terminator = raw.find(HeaderTerminator);
    if (terminator == std::string_view::npos) {
        return std::nullopt;
    }

    std::size_t headerSize = terminator + HeaderTerminator.size();
    std::size_t bodySize = 0;

    HeaderScanner scanner (raw.substr(0, headerSize));
    while (auto line = scanner.next()) {
        if (line->wellFormed && line->key == BodyLengthKey) {
            // unreadable length is left for parser to reject
            if (!absl::SimpleAtoi(line->value, &bodySize)) {
                bodySize = 0;
            }
            break;
        }
    }

    if (raw.size() - headerSize < bodySize) {
        return std::nullopt;
    }
    return headerSize + bodySize;
}
