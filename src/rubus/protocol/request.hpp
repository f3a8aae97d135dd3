#pragma once

// standard
#include <string_view>
#include <optional>


namespace rubus {

    enum class ERequestType {
        LIST,
        INFO,
        FETCH
    };

    enum class EResponseType {
        OK,
        BAD_REQUEST,
        SERVER_ERROR
    };

    // header keys
    inline constexpr std::string_view RequestTypeKey = "request-type";
    inline constexpr std::string_view ResponseTypeKey = "response-type";
    inline constexpr std::string_view SerializedObjectKey = "serialized-object";
    inline constexpr std::string_view BodyLengthKey = "body-length";
    inline constexpr std::string_view TitleContainsKey = "title-contains";
    inline constexpr std::string_view MediaIdKey = "media-id";
    inline constexpr std::string_view FirstPieceKey = "first-playback-piece";
    inline constexpr std::string_view PieceCountKey = "number-playback-pieces";

    inline constexpr std::string_view HeaderTerminator = "\n\n";

    std::string_view toString(ERequestType type);
    std::string_view toString(EResponseType type);
    std::optional<ERequestType> parseRequestType(std::string_view tag);
    std::optional<EResponseType> parseResponseType(std::string_view tag);

    // Size of complete message (header, terminator and body-length bytes of body)
    // at the start of raw, nullopt while more bytes are needed.
    std::optional<std::size_t> completeMessageSize(std::string_view raw);

}
