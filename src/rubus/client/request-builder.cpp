// Abseil
#include <absl/strings/str_cat.h>

// standard
#include <string_view>
#include <cstdint>
#include <string>

// rubus
#include <rubus/protocol/request.hpp>

// local
#include "request-builder.hpp"

using namespace rubus;

namespace {

    std::string line(std::string_view key, std::string_view value) {
        return absl::StrCat(key, " ", value, "\n");
    }

    std::string terminate() {
        return absl::StrCat(BodyLengthKey, " 0", HeaderTerminator);
    }

}


std::string RequestBuilder::list(std::string_view titleContains) {
    return absl::StrCat(
        line(RequestTypeKey, toString(ERequestType::LIST)),
        line(TitleContainsKey, titleContains),
        terminate());
}

std::string RequestBuilder::info(std::string_view mediaId) {
    return absl::StrCat(
        line(RequestTypeKey, toString(ERequestType::INFO)),
        line(MediaIdKey, mediaId),
        terminate());
}

std::string RequestBuilder::fetch(std::string_view mediaId, std::uint32_t firstPiece, std::uint32_t pieceCount) {
    return absl::StrCat(
        line(RequestTypeKey, toString(ERequestType::FETCH)),
        line(MediaIdKey, mediaId),
        line(FirstPieceKey, absl::StrCat(firstPiece)),
        line(PieceCountKey, absl::StrCat(pieceCount)),
        terminate());
}
