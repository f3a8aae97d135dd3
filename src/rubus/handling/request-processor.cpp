// boost
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/string_generator.hpp>

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>

// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// standard
#include <string_view>
#include <stdexcept>
#include <optional>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

// rubus
#include <common/macros.hpp>
#include <rubus/protocol/response.hpp>

// local
#include "request-processor.hpp"

using namespace rubus;

namespace {

    constexpr std::string_view AnyTitle = ".*";

    // Canonical lowercase form of uuid, nullopt if text is not uuid.
    std::optional<std::string> normalizeId(std::string_view text) {
        try {
            auto id = boost::uuids::string_generator()(text.begin(), text.end());
            return boost::uuids::to_string(id);
        } catch (const std::runtime_error&) {
            return std::nullopt;
        }
    }

}


std::shared_ptr<RequestProcessor> RequestProcessor::configure(
    std::shared_ptr<IMediaService> media,
    std::shared_ptr<IAuthenticator> authenticator,
    std::shared_ptr<IViewerAuthorizer> authorizer) 
{
    return std::make_shared<RequestProcessor>(std::move(media), std::move(authenticator), std::move(authorizer), Private());
}

RequestProcessor::RequestProcessor(
    std::shared_ptr<IMediaService> media,
    std::shared_ptr<IAuthenticator> authenticator,
    std::shared_ptr<IViewerAuthorizer> authorizer,
    Private access)
: media_(std::move(media))
, authenticator_(std::move(authenticator))
, authorizer_(std::move(authorizer))
{
    RUBUS_ENSURE_NOT_NULL(media_);
    RUBUS_ENSURE_NOT_NULL(authenticator_);
    RUBUS_ENSURE_NOT_NULL(authorizer_);
}

absl::StatusOr<std::string> RequestProcessor::process(const IRequestParser& request, std::string_view identity) {
    switch (request.type()) {
        case ERequestType::LIST: {
            std::string pattern = (request.has(TitleContainsKey)) ? request.value(TitleContainsKey) : std::string(AnyTitle);
            auto result = list(pattern, identity);
            if (!result.ok()) {
                return result.status();
            }
            return makeResponse(*result);
        }
        case ERequestType::INFO: {
            auto result = info(request.value(MediaIdKey), identity);
            if (!result.ok()) {
                return result.status();
            }
            return makeResponse(*result);
        }
        case ERequestType::FETCH: {
            auto result = fetch(
                request.value(MediaIdKey), 
                request.value(FirstPieceKey), 
                request.value(PieceCountKey), 
                identity);
            if (!result.ok()) {
                return result.status();
            }
            return makeResponse(*result);
        }
    }
    return absl::InternalError("unhandled request type");
}

absl::StatusOr<NRubus::TMediaList> RequestProcessor::list(std::string_view pattern, std::string_view identity) {
    if (auto status = authorize(identity); !status.ok()) {
        return status;
    }

    auto entries = media_->list(pattern);
    if (!entries.ok()) {
        return entries.status();
    }

    NRubus::TMediaList result;
    for (auto& entry : *entries) {
        auto* added = result.add_entries();
        added->set_id(std::move(entry.id));
        added->set_title(std::move(entry.title));
    }
    return result;
}

absl::StatusOr<NRubus::TMediaInfo> RequestProcessor::info(std::string_view mediaId, std::string_view identity) {
    auto id = normalizeId(mediaId);
    if (!id) {
        return absl::InvalidArgumentError(absl::StrFormat("media id %s is not uuid", mediaId));
    }
    if (auto status = authorize(identity); !status.ok()) {
        return status;
    }

    auto description = media_->info(*id);
    if (!description.ok()) {
        return description.status();
    }

    NRubus::TMediaInfo result;
    result.set_id(description->id);
    result.set_title(description->title);
    result.set_duration(description->duration);
    return result;
}

absl::StatusOr<NRubus::TFetchedPieces> RequestProcessor::fetch(
    std::string_view mediaId, 
    std::string_view firstPiece, 
    std::string_view pieceCount, 
    std::string_view identity) 
{
    auto id = normalizeId(mediaId);
    if (!id) {
        return absl::InvalidArgumentError(absl::StrFormat("media id %s is not uuid", mediaId));
    }

    std::int32_t first = 0;
    std::int32_t count = 0;
    if (!absl::SimpleAtoi(firstPiece, &first) || first < 0) {
        return absl::InvalidArgumentError(absl::StrFormat("first piece %s is not non-negative integer", firstPiece));
    }
    if (!absl::SimpleAtoi(pieceCount, &count) || count <= 0) {
        return absl::InvalidArgumentError(absl::StrFormat("piece count %s is not positive integer", pieceCount));
    }
    if (static_cast<std::int64_t>(first) + count > std::numeric_limits<std::int32_t>::max()) {
        return absl::InvalidArgumentError("requested range overflows");
    }

    if (auto status = authorize(identity); !status.ok()) {
        return status;
    }

    auto clips = media_->fetch(*id, static_cast<std::uint32_t>(first), static_cast<std::uint32_t>(count));
    if (!clips.ok()) {
        return clips.status();
    }

    NRubus::TFetchedPieces result;
    result.set_id(*id);
    result.set_starting_piece_index(static_cast<std::uint32_t>(first));
    for (auto& clip : clips->video) {
        result.add_video(std::move(clip));
    }
    for (auto& clip : clips->audio) {
        result.add_audio(std::move(clip));
    }
    return result;
}

absl::Status RequestProcessor::authorize(std::string_view identity) {
    auto viewer = authenticator_->authenticate(identity);
    if (!viewer.ok()) {
        return viewer.status();
    }
    if (!authorizer_->authorize(*viewer, EAction::READ)) {
        PLOG(plog::warning) << "[processor] viewer " << viewer->id << " of " << identity << " may not read media";
        return absl::PermissionDeniedError(absl::StrFormat("viewer %s may not read media", viewer->id));
    }
    return absl::OkStatus();
}

EResponseType RequestProcessor::classify(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kOk:
            return EResponseType::OK;
        case absl::StatusCode::kInvalidArgument:
        case absl::StatusCode::kNotFound:
        case absl::StatusCode::kOutOfRange:
        case absl::StatusCode::kPermissionDenied:
            return EResponseType::BAD_REQUEST;
        default:
            return EResponseType::SERVER_ERROR;
    }
}
