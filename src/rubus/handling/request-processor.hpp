#pragma once

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>

// standard
#include <string_view>
#include <memory>
#include <string>

// rubus
#include <rubus/protocol/request.hpp>
#include <rubus/protocol/interfaces/i-request-parser.hpp>
#include <rubus/media/interfaces/i-media-service.hpp>
#include <rubus/auth/interfaces/i-auth.hpp>

// proto
#include <protos/media/media.pb.h>


namespace rubus {

    // Authenticates connection, authorizes READ, validates parameters and
    // queries media service. Failures are reported with status codes:
    // InvalidArgument, NotFound, OutOfRange and PermissionDenied are client
    // faults, everything else is server fault.
    class RequestProcessor 
        : public std::enable_shared_from_this<RequestProcessor> {
    private: struct Private { };
    public:

        static std::shared_ptr<RequestProcessor> configure(
            std::shared_ptr<IMediaService> media,
            std::shared_ptr<IAuthenticator> authenticator,
            std::shared_ptr<IViewerAuthorizer> authorizer
        );
        RequestProcessor(
            std::shared_ptr<IMediaService> media,
            std::shared_ptr<IAuthenticator> authenticator,
            std::shared_ptr<IViewerAuthorizer> authorizer,
            Private access
        );

        // Complete OK response for parsed request. Parser exceptions
        // (RubusMalformedRequest, RubusMissingField) are propagated.
        absl::StatusOr<std::string> process(const IRequestParser& request, std::string_view identity);

        absl::StatusOr<NRubus::TMediaList> list(std::string_view pattern, std::string_view identity);
        absl::StatusOr<NRubus::TMediaInfo> info(std::string_view mediaId, std::string_view identity);
        absl::StatusOr<NRubus::TFetchedPieces> fetch(
            std::string_view mediaId, 
            std::string_view firstPiece, 
            std::string_view pieceCount, 
            std::string_view identity
        );

        static EResponseType classify(const absl::Status& status);

    private:
        absl::Status authorize(std::string_view identity);

    private:
        std::shared_ptr<IMediaService> media_;
        std::shared_ptr<IAuthenticator> authenticator_;
        std::shared_ptr<IViewerAuthorizer> authorizer_;
    };

}
