#pragma once

// Abseil
#include <absl/status/statusor.h>

// standard
#include <string_view>
#include <string>


namespace rubus {

    struct Viewer {
        std::string id;
        std::string name;
        bool admin;
    };

    enum class EAction {
        READ,
        MODIFY
    };

    // Maps connection identity (peer of socket) to viewer.
    class IAuthenticator {
    public:
        virtual absl::StatusOr<Viewer> authenticate(std::string_view identity) = 0;
        virtual ~IAuthenticator() = default;
    };

    class IViewerAuthorizer {
    public:
        virtual bool authorize(const Viewer& viewer, EAction action) const = 0;
        virtual ~IViewerAuthorizer() = default;
    };

}
