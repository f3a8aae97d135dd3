#pragma once

// boost
#include <boost/uuid/random_generator.hpp>

// Abseil
#include <absl/status/statusor.h>

// standard
#include <string_view>
#include <mutex>

// local
#include "interfaces/i-auth.hpp"


namespace rubus {

    // Every call produces new viewer with random uuid and no admin rights,
    // even for the same identity.
    class DefaultAuthenticator : public IAuthenticator {
    public:

        // IAuthenticator implementation
        absl::StatusOr<Viewer> authenticate(std::string_view identity) override;

    private:
        std::mutex lock_;
        boost::uuids::random_generator generator_;
    };

    // READ is allowed to anyone, MODIFY to admins only.
    class BasicViewerAuthorizer : public IViewerAuthorizer {
    public:

        // IViewerAuthorizer implementation
        bool authorize(const Viewer& viewer, EAction action) const override;
    };

}
