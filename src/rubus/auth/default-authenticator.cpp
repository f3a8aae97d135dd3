// boost
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/random_generator.hpp>

// Abseil
#include <absl/status/statusor.h>

// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// standard
#include <string_view>
#include <string>
#include <mutex>

// local
#include "default-authenticator.hpp"

using namespace rubus;


absl::StatusOr<Viewer> DefaultAuthenticator::authenticate(std::string_view identity) {
    boost::uuids::uuid id;
    {
        std::unique_lock<std::mutex> locked (lock_);
        id = generator_();
    }

    std::string text = boost::uuids::to_string(id);
    PLOG(plog::debug) << "[auth] mapped " << identity << " to viewer " << text;
    return Viewer{.id = text, .name = text, .admin = false};
}

bool BasicViewerAuthorizer::authorize(const Viewer& viewer, EAction action) const {
    switch (action) {
        case EAction::READ:
            return true;
        case EAction::MODIFY:
            return viewer.admin;
    }
    return false;
}
