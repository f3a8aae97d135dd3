#pragma once

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>
#include <absl/container/flat_hash_map.h>

// protobuf
#include <google/protobuf/descriptor.h>

// standard
#include <string_view>
#include <optional>
#include <string>

// rubus
#include <rubus/protocol/request.hpp>


namespace rubus {

    // Server response split into header fields and body.
    class Response {
    public:

        // InvalidArgument if header is incomplete, response-type is unknown
        // or body is shorter than body-length.
        static absl::StatusOr<Response> parse(std::string_view raw);

        EResponseType type() const;
        std::optional<std::string> field(std::string_view key) const;
        const std::string& body() const;

        // Decodes OK body, checks serialized-object against message type.
        template<typename TMessage>
        absl::StatusOr<TMessage> decode() const {
            if (type_ != EResponseType::OK) {
                return absl::FailedPreconditionError(absl::StrFormat("server responded with %s", toString(type_)));
            }

            std::string expected (TMessage::descriptor()->full_name());
            if (auto object = field(SerializedObjectKey); object != expected) {
                return absl::InvalidArgumentError(absl::StrFormat(
                    "expected %s in response body, got %s", expected, object.value_or("nothing")));
            }

            TMessage message;
            if (!message.ParseFromString(body_)) {
                return absl::InvalidArgumentError(absl::StrFormat("could not decode %s", expected));
            }
            return message;
        }

    private:
        EResponseType type_;
        absl::flat_hash_map<std::string, std::string> fields_;
        std::string body_;
    };

}
