// protobuf
#include <google/protobuf/message.h>
#include <google/protobuf/descriptor.h>

// Abseil
#include <absl/strings/str_cat.h>

// standard
#include <string>

// rubus
#include <common/exceptions.hpp>

// local
#include "response.hpp"

using namespace rubus;


std::string rubus::makeResponse(const google::protobuf::Message& body) {
    std::string serialized;
    if (!body.SerializeToString(&serialized)) {
        throw RubusOverrun(absl::StrCat("could not serialize ", body.GetTypeName()));
    }

    return absl::StrCat(
        ResponseTypeKey, " ", toString(EResponseType::OK), "\n",
        SerializedObjectKey, " ", body.GetDescriptor()->full_name(), "\n",
        BodyLengthKey, " ", serialized.size(), HeaderTerminator,
        serialized
    );
}

std::string rubus::makeErrorResponse(EResponseType type) {
    return absl::StrCat(
        ResponseTypeKey, " ", toString(type), "\n",
        BodyLengthKey, " 0", HeaderTerminator
    );
}
