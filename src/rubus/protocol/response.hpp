#pragma once

// protobuf
#include <google/protobuf/message.h>

// standard
#include <string>

// local
#include "request.hpp"


namespace rubus {

    // "response-type OK", "serialized-object <name>", "body-length <n>", blank line, body.
    std::string makeResponse(const google::protobuf::Message& body);
    // Header only response with zero body length.
    std::string makeErrorResponse(EResponseType type);

}
