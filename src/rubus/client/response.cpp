// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>

// standard
#include <string_view>
#include <optional>
#include <string>

// rubus
#include <rubus/protocol/header-scanner.hpp>

// local
#include "response.hpp"

using namespace rubus;


absl::StatusOr<Response> Response::parse(std::string_view raw) {
    std::size_t terminator = raw.find(HeaderTerminator);
    if (terminator == std::string_view::npos) {
        return absl::InvalidArgumentError("response header is not terminated");
    }

    Response response;
    std::optional<EResponseType> type;

    HeaderScanner scanner (raw.substr(0, terminator + HeaderTerminator.size()));
    if (auto first = scanner.next(); first && first->wellFormed && first->key == ResponseTypeKey) {
        type = parseResponseType(first->value);
    }
    if (!type) {
        return absl::InvalidArgumentError("response does not start with known response-type");
    }
    response.type_ = *type;

    while (auto line = scanner.next()) {
        if (line->wellFormed) {
            response.fields_.try_emplace(std::string(line->key), std::string(line->value));
        }
    }

    std::size_t bodyLength = 0;
    if (auto length = response.field(BodyLengthKey)) {
        if (!absl::SimpleAtoi(*length, &bodyLength)) {
            return absl::InvalidArgumentError(absl::StrFormat("bad body-length %s", *length));
        }
    }

    std::string_view body = raw.substr(terminator + HeaderTerminator.size());
    if (body.size() < bodyLength) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "body is %d bytes, %d expected", body.size(), bodyLength));
    }
    response.body_.assign(body.substr(0, bodyLength));
    return response;
}

EResponseType Response::type() const {
    return type_;
}

std::optional<std::string> Response::field(std::string_view key) const {
    if (auto found = fields_.find(key); found != fields_.end()) {
        return found->second;
    }
    return std::nullopt;
}

const std::string& Response::body() const {
    return body_;
}
