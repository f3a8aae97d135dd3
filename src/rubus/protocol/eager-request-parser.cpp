// Abseil
#include <absl/strings/str_format.h>

// standard
#include <string_view>
#include <memory>
#include <string>

// rubus
#include <common/exceptions.hpp>

// local
#include "eager-request-parser.hpp"
#include "header-scanner.hpp"

using namespace rubus;


void EagerRequestParser::feed(std::string_view raw) {
    reset();

    HeaderScanner scanner (raw);
    auto first = scanner.next();
    if (!first) {
        return;
    }
    if (first->wellFormed && first->key == RequestTypeKey) {
        type_ = parseRequestType(first->value);
    }

    while (auto line = scanner.next()) {
        if (line->wellFormed) {
            // first occurrence wins
            fields_.try_emplace(std::string(line->key), std::string(line->value));
        }
    }
}

ERequestType EagerRequestParser::type() const {
    if (!type_.has_value()) {
        throw RubusMalformedRequest();
    }
    return *type_;
}

std::string EagerRequestParser::value(std::string_view key) const {
    if (auto field = fields_.find(key); field != fields_.end()) {
        return field->second;
    }
    throw RubusMissingField(absl::StrFormat("field %s is absent", key));
}

bool EagerRequestParser::has(std::string_view key) const {
    return fields_.contains(key);
}

void EagerRequestParser::reset() {
    type_.reset();
    fields_.clear();
}

std::unique_ptr<IRequestParser> EagerRequestParser::clone() const {
    return std::make_unique<EagerRequestParser>();
}
