// Abseil
#include <absl/strings/str_format.h>

// standard
#include <string_view>
#include <optional>
#include <memory>
#include <string>

// rubus
#include <common/exceptions.hpp>

// local
#include "lazy-request-parser.hpp"
#include "header-scanner.hpp"

using namespace rubus;


void LazyRequestParser::feed(std::string_view raw) {
    raw_.assign(raw);
}

ERequestType LazyRequestParser::type() const {
    HeaderScanner scanner (raw_);
    if (auto first = scanner.next(); first && first->wellFormed && first->key == RequestTypeKey) {
        if (auto type = parseRequestType(first->value)) {
            return *type;
        }
    }
    throw RubusMalformedRequest();
}

std::optional<std::string_view> LazyRequestParser::find(std::string_view key) const {
    HeaderScanner scanner (raw_);
    // type line is never a field
    if (!scanner.next()) {
        return std::nullopt;
    }

    while (auto line = scanner.next()) {
        if (line->wellFormed && line->key == key) {
            return line->value;
        }
    }
    return std::nullopt;
}

std::string LazyRequestParser::value(std::string_view key) const {
    if (auto found = find(key)) {
        return std::string(*found);
    }
    throw RubusMissingField(absl::StrFormat("field %s is absent", key));
}

bool LazyRequestParser::has(std::string_view key) const {
    return find(key).has_value();
}

void LazyRequestParser::reset() {
    raw_.clear();
}

std::unique_ptr<IRequestParser> LazyRequestParser::clone() const {
    return std::make_unique<LazyRequestParser>();
}
