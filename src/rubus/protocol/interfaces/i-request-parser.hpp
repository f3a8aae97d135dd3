#pragma once

// standard
#include <string_view>
#include <memory>
#include <string>

// rubus
#include <rubus/protocol/request.hpp>


namespace rubus {

    // Decodes "key value" header lines of request. First line must be
    // request-type tag, every following line is a field. Different strategies
    // have identical observable behaviour.
    class IRequestParser {
    public:
        // Drops previous request and takes new one.
        virtual void feed(std::string_view raw) = 0;
        // Throws RubusMalformedRequest if type was not parsed.
        virtual ERequestType type() const = 0;
        // Throws RubusMissingField if field is absent.
        virtual std::string value(std::string_view key) const = 0;
        virtual bool has(std::string_view key) const = 0;
        virtual void reset() = 0;
        // Fresh parser of the same strategy, without fed state.
        virtual std::unique_ptr<IRequestParser> clone() const = 0;

        virtual ~IRequestParser() = default;
    };

}
