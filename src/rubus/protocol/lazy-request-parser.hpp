#pragma once

// standard
#include <string_view>
#include <optional>
#include <memory>
#include <string>

// local
#include "interfaces/i-request-parser.hpp"


namespace rubus {

    // Keeps raw request only, every lookup scans it again.
    class LazyRequestParser : public IRequestParser {
    public:

        // IRequestParser implementation
        void feed(std::string_view raw) override;
        ERequestType type() const override;
        std::string value(std::string_view key) const override;
        bool has(std::string_view key) const override;
        void reset() override;
        std::unique_ptr<IRequestParser> clone() const override;

    private:
        std::optional<std::string_view> find(std::string_view key) const;

    private:
        std::string raw_;
    };

}
