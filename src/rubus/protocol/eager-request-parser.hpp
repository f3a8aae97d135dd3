#pragma once

// Abseil
#include <absl/container/flat_hash_map.h>

// standard
#include <string_view>
#include <optional>
#include <memory>
#include <string>

// local
#include "interfaces/i-request-parser.hpp"


namespace rubus {

    // Builds field map once on feed(), lookups are map queries.
    class EagerRequestParser : public IRequestParser {
    public:

        // IRequestParser implementation
        void feed(std::string_view raw) override;
        ERequestType type() const override;
        std::string value(std::string_view key) const override;
        bool has(std::string_view key) const override;
        void reset() override;
        std::unique_ptr<IRequestParser> clone() const override;

    private:
        std::optional<ERequestType> type_;
        absl::flat_hash_map<std::string, std::string> fields_;
    };

}
