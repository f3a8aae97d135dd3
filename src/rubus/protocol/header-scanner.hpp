#pragma once

// standard
#include <string_view>
#include <optional>


namespace rubus {

    struct HeaderLine {
        std::string_view key;
        std::string_view value;
        // line had "key value" shape
        bool wellFormed;
    };

    // Walks newline terminated lines of message header, stops on blank line
    // or on trailing bytes without newline. Key and value are split on first space.
    class HeaderScanner {
    public:
        explicit HeaderScanner(std::string_view raw);

        std::optional<HeaderLine> next();

    private:
        std::string_view rest_;
    };

}
