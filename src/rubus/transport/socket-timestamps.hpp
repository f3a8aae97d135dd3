#pragma once

// standard
#include <optional>
#include <chrono>
#include <mutex>


namespace rubus {

    // Lifecycle timestamps shared by socket implementations.
    class SocketTimestamps {
    public:
        using clock = std::chrono::system_clock;

        SocketTimestamps();
        explicit SocketTimestamps(clock::time_point openTs);

        void markRead();
        void markWrite();
        // Returns false if close time was already recorded.
        bool markClosed();

        clock::time_point openTime() const;
        std::optional<clock::time_point> closeTime() const;
        std::optional<clock::time_point> lastReadTime() const;
        std::optional<clock::time_point> lastWriteTime() const;

    private:
        clock::time_point monotonicNow(const std::optional<clock::time_point>& previous) const;

    private:
        mutable std::mutex lock_;
        clock::time_point open_;
        std::optional<clock::time_point> close_;
        std::optional<clock::time_point> lastRead_;
        std::optional<clock::time_point> lastWrite_;
    };

}
