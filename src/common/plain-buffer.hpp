#pragma once

// standard
#include <string_view>
#include <cstddef>
#include <memory>
#include <vector>
#include <mutex>

// rubus
#include <common/exceptions.hpp>


namespace rubus {

    class IBuffer {
    public:
        virtual std::size_t writableSize() = 0;
        virtual std::size_t readableSize() = 0;

        virtual std::size_t write(const char* src, std::size_t size) = 0;
        virtual std::size_t read(char* dest, std::size_t size) = 0;

        virtual std::size_t peek(char* dest, std::size_t size) = 0;
        virtual std::size_t drop(std::size_t size) = 0;

        virtual ~IBuffer() = default;
    };

    // Contiguous byte buffer. Growable buffer doubles its storage when write
    // does not fit, fixed one truncates writes to writableSize().
    class PlainBuffer : public IBuffer {
    public:

        enum class EPosition {
            WPOS,
            RPOS
        };

        PlainBuffer(std::size_t size, bool growable = false);

        // IBuffer implementation
        virtual std::size_t writableSize() override;
        virtual std::size_t readableSize() override;
        virtual std::size_t write(const char* src, std::size_t size) override;
        virtual std::size_t read(char* dest, std::size_t size) override;
        virtual std::size_t peek(char* dest, std::size_t size) override;
        virtual std::size_t drop(std::size_t size) override;

        char* rPosition();
        char* wPosition();
        // Readable bytes, valid until next modification.
        std::string_view view();

        // Makes at least size bytes writable, moving readable bytes to front
        // and growing storage if allowed. Throws RubusOverrun otherwise.
        void reserve(std::size_t size);
        std::size_t advance(EPosition position, std::size_t size);
        void reset();
        // Releases storage above size bytes, readable bytes are kept.
        void shrink(std::size_t size);
        std::size_t capacity();

    private:
        void compact();

    private:
        std::unique_ptr<std::vector<char>> buffer_;
        std::recursive_mutex lock_;
        std::size_t wPos_;
        std::size_t rPos_;
        bool growable_;

    };

}
