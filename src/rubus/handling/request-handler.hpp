#pragma once

// standard
#include <cstddef>
#include <chrono>
#include <memory>
#include <string>

// rubus
#include <common/plain-buffer.hpp>
#include <rubus/macros.hpp>
#include <rubus/transport/interfaces/i-socket.hpp>
#include <rubus/protocol/interfaces/i-request-parser.hpp>

// local
#include "interfaces/i-handler-master.hpp"
#include "request-processor.hpp"


namespace rubus {

    // Serves one request of assigned connection per run() and reports
    // outcome to master. Bytes received after complete request are kept
    // for next run, as well as incomplete request on timeout.
    class RequestHandler 
        : public std::enable_shared_from_this<RequestHandler> {
    private: struct Private { };
    public:

        enum class EOutcome {
            // response was written
            SUCCESS,
            // nothing complete arrived before deadline
            TIMED_OUT,
            // transport failure or unrecoverable stream
            EXCEPTION,
            // peer has closed the stream
            CLOSED
        };

        struct Settings {
            std::chrono::milliseconds requestTimeout = DefaultRequestTimeout;
            std::size_t maxRequestSize = MaxRequestSize;
            // larger responses are replaced by BAD_REQUEST
            std::size_t maxResponseSize = MaxResponseSize;
        };

        static std::shared_ptr<RequestHandler> configure(
            std::shared_ptr<RequestProcessor> processor,
            std::unique_ptr<IRequestParser> parser,
            std::weak_ptr<IHandlerMaster> master,
            Settings settings
        );
        RequestHandler(
            std::shared_ptr<RequestProcessor> processor,
            std::unique_ptr<IRequestParser> parser,
            std::weak_ptr<IHandlerMaster> master,
            Settings settings,
            Private access
        );

        // Throws RubusBadInit if other socket is assigned.
        void assign(std::shared_ptr<ISocket> socket);
        // Drops all per connection state, returns previously assigned socket.
        std::shared_ptr<ISocket> detach();
        std::shared_ptr<ISocket> socket() const;

        void run();
        EOutcome outcome() const;
        std::size_t served() const;
        std::size_t bufferCapacity();

    private:
        EOutcome serve();
        std::string respond(std::string_view request);

    private:
        const Settings settings_;
        std::shared_ptr<RequestProcessor> processor_;
        std::unique_ptr<IRequestParser> parser_;
        std::weak_ptr<IHandlerMaster> master_;

        std::shared_ptr<ISocket> socket_;
        PlainBuffer buffer_;
        EOutcome outcome_;
        std::size_t served_;
    };

    std::string_view toString(RequestHandler::EOutcome outcome);

}
