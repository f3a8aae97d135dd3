// Abseil
#include <absl/status/status.h>
#include <absl/strings/str_format.h>

// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// standard
#include <string_view>
#include <algorithm>
#include <exception>
#include <optional>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

// rubus
#include <common/macros.hpp>
#include <common/exceptions.hpp>
#include <rubus/protocol/request.hpp>
#include <rubus/protocol/response.hpp>

// local
#include "request-handler.hpp"

using namespace rubus;
using namespace std::chrono;


std::shared_ptr<RequestHandler> RequestHandler::configure(
    std::shared_ptr<RequestProcessor> processor,
    std::unique_ptr<IRequestParser> parser,
    std::weak_ptr<IHandlerMaster> master,
    Settings settings) 
{
    return std::make_shared<RequestHandler>(
        std::move(processor), std::move(parser), std::move(master), std::move(settings), Private());
}

RequestHandler::RequestHandler(
    std::shared_ptr<RequestProcessor> processor,
    std::unique_ptr<IRequestParser> parser,
    std::weak_ptr<IHandlerMaster> master,
    Settings settings,
    Private access)
: settings_(std::move(settings))
, processor_(std::move(processor))
, parser_(std::move(parser))
, master_(std::move(master))
, buffer_(NetworkBufferSize, true)
, outcome_(EOutcome::SUCCESS)
, served_(0)
{
    RUBUS_ENSURE_NOT_NULL(processor_);
    RUBUS_ENSURE_NOT_NULL(parser_);
}

void RequestHandler::assign(std::shared_ptr<ISocket> socket) {
    RUBUS_ENSURE_NOT_NULL(socket);
    RUBUS_THROW_UNLESS(RubusBadInit, "handler already serves connection", !socket_);
    socket_ = std::move(socket);
}

std::shared_ptr<ISocket> RequestHandler::detach() {
    buffer_.reset();
    // pooled handler gives back storage grown by large requests
    buffer_.shrink(NetworkBufferSize);
    parser_->reset();
    outcome_ = EOutcome::SUCCESS;
    served_ = 0;
    return std::exchange(socket_, nullptr);
}

std::shared_ptr<ISocket> RequestHandler::socket() const {
    return socket_;
}

RequestHandler::EOutcome RequestHandler::outcome() const {
    return outcome_;
}

std::size_t RequestHandler::served() const {
    return served_;
}

std::size_t RequestHandler::bufferCapacity() {
    return buffer_.capacity();
}

void RequestHandler::run() {
    if (!socket_) {
        PLOG(plog::error) << "[handler] run() called without assigned socket";
        outcome_ = EOutcome::EXCEPTION;
    } else {
        try {
            outcome_ = serve();
        } catch (const RubusException& error) {
            PLOG(plog::warning) << "[handler] connection " << socket_->peer() << " failed: " << error.what();
            outcome_ = EOutcome::EXCEPTION;
        } catch (const std::exception& error) {
            PLOG(plog::error) << "[handler] unexpected failure on " << socket_->peer() << ": " << error.what();
            outcome_ = EOutcome::EXCEPTION;
        }
    }

    if (auto master = master_.lock()) {
        master->onHandlerDone(shared_from_this());
    }
}

RequestHandler::EOutcome RequestHandler::serve() {
    bool bounded = settings_.requestTimeout.count() > 0;
    auto deadline = steady_clock::now() + settings_.requestTimeout;

    bool closed = false;
    bool timedOut = false;
    std::optional<std::size_t> complete;

    while (!(complete = completeMessageSize(buffer_.view()))) {
        if (buffer_.readableSize() > settings_.maxRequestSize) {
            PLOG(plog::warning) 
                << "[handler] request of " << socket_->peer() << " exceeds " 
                << settings_.maxRequestSize << " bytes, dropping connection";
            std::string response = makeErrorResponse(EResponseType::BAD_REQUEST);
            socket_->write(response.data(), response.size());
            return EOutcome::EXCEPTION;
        }

        milliseconds timeout {0};
        if (bounded) {
            timeout = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (timeout.count() <= 0) {
                timedOut = true;
                break;
            }
        }

        buffer_.reserve(NetworkBufferSize);
        try {
            std::size_t received = socket_->read(buffer_.wPosition(), buffer_.writableSize(), timeout);
            buffer_.advance(PlainBuffer::EPosition::WPOS, received);
        } catch (const RubusTimeout&) {
            timedOut = true;
            break;
        } catch (const RubusEndOfStream&) {
            closed = true;
            break;
        }
    }

    if (!complete) {
        if (buffer_.readableSize() == 0) {
            return (closed) ? EOutcome::CLOSED : EOutcome::TIMED_OUT;
        }
        if (timedOut) {
            // incomplete request stays buffered until next run
            return EOutcome::TIMED_OUT;
        }
        // peer is gone, answer what has arrived
        complete = buffer_.readableSize();
    }

    std::string request (buffer_.view().substr(0, *complete));
    buffer_.drop(*complete);

    std::string response = respond(request);
    socket_->write(response.data(), response.size());
    ++served_;

    return (closed) ? EOutcome::CLOSED : EOutcome::SUCCESS;
}

std::string RequestHandler::respond(std::string_view request) {
    try {
        parser_->feed(request);
        PLOG(plog::debug) 
            << "[handler] " << toString(parser_->type()) << " request from " << socket_->peer();

        auto response = processor_->process(*parser_, socket_->peer());
        if (response.ok() && response->size() > settings_.maxResponseSize) {
            PLOG(plog::info) 
                << "[handler] response to " << socket_->peer() << " of " << response->size() 
                << " bytes exceeds " << settings_.maxResponseSize << " bytes";
            return makeErrorResponse(EResponseType::BAD_REQUEST);
        }
        if (response.ok()) {
            return *std::move(response);
        }

        EResponseType type = RequestProcessor::classify(response.status());
        PLOG((type == EResponseType::BAD_REQUEST) ? plog::info : plog::error) 
            << "[handler] request of " << socket_->peer() << " failed: " << response.status().ToString();
        return makeErrorResponse(type);
    } catch (const RubusMalformedRequest& error) {
        PLOG(plog::info) << "[handler] malformed request from " << socket_->peer() << ": " << error.what();
        return makeErrorResponse(EResponseType::BAD_REQUEST);
    } catch (const RubusMissingField& error) {
        PLOG(plog::info) << "[handler] incomplete request from " << socket_->peer() << ": " << error.what();
        return makeErrorResponse(EResponseType::BAD_REQUEST);
    } catch (const std::exception& error) {
        PLOG(plog::error) << "[handler] internal failure on request of " << socket_->peer() << ": " << error.what();
        return makeErrorResponse(EResponseType::SERVER_ERROR);
    }
}

std::string_view rubus::toString(RequestHandler::EOutcome outcome) {
    switch (outcome) {
        case RequestHandler::EOutcome::SUCCESS: return "SUCCESS";
        case RequestHandler::EOutcome::TIMED_OUT: return "TIMED_OUT";
        case RequestHandler::EOutcome::EXCEPTION: return "EXCEPTION";
        case RequestHandler::EOutcome::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}
