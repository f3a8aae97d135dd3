#pragma once

// standard
#include <exception>
#include <string>


namespace rubus {

    // Root of every error raised by transport, crypto and protocol code.
    class RubusException : public std::exception {
    public:

        RubusException(std::string message)
        : message_(std::move(message))
        {}

        virtual const char* what() const noexcept override {
            return message_.data();
        }

    protected:
        std::string message_;
    };

    // init() methods should be called once on each object,
    // this exception signals that specified rule was violated
    class RubusBadInit : public RubusException {
    public:

        RubusBadInit()
        : RubusException("init() called more than once on created object")
        {}
        RubusBadInit(std::string message)
        : RubusException(std::move(message))
        {}
    };

    // init() must be called at least once
    class RubusNoInit : public RubusException {
    public:

        RubusNoInit()
        : RubusException("init() was not called although object is being used")
        {}
        RubusNoInit(std::string message)
        : RubusException(std::move(message))
        {}
    };

    // value does not fit into buffer, frame or length field
    class RubusOverrun : public RubusException {
    public:

        RubusOverrun()
        : RubusException("critical overrun on buffer or variable")
        {}
        RubusOverrun(std::string message)
        : RubusException(std::move(message))
        {}
    };

    // deadline elapsed before read, write or handshake completed
    class RubusTimeout : public RubusException {
    public:

        RubusTimeout()
        : RubusException("operation timed out")
        {}
        RubusTimeout(std::string message)
        : RubusException(std::move(message))
        {}
    };

    // peer closed the stream
    class RubusEndOfStream : public RubusException {
    public:

        RubusEndOfStream()
        : RubusException("end of stream reached")
        {}
        RubusEndOfStream(std::string message)
        : RubusException(std::move(message))
        {}
    };

    // system level failure on socket, including use after close
    class RubusSocketError : public RubusException {
    public:

        RubusSocketError()
        : RubusException("socket operation failed")
        {}
        RubusSocketError(std::string message)
        : RubusException(std::move(message))
        {}
    };

    class RubusHandshakeUnsupported : public RubusException {
    public:

        RubusHandshakeUnsupported()
        : RubusException("secure connection is not supported by one of the sides")
        {}
        RubusHandshakeUnsupported(std::string message)
        : RubusException(std::move(message))
        {}
    };

    class RubusCorruptHandshake : public RubusException {
    public:

        RubusCorruptHandshake()
        : RubusException("handshake data is corrupted")
        {}
        RubusCorruptHandshake(std::string message)
        : RubusException(std::move(message))
        {}
    };

    // integrity check of received message failed
    class RubusCorruptMessage : public RubusException {
    public:

        RubusCorruptMessage()
        : RubusException("message integrity check failed")
        {}
        RubusCorruptMessage(std::string message)
        : RubusException(std::move(message))
        {}
    };

    // primitive from crypto library reported failure
    class RubusCryptoError : public RubusException {
    public:

        RubusCryptoError()
        : RubusException("cryptographic primitive failed")
        {}
        RubusCryptoError(std::string message)
        : RubusException(std::move(message))
        {}
    };

    class RubusMalformedRequest : public RubusException {
    public:

        RubusMalformedRequest()
        : RubusException("request type could not be parsed")
        {}
        RubusMalformedRequest(std::string message)
        : RubusException(std::move(message))
        {}
    };

    class RubusMissingField : public RubusException {
    public:

        RubusMissingField()
        : RubusException("requested field is absent")
        {}
        RubusMissingField(std::string message)
        : RubusException(std::move(message))
        {}
    };

}
