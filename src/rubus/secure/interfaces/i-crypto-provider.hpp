#pragma once

// standard
#include <string_view>
#include <cstddef>
#include <memory>
#include <string>


namespace rubus {

    // Symmetric material derived from handshake nonce.
    struct SessionKeys {
        std::string cipherKey;
        std::string macKey;

        bool operator==(const SessionKeys& other) const = default;
    };

    // Authenticated encryption of single message.
    class IMessageProtector {
    public:
        // Returns IV || E(payload || MAC(payload)).
        virtual std::string seal(std::string_view payload) = 0;
        // Inverse of seal(), throws RubusCorruptMessage if integrity check fails.
        virtual std::string open(std::string_view sealed) = 0;

        virtual ~IMessageProtector() = default;
    };

    // Primitives used by secure session handshake. Keeping them behind this
    // interface lets hardened key exchange replace current one without changes
    // in session state machine.
    class ICryptoProvider {
    public:
        virtual std::string randomBytes(std::size_t size) = 0;
        // Encrypts secret with public key taken from peer certificate.
        // Throws RubusCorruptHandshake if certificate cannot be used.
        virtual std::string encryptForCertificate(std::string_view certificate, std::string_view secret) = 0;
        // Decrypts key material with local private key.
        // Throws RubusCorruptHandshake if it cannot be decrypted.
        virtual std::string decryptWithPrivateKey(std::string_view encrypted) = 0;
        virtual std::unique_ptr<IMessageProtector> makeProtector(const SessionKeys& keys) = 0;

        virtual ~ICryptoProvider() = default;
    };

}
