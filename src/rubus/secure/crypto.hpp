#pragma once

// OpenSSL
#include <openssl/evp.h>

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>

// standard
#include <string_view>
#include <optional>
#include <memory>
#include <string>
#include <mutex>

// local
#include "interfaces/i-crypto-provider.hpp"


namespace rubus {

    // Certificate and key read from configured locations.
    struct Credentials {
        // raw file contents, sent to initiator as is
        std::string certificate;
        // PKCS#8 PEM
        std::string privateKey;

        static absl::StatusOr<Credentials> load(const std::string& certificatePath, const std::string& privateKeyPath);
    };

    // AES-256-CBC with PKCS#7 padding, HMAC-SHA256 over plaintext.
    class OpenSslMessageProtector : public IMessageProtector {
    public:

        explicit OpenSslMessageProtector(SessionKeys keys);

        // IMessageProtector implementation
        std::string seal(std::string_view payload) override;
        std::string open(std::string_view sealed) override;

    private:
        std::string mac(std::string_view payload) const;

    private:
        SessionKeys keys_;
    };

    // libcrypto backed primitives: RSA PKCS#1 v1.5 key transport, X.509 in DER or PEM.
    class OpenSslCryptoProvider 
        : public ICryptoProvider
        , public std::enable_shared_from_this<OpenSslCryptoProvider>
    {
    private: struct Private { };
    public:

        struct Settings {
            // responder side only
            std::optional<std::string> privateKey;
        };

        static std::shared_ptr<OpenSslCryptoProvider> configure(Settings settings);
        OpenSslCryptoProvider(Settings settings, Private access);

        // Parses private key if one is given.
        absl::Status init();

        // ICryptoProvider implementation
        std::string randomBytes(std::size_t size) override;
        std::string encryptForCertificate(std::string_view certificate, std::string_view secret) override;
        std::string decryptWithPrivateKey(std::string_view encrypted) override;
        std::unique_ptr<IMessageProtector> makeProtector(const SessionKeys& keys) override;

    private:
        using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

        Settings settings_;
        std::once_flag init_;
        PKeyPtr privateKey_;
    };

}
