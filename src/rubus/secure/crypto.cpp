// OpenSSL
#include <openssl/crypto.h>
#include <openssl/x509.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/pem.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/bio.h>

// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>

// plog
#include <plog/Log.h>
#include <plog/Severity.h>

// standard
#include <string_view>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

// rubus
#include <common/exceptions.hpp>
#include <rubus/macros.hpp>

// local
#include "crypto.hpp"

using namespace rubus;


namespace {

    using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
    using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
    using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
    using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

    constexpr std::size_t BlockSize = 16;

    std::string opensslError() {
        unsigned long code = ERR_get_error();
        if (!code) {
            return "unknown error";
        }
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        ERR_clear_error();
        return buffer;
    }

    const unsigned char* bytes(std::string_view view) {
        return reinterpret_cast<const unsigned char*>(view.data());
    }

    unsigned char* bytes(std::string& str) {
        return reinterpret_cast<unsigned char*>(str.data());
    }

    absl::StatusOr<std::string> readFile(const std::string& path) {
        std::ifstream ifs {path, std::ios::in | std::ios::binary};
        if (!ifs) {
            return absl::NotFoundError(absl::StrFormat("error while opening file: %s, ensure that it exists", path));
        }

        std::error_code error;
        std::size_t size = std::filesystem::file_size(path, error);
        if (error) {
            return absl::InternalError(absl::StrFormat("could not stat %s: %s", path, error.message()));
        }

        std::string contents (size, '\0');
        if (static_cast<std::size_t>(ifs.read(contents.data(), size).gcount()) < size) {
            return absl::InternalError(absl::StrFormat("error while reading %s: not all bytes received", path));
        }
        return contents;
    }

    X509Ptr parseCertificate(std::string_view certificate) {
        const unsigned char* cursor = bytes(certificate);
        X509Ptr parsed {d2i_X509(nullptr, &cursor, static_cast<long>(certificate.size())), &X509_free};
        if (parsed) {
            return parsed;
        }

        ERR_clear_error();
        BioPtr bio {BIO_new_mem_buf(certificate.data(), static_cast<int>(certificate.size())), &BIO_free};
        if (!bio) {
            throw RubusCryptoError("could not allocate memory bio");
        }
        parsed.reset(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!parsed) {
            throw RubusCorruptHandshake(absl::StrFormat(
                "peer certificate is neither DER nor PEM X.509: %s", opensslError()));
        }
        return parsed;
    }

}

absl::StatusOr<Credentials> Credentials::load(const std::string& certificatePath, const std::string& privateKeyPath) {
    auto certificate = readFile(certificatePath);
    if (!certificate.ok()) {
        return certificate.status();
    }
    auto privateKey = readFile(privateKeyPath);
    if (!privateKey.ok()) {
        return privateKey.status();
    }

    return Credentials{
        .certificate = std::move(certificate).value(),
        .privateKey = std::move(privateKey).value()
    };
}

OpenSslMessageProtector::OpenSslMessageProtector(SessionKeys keys)
: keys_(std::move(keys))
{
    if (keys_.cipherKey.size() != CipherKeyLength || keys_.macKey.size() != MacKeyLength) {
        throw RubusCryptoError(absl::StrFormat(
            "invalid session keys: cipher key %d bytes, mac key %d bytes", keys_.cipherKey.size(), keys_.macKey.size()));
    }
}

std::string OpenSslMessageProtector::mac(std::string_view payload) const {
    std::string result (EVP_MAX_MD_SIZE, '\0');
    unsigned int length = 0;

    if (!HMAC(EVP_sha256(), keys_.macKey.data(), static_cast<int>(keys_.macKey.size()),
        bytes(payload), payload.size(), bytes(result), &length)) 
    {
        throw RubusCryptoError(absl::StrFormat("HMAC failed: %s", opensslError()));
    }

    result.resize(length);
    return result;
}

std::string OpenSslMessageProtector::seal(std::string_view payload) {
    std::string plain;
    plain.reserve(payload.size() + MacLength);
    plain.append(payload);
    plain.append(mac(payload));

    std::string sealed (IvLength + plain.size() + BlockSize, '\0');
    if (RAND_bytes(bytes(sealed), IvLength) != 1) {
        throw RubusCryptoError(absl::StrFormat("could not generate IV: %s", opensslError()));
    }

    CipherCtxPtr ctx {EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, 
        bytes(keys_.cipherKey), bytes(sealed)) != 1) 
    {
        throw RubusCryptoError(absl::StrFormat("cipher init failed: %s", opensslError()));
    }

    int written = 0, finalized = 0;
    unsigned char* out = bytes(sealed) + IvLength;
    if (EVP_EncryptUpdate(ctx.get(), out, &written, bytes(plain), static_cast<int>(plain.size())) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), out + written, &finalized) != 1) 
    {
        throw RubusCryptoError(absl::StrFormat("encryption failed: %s", opensslError()));
    }

    sealed.resize(IvLength + written + finalized);
    return sealed;
}

std::string OpenSslMessageProtector::open(std::string_view sealed) {
    if (sealed.size() < IvLength + BlockSize || (sealed.size() - IvLength) % BlockSize != 0) {
        throw RubusCorruptMessage(absl::StrFormat("encrypted message has invalid size %d", sealed.size()));
    }

    std::string_view iv = sealed.substr(0, IvLength);
    std::string_view ciphertext = sealed.substr(IvLength);

    CipherCtxPtr ctx {EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, 
        bytes(keys_.cipherKey), bytes(iv)) != 1) 
    {
        throw RubusCryptoError(absl::StrFormat("cipher init failed: %s", opensslError()));
    }

    std::string plain (ciphertext.size() + BlockSize, '\0');
    int written = 0, finalized = 0;
    if (EVP_DecryptUpdate(ctx.get(), bytes(plain), &written, bytes(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
        throw RubusCryptoError(absl::StrFormat("decryption failed: %s", opensslError()));
    }
    if (EVP_DecryptFinal_ex(ctx.get(), bytes(plain) + written, &finalized) != 1) {
        ERR_clear_error();
        throw RubusCorruptMessage("encrypted message has invalid padding");
    }
    plain.resize(written + finalized);

    if (plain.size() < MacLength) {
        throw RubusCorruptMessage("encrypted message is too short to hold MAC");
    }

    std::string_view payload = std::string_view(plain).substr(0, plain.size() - MacLength);
    std::string_view received = std::string_view(plain).substr(plain.size() - MacLength);
    std::string expected = mac(payload);

    if (CRYPTO_memcmp(expected.data(), received.data(), MacLength) != 0) {
        throw RubusCorruptMessage("MAC of received message does not match");
    }

    plain.resize(payload.size());
    return plain;
}

std::shared_ptr<OpenSslCryptoProvider> OpenSslCryptoProvider::configure(Settings settings) {
    return std::make_shared<OpenSslCryptoProvider>(std::move(settings), Private());
}

OpenSslCryptoProvider::OpenSslCryptoProvider(Settings settings, Private access)
: settings_(std::move(settings))
, privateKey_(nullptr, &EVP_PKEY_free)
{}

absl::Status OpenSslCryptoProvider::init() {
    absl::Status status;
    std::call_once(init_, [this, &status]() {
        if (!settings_.privateKey.has_value()) {
            return;
        }

        BioPtr bio {BIO_new_mem_buf(settings_.privateKey->data(), static_cast<int>(settings_.privateKey->size())), &BIO_free};
        if (!bio) {
            status = absl::InternalError("could not allocate memory bio");
            return;
        }

        privateKey_.reset(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
        if (!privateKey_) {
            status = absl::InvalidArgumentError(absl::StrFormat(
                "could not parse PKCS#8 PEM private key: %s", opensslError()));
            return;
        }

        if (EVP_PKEY_get_base_id(privateKey_.get()) != EVP_PKEY_RSA) {
            privateKey_.reset();
            status = absl::InvalidArgumentError("private key is not an RSA key");
            return;
        }

        PLOG(plog::debug) << "[crypto] loaded RSA private key of " << EVP_PKEY_get_bits(privateKey_.get()) << " bits";
    });

    return status;
}

std::string OpenSslCryptoProvider::randomBytes(std::size_t size) {
    std::string result (size, '\0');
    if (RAND_bytes(bytes(result), static_cast<int>(size)) != 1) {
        throw RubusCryptoError(absl::StrFormat("could not generate random bytes: %s", opensslError()));
    }
    return result;
}

std::string OpenSslCryptoProvider::encryptForCertificate(std::string_view certificate, std::string_view secret) {
    X509Ptr parsed = parseCertificate(certificate);

    PKeyPtr publicKey {X509_get_pubkey(parsed.get()), &EVP_PKEY_free};
    if (!publicKey) {
        throw RubusCorruptHandshake(absl::StrFormat("certificate has no usable public key: %s", opensslError()));
    }

    PKeyCtxPtr ctx {EVP_PKEY_CTX_new(publicKey.get(), nullptr), &EVP_PKEY_CTX_free};
    std::size_t length = 0;
    if (!ctx 
        || EVP_PKEY_encrypt_init(ctx.get()) <= 0
        || EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0
        || EVP_PKEY_encrypt(ctx.get(), nullptr, &length, bytes(secret), secret.size()) <= 0) 
    {
        throw RubusCorruptHandshake(absl::StrFormat("certificate key cannot be used for RSA encryption: %s", opensslError()));
    }

    std::string encrypted (length, '\0');
    if (EVP_PKEY_encrypt(ctx.get(), bytes(encrypted), &length, bytes(secret), secret.size()) <= 0) {
        throw RubusCryptoError(absl::StrFormat("RSA encryption failed: %s", opensslError()));
    }

    encrypted.resize(length);
    return encrypted;
}

std::string OpenSslCryptoProvider::decryptWithPrivateKey(std::string_view encrypted) {
    if (!privateKey_) {
        throw RubusCryptoError("private key is not configured, cannot act as responder");
    }

    PKeyCtxPtr ctx {EVP_PKEY_CTX_new(privateKey_.get(), nullptr), &EVP_PKEY_CTX_free};
    std::size_t length = 0;
    if (!ctx
        || EVP_PKEY_decrypt_init(ctx.get()) <= 0
        || EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0
        || EVP_PKEY_decrypt(ctx.get(), nullptr, &length, bytes(encrypted), encrypted.size()) <= 0) 
    {
        throw RubusCryptoError(absl::StrFormat("RSA decryption init failed: %s", opensslError()));
    }

    std::string decrypted (length, '\0');
    if (EVP_PKEY_decrypt(ctx.get(), bytes(decrypted), &length, bytes(encrypted), encrypted.size()) <= 0) {
        ERR_clear_error();
        throw RubusCorruptHandshake("key material cannot be decrypted with local private key");
    }

    decrypted.resize(length);
    return decrypted;
}

std::unique_ptr<IMessageProtector> OpenSslCryptoProvider::makeProtector(const SessionKeys& keys) {
    return std::make_unique<OpenSslMessageProtector>(keys);
}
