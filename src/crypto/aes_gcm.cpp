#include "warden/crypto/aes_gcm.hpp"
#include "warden/crypto/sodium_interop.hpp"
#include "warden/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include "warden/core/format.hpp"
#include <memory>
namespace warden::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct CipherContextDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;
    std::string LastOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    Result<std::vector<uint8_t>, WardenFailure> CipherError(const std::string_view step) {
        return Result<std::vector<uint8_t>, WardenFailure>::Err(
            WardenFailure::BackendError(compat::format("AES-GCM {}: {}", step, LastOpenSSLError())));
    }
    Result<CipherContext, WardenFailure> InitContext(
        const bool encrypt,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        using R = Result<CipherContext, WardenFailure>;
        CipherContext ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return R::Err(WardenFailure::BackendError("Failed to create cipher context"));
        }
        const auto init = encrypt ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;
        if (init(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
            init(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
            return R::Err(WardenFailure::BackendError(
                compat::format("AES-GCM init: {}", LastOpenSSLError())));
        }
        if (!associated_data.empty()) {
            const auto update = encrypt ? EVP_EncryptUpdate : EVP_DecryptUpdate;
            int ignored = 0;
            if (update(ctx.get(), nullptr, &ignored, associated_data.data(),
                       static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return R::Err(WardenFailure::BackendError(
                    compat::format("AES-GCM associated data: {}", LastOpenSSLError())));
            }
        }
        return R::Ok(std::move(ctx));
    }
}
Result<std::vector<uint8_t>, WardenFailure> AesGcm::Seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (key.size() != Constants::AES_KEY_SIZE) {
        return Result<std::vector<uint8_t>, WardenFailure>::Err(
            WardenFailure::InvalidArgument(
                compat::format("AES-256-GCM key must be {} bytes, got {}", Constants::AES_KEY_SIZE, key.size())));
    }
    std::vector<uint8_t> sealed(SealedSize(plaintext.size()));
    const std::span<uint8_t> nonce(sealed.data(), Constants::AES_GCM_NONCE_SIZE);
    SodiumInterop::FillRandom(nonce);

    auto ctx_result = InitContext(true, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, WardenFailure>::Err(std::move(ctx_result).UnwrapErr());
    }
    const CipherContext ctx = std::move(ctx_result).Unwrap();

    uint8_t* body = sealed.data() + Constants::AES_GCM_NONCE_SIZE;
    int written = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), body, &written, plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(sealed);
        return CipherError("encrypt");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), body + written, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(sealed);
        return CipherError("finalize");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                            body + plaintext.size()) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(sealed);
        return CipherError("tag");
    }
    return Result<std::vector<uint8_t>, WardenFailure>::Ok(std::move(sealed));
}
Result<std::vector<uint8_t>, WardenFailure> AesGcm::Open(
    std::span<const uint8_t> key,
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> associated_data) {
    if (key.size() != Constants::AES_KEY_SIZE) {
        return Result<std::vector<uint8_t>, WardenFailure>::Err(
            WardenFailure::InvalidArgument(
                compat::format("AES-256-GCM key must be {} bytes, got {}", Constants::AES_KEY_SIZE, key.size())));
    }
    if (sealed.size() < SealedSize(0)) {
        return Result<std::vector<uint8_t>, WardenFailure>::Err(
            WardenFailure::InvalidArgument(
                compat::format("Sealed value too short: {} bytes", sealed.size())));
    }
    const auto nonce = sealed.subspan(0, Constants::AES_GCM_NONCE_SIZE);
    const size_t body_len = sealed.size() - SealedSize(0);
    const auto body = sealed.subspan(Constants::AES_GCM_NONCE_SIZE, body_len);
    std::vector<uint8_t> tag(sealed.end() - Constants::AES_GCM_TAG_SIZE, sealed.end());

    auto ctx_result = InitContext(false, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, WardenFailure>::Err(std::move(ctx_result).UnwrapErr());
    }
    const CipherContext ctx = std::move(ctx_result).Unwrap();

    std::vector<uint8_t> plaintext(body_len);
    int written = 0;
    if (!body.empty() &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &written, body.data(),
                          static_cast<int>(body.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(plaintext);
        return CipherError("decrypt");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(plaintext);
        return CipherError("set tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(plaintext);
        return Result<std::vector<uint8_t>, WardenFailure>::Err(
            WardenFailure::AccessDenied("Sealed value failed authentication"));
    }
    plaintext.resize(static_cast<size_t>(written + final_len));
    return Result<std::vector<uint8_t>, WardenFailure>::Ok(std::move(plaintext));
}
}
