#include "security/record_encryptor.hpp"
#include "core/base64.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <format>
#include <stdexcept>
#include <vector>

namespace auditpipe {

namespace {
constexpr int kIvLen = 12;
constexpr int kTagLen = 16;
constexpr size_t kKeyLen = 32;
constexpr std::string_view kPrefix = "AENC:v1:";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

} // anonymous namespace

RecordEncryptor::RecordEncryptor(std::shared_ptr<IKeyManager> key_manager)
    : key_manager_(std::move(key_manager)) {
    if (!key_manager_) {
        throw std::invalid_argument("RecordEncryptor requires a key manager");
    }
}

bool RecordEncryptor::is_encrypted(std::string_view record) {
    return record.starts_with(kPrefix);
}

void RecordEncryptor::fail(const std::string& message) const {
    failures_.fetch_add(1, std::memory_order_relaxed);
    throw std::runtime_error(message);
}

std::string RecordEncryptor::encrypt(std::string_view plaintext) const {
    const auto key_info = key_manager_->get_active_key();
    if (!key_info || key_info->key_bytes.size() < kKeyLen) {
        fail("No usable active encryption key");
    }

    uint8_t iv[kIvLen];
    if (RAND_bytes(iv, kIvLen) != 1) {
        fail("RAND_bytes failed while generating an IV");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) fail("EVP_CIPHER_CTX_new failed");

    std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    uint8_t tag[kTagLen];
    int len = 0;
    int ciphertext_len = 0;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_info->key_bytes.data(), iv) != 1 ||
        EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
            reinterpret_cast<const uint8_t*>(plaintext.data()),
            static_cast<int>(plaintext.size())) != 1) {
        fail("AES-256-GCM encryption failed");
    }
    ciphertext_len = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + len, &len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLen, tag) != 1) {
        fail("AES-256-GCM finalization failed");
    }
    ciphertext_len += len;

    // Pack: iv + ciphertext + tag
    std::vector<uint8_t> packed;
    packed.reserve(kIvLen + ciphertext_len + kTagLen);
    packed.insert(packed.end(), iv, iv + kIvLen);
    packed.insert(packed.end(), ciphertext.begin(), ciphertext.begin() + ciphertext_len);
    packed.insert(packed.end(), tag, tag + kTagLen);

    std::string result;
    result.reserve(kPrefix.size() + key_info->key_id.size() + 1 +
                   4 * ((packed.size() + 2) / 3));
    result += kPrefix;
    result += key_info->key_id;
    result += ':';
    result += base64::encode(packed.data(), packed.size());

    records_encrypted_.fetch_add(1, std::memory_order_relaxed);
    return result;
}

std::string RecordEncryptor::decrypt(std::string_view record) const {
    if (!is_encrypted(record)) {
        return std::string(record);
    }

    const auto rest = record.substr(kPrefix.size());
    const size_t colon = rest.find(':');
    if (colon == std::string_view::npos) {
        fail("Malformed encrypted record");
    }

    const std::string key_id(rest.substr(0, colon));
    const auto key_info = key_manager_->get_key(key_id);
    if (!key_info || key_info->key_bytes.size() < kKeyLen) {
        fail(std::format("Unknown encryption key '{}'", key_id));
    }

    const auto decoded = base64::decode(rest.substr(colon + 1));
    if (!decoded) {
        fail("Encrypted record body is not valid base64");
    }
    const auto& packed = *decoded;
    if (packed.size() < static_cast<size_t>(kIvLen + kTagLen)) {
        fail("Encrypted record is truncated");
    }

    const uint8_t* iv = packed.data();
    const size_t ct_len = packed.size() - kIvLen - kTagLen;
    const uint8_t* ct = packed.data() + kIvLen;
    std::vector<uint8_t> tag(packed.end() - kTagLen, packed.end());

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) fail("EVP_CIPHER_CTX_new failed");

    std::vector<uint8_t> plaintext(ct_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int plaintext_len = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_info->key_bytes.data(), iv) != 1 ||
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ct, static_cast<int>(ct_len)) != 1) {
        fail("AES-256-GCM decryption failed");
    }
    plaintext_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLen, tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) <= 0) {
        fail("Encrypted record failed authentication");
    }
    plaintext_len += len;

    records_decrypted_.fetch_add(1, std::memory_order_relaxed);
    return std::string(reinterpret_cast<const char*>(plaintext.data()),
                       static_cast<size_t>(plaintext_len));
}

} // namespace auditpipe
