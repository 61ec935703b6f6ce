#pragma once
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>
#include <string>

namespace helper {

inline uint64_t get_current_timestamp_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

inline uint64_t get_current_timestamp_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

inline std::string create_string_to_sign(const std::string& timestamp,
                                         const std::string& method,
                                         const std::string& request_path,
                                         const std::string& body) {
    return timestamp + method + request_path + body;
}

inline std::string base64_encode(const unsigned char* buffer, size_t length) {
    BIO* bio;
    BIO* b64;
    BUF_MEM* bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);
    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, buffer, static_cast<int>(length));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string encoded(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);
    return encoded;
}

// base64(HMAC-SHA256(secret, timestamp + method + path + body))
inline std::string generate_request_signature(const std::string& secret,
                                              const std::string& timestamp,
                                              const std::string& method,
                                              const std::string& request_path,
                                              const std::string& body) {
    const std::string message = create_string_to_sign(timestamp, method, request_path, body);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    HMAC(EVP_sha256(),
         secret.c_str(),
         static_cast<int>(secret.length()),
         reinterpret_cast<const unsigned char*>(message.c_str()),
         message.length(),
         digest,
         &digest_length);

    return base64_encode(digest, digest_length);
}

} // namespace helper
