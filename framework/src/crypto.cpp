#include <meridian/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <memory>

namespace meridian::crypto {

    struct BioDeleter { void operator()(BIO* b) { BIO_free_all(b); } };
    using BioPtr = std::unique_ptr<BIO, BioDeleter>;

    namespace {
        BioPtr create_base64_sink() {
            BioPtr b64(BIO_new(BIO_f_base64()));
            if (!b64) return nullptr;
            BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

            BIO* mem = BIO_new(BIO_s_mem());
            if (!mem) return nullptr;

            BIO_push(b64.get(), mem);
            return b64;
        }

        BioPtr create_base64_source(std::string_view input) {
            BioPtr b64(BIO_new(BIO_f_base64()));
            if (!b64) return nullptr;
            BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

            BIO* mem = BIO_new_mem_buf(input.data(), static_cast<int>(input.size()));
            if (!mem) return nullptr;

            BIO_push(b64.get(), mem);
            return b64;
        }
    }

    std::string sha256(std::string_view input) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        EVP_Digest(input.data(), input.size(), hash, &len, EVP_sha256(), nullptr);
        return std::string(reinterpret_cast<char*>(hash), len);
    }

    std::string hmac_sha256(std::string_view key, std::string_view data) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash, &len);
        return std::string(reinterpret_cast<char*>(hash), len);
    }

    std::string hex_encode(std::string_view input) {
        static constexpr char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.resize(input.size() * 2);
        char* ptr = result.data();
        for (unsigned char c : input) {
            *ptr++ = hex_chars[c >> 4];
            *ptr++ = hex_chars[c & 0x0f];
        }
        return result;
    }

    std::string sha256_hex(std::string_view input) {
        return hex_encode(sha256(input));
    }

    std::string base64_encode(std::string_view input) {
        BioPtr chain = create_base64_sink();
        if (!chain) return "";

        if (!input.empty() && BIO_write(chain.get(), input.data(), static_cast<int>(input.size())) <= 0) return "";
        BIO_flush(chain.get());

        BUF_MEM* bufferPtr = nullptr;
        BIO_get_mem_ptr(chain.get(), &bufferPtr);

        return std::string(bufferPtr->data, bufferPtr->length);
    }

    std::string base64_decode(std::string_view input) {
        BioPtr chain = create_base64_source(input);
        if (!chain) return "";

        std::string res;
        res.resize(input.size());
        size_t total = 0;
        while (total < res.size()) {
            int n = BIO_read(chain.get(), res.data() + total, static_cast<int>(res.size() - total));
            if (n <= 0) break;
            total += static_cast<size_t>(n);
        }
        res.resize(total);

        return res;
    }

} // namespace meridian::crypto
