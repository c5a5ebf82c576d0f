#include "common/hmac.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

string hmac_sha256_hex(const string &key, const string &data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), (int)key.size(),
              reinterpret_cast<const unsigned char *>(data.data()), data.size(),
              digest, &digest_len))
        throw internal_error("unable to compute HMAC-SHA256");

    static const char hex[] = "0123456789abcdef";
    string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0xF]);
    }
    return result;
}

bool constant_time_equals(const string &a, const string &b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

string base64_encode(const string &data) {
    string result(4 * ((data.size() + 2) / 3), '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(result.data()),
                              reinterpret_cast<const unsigned char *>(data.data()), (int)data.size());
    if (len < 0) throw internal_error("unable to encode base64");
    result.resize(len);
    return result;
}

}  // namespace grader
