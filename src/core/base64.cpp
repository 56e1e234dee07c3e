#include "core/base64.h"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>

std::string base64Encode(const std::string& input) {
    if (input.empty()) return {};

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_push(b64, mem);

    BIO_write(b64, input.data(), static_cast<int>(input.size()));
    BIO_flush(b64);

    BUF_MEM* buf = nullptr;
    BIO_get_mem_ptr(b64, &buf);

    std::string out(buf->data, buf->length);
    BIO_free_all(b64);
    return out;
}

std::string base64Decode(const std::string& input) {
    BIO* bio = BIO_new_mem_buf(input.data(), static_cast<int>(input.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::string output(input.size(), '\0');
    int len = BIO_read(bio, output.data(), static_cast<int>(output.size()));
    BIO_free_all(bio);

    if (len < 0) return {};
    output.resize(len);
    return output;
}

std::string base64UrlEncode(const std::string& input) {
    std::string out = base64Encode(input);
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=')
        out.pop_back();
    return out;
}
