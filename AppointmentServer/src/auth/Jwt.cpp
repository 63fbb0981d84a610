#include "Jwt.h"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "net/MiniJson.h"

namespace {

const size_t kMaxToken = 8 * 1024;

std::string base64url_encode(const std::string& in) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    b64 = BIO_push(b64, bmem);
    BIO_write(b64, in.data(), static_cast<int>(in.size()));
    (void)BIO_flush(b64);
    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);
    std::string out(bptr->data, bptr->length);
    BIO_free_all(b64);
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string base64url_decode(const std::string& in) {
    std::string s = in;
    for (auto& c : s) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    while (s.size() % 4) s.push_back('=');
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(s.data(), static_cast<int>(s.size()));
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bmem = BIO_push(b64, bmem);
    std::vector<char> out(s.size());
    int outlen = BIO_read(bmem, out.data(), static_cast<int>(out.size()));
    BIO_free_all(bmem);
    if (outlen <= 0) return std::string();
    return std::string(out.data(), outlen);
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned int len = EVP_MAX_MD_SIZE;
    unsigned char md[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &len);
    return std::string(reinterpret_cast<char*>(md), len);
}

// "sub" may be a JSON string of digits or a bare integer
std::optional<int64_t> subject_of(const std::string& payload) {
    try {
        auto s = json_extract_string_opt_present(payload, "sub");
        if (s.first) {
            if (!s.second) return std::nullopt;
            return parse_int64_strict_sv(*s.second);
        }
        return std::nullopt;
    } catch (const std::runtime_error&) {
        // not a string; fall through to the integer form
    }
    try {
        return json_extract_int_opt(payload, "sub");
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

}

namespace auth {

std::string create_jwt(const Claims& c, const std::string& secret) {
    std::string header_s = "{\"alg\":\"HS256\",\"typ\":\"JWT\"}";
    std::ostringstream oss;
    oss << "{\"sub\":\"" << c.sub << "\",\"role\":\"" << to_string(c.role) << "\",\"iat\":" << c.iat << ",\"exp\":" << c.exp << "}";
    std::string to_sign = base64url_encode(header_s) + "." + base64url_encode(oss.str());
    return to_sign + "." + base64url_encode(hmac_sha256(secret, to_sign));
}

std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret, int64_t now_unix) {
    if (token.empty() || token.size() > kMaxToken || secret.empty()) return std::nullopt;
    size_t p1 = token.find('.');
    if (p1 == std::string::npos) return std::nullopt;
    size_t p2 = token.find('.', p1 + 1);
    if (p2 == std::string::npos || token.find('.', p2 + 1) != std::string::npos) return std::nullopt;

    std::string to_sign = token.substr(0, p2);
    std::string sig = base64url_decode(token.substr(p2 + 1));
    std::string expected = hmac_sha256(secret, to_sign);
    if (sig.size() != expected.size()) return std::nullopt;
    if (CRYPTO_memcmp(sig.data(), expected.data(), sig.size()) != 0) return std::nullopt;

    std::string header_s = base64url_decode(token.substr(0, p1));
    std::string payload_s = base64url_decode(token.substr(p1 + 1, p2 - p1 - 1));
    Claims cl;
    try {
        if (json_extract_string(header_s, "alg") != "HS256") return std::nullopt;
        auto typ = json_extract_string(header_s, "typ");
        if (!typ.empty() && typ != "JWT") return std::nullopt;
        auto role = parse_role(json_extract_string(payload_s, "role"));
        if (!role) return std::nullopt;
        cl.role = *role;
        cl.iat = json_extract_int_opt(payload_s, "iat").value_or(0);
        cl.exp = json_extract_int_opt(payload_s, "exp").value_or(0);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    auto sub = subject_of(payload_s);
    if (!sub || *sub <= 0) return std::nullopt;
    cl.sub = *sub;

    if (cl.exp != 0 && now_unix > cl.exp) return std::nullopt;
    if (cl.iat != 0 && cl.iat > now_unix + 60) return std::nullopt;
    return cl;
}

std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret) {
    return verify_jwt(token, secret, static_cast<int64_t>(std::time(nullptr)));
}

std::optional<Caller> authenticate_bearer(const std::string& authorization, const std::string& secret) {
    const std::string prefix = "Bearer ";
    if (authorization.size() <= prefix.size() || authorization.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    auto cl = verify_jwt(authorization.substr(prefix.size()), secret);
    if (!cl) return std::nullopt;
    return caller_from_claims(*cl);
}

}
