#include <kiln/keypair.hpp>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

#include <cstdint>
#include <memory>
#include <sstream>
#include <vector>

namespace kiln {

namespace {

struct PkeyFree { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxFree { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct BioFree { void operator()(BIO* p) const { BIO_free(p); } };
struct BnFree { void operator()(BIGNUM* p) const { BN_free(p); } };

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyFree>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxFree>;
using BioPtr = std::unique_ptr<BIO, BioFree>;
using BnPtr = std::unique_ptr<BIGNUM, BnFree>;

const char SSH_RSA[] = "ssh-rsa";

// Drain the OpenSSL error queue into a KilnError for the failed step.
KilnError openssl_error(KilnError::Code code, const std::string& what) {
    std::string msg = what + " failed";
    unsigned long err = ERR_get_error();
    if (err != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    ERR_clear_error();
    return KilnError{code, msg};
}

// ---- SSH wire encoding (RFC 4251 section 5) ----

void put_u32(std::string& buf, uint32_t v) {
    buf += static_cast<char>((v >> 24) & 0xFF);
    buf += static_cast<char>((v >> 16) & 0xFF);
    buf += static_cast<char>((v >> 8) & 0xFF);
    buf += static_cast<char>(v & 0xFF);
}

void put_string(std::string& buf, const std::string& s) {
    put_u32(buf, static_cast<uint32_t>(s.size()));
    buf += s;
}

// Two's-complement big-endian; a leading zero keeps positive values positive.
void put_mpint(std::string& buf, const BIGNUM* bn) {
    std::string bytes(static_cast<size_t>(BN_num_bytes(bn)), '\0');
    if (!bytes.empty()) {
        BN_bn2bin(bn, reinterpret_cast<unsigned char*>(&bytes[0]));
        if (static_cast<unsigned char>(bytes[0]) & 0x80) {
            bytes.insert(bytes.begin(), '\0');
        }
    }
    put_string(buf, bytes);
}

std::string base64_encode(const std::string& in) {
    std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(n));
}

Result<std::string> base64_decode(const std::string& in) {
    if (in.empty() || in.size() % 4 != 0) {
        return KilnError{KilnError::Parse, "invalid base64 key blob length"};
    }
    std::vector<unsigned char> out(3 * (in.size() / 4) + 1);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    if (n < 0) {
        return KilnError{KilnError::Parse, "invalid base64 in key blob"};
    }
    // EVP_DecodeBlock counts padding as zero bytes
    size_t len = static_cast<size_t>(n);
    size_t pad = (in[in.size() - 1] == '=') + (in[in.size() - 2] == '=');
    if (pad >= len) {
        return KilnError{KilnError::Parse, "empty key blob"};
    }
    len -= pad;
    return Result<std::string>::ok(
        std::string(reinterpret_cast<const char*>(out.data()), len));
}

Result<std::string> authorized_key(const EVP_PKEY* pkey) {
    BIGNUM* raw_n = nullptr;
    BIGNUM* raw_e = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_N, &raw_n) != 1) {
        return openssl_error(KilnError::KeyGeneration, "reading RSA modulus");
    }
    BnPtr n(raw_n);
    if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_E, &raw_e) != 1) {
        return openssl_error(KilnError::KeyGeneration, "reading RSA exponent");
    }
    BnPtr e(raw_e);

    // ssh-rsa blob: string "ssh-rsa", mpint e, mpint n
    std::string blob;
    put_string(blob, SSH_RSA);
    put_mpint(blob, e.get());
    put_mpint(blob, n.get());

    return Result<std::string>::ok(
        std::string(SSH_RSA) + " " + base64_encode(blob) + "\n");
}

Result<std::string> private_pem(EVP_PKEY* pkey) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return openssl_error(KilnError::KeyGeneration, "BIO_new");
    }
    // "traditional" selects PKCS#1 (BEGIN RSA PRIVATE KEY) over PKCS#8
    if (PEM_write_bio_PrivateKey_traditional(bio.get(), pkey, nullptr,
                                             nullptr, 0, nullptr, nullptr) != 1) {
        return openssl_error(KilnError::KeyGeneration, "PEM encoding private key");
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data) {
        return KilnError{KilnError::KeyGeneration, "PEM encoding produced no output"};
    }
    return Result<std::string>::ok(std::string(data, static_cast<size_t>(len)));
}

} // namespace

Result<KeyPair> generate_keypair(int bits) {
    if (bits < kMinKeyBits || bits > kMaxKeyBits) {
        return KilnError{KilnError::InvalidArg,
            "unsupported RSA key size " + std::to_string(bits),
            "key size must be between " + std::to_string(kMinKeyBits) +
            " and " + std::to_string(kMaxKeyBits) + " bits"};
    }

    if (RAND_status() != 1) {
        return KilnError{KilnError::KeyGeneration,
            "secure random source is not seeded",
            "key generation can be retried once entropy is available"};
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) {
        return openssl_error(KilnError::KeyGeneration, "EVP_PKEY_CTX_new_id(RSA)");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return openssl_error(KilnError::KeyGeneration, "EVP_PKEY_keygen_init");
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        return openssl_error(KilnError::KeyGeneration, "EVP_PKEY_CTX_set_rsa_keygen_bits");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        return openssl_error(KilnError::KeyGeneration, "EVP_PKEY_keygen");
    }
    PkeyPtr pkey(raw);

    KeyPair pair;
    auto pub = authorized_key(pkey.get());
    KILN_TRY(pub);
    pair.public_key = std::move(pub).value();

    auto priv = private_pem(pkey.get());
    KILN_TRY(priv);
    pair.private_key = std::move(priv).value();

    return Result<KeyPair>::ok(std::move(pair));
}

Result<std::string> public_key_from_private(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return openssl_error(KilnError::IO, "BIO_new_mem_buf");
    }
    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        return openssl_error(KilnError::Parse, "reading PEM private key");
    }
    if (EVP_PKEY_base_id(pkey.get()) != EVP_PKEY_RSA) {
        return KilnError{KilnError::Parse, "private key is not an RSA key"};
    }

    auto pub = authorized_key(pkey.get());
    if (pub.is_err()) {
        KilnError e = std::move(pub).error();
        e.code = KilnError::Parse;
        return e;
    }
    return pub;
}

Result<std::string> key_fingerprint(const std::string& line) {
    std::istringstream in(line);
    std::string type, encoded;
    in >> type >> encoded;
    if (type.empty() || encoded.empty()) {
        return KilnError{KilnError::Parse,
            "malformed authorized key",
            "expected '<type> <base64> [comment]'"};
    }

    auto blob = base64_decode(encoded);
    KILN_TRY(blob);

    // The blob opens with its own key type as an SSH string
    const std::string& raw = blob.value();
    if (raw.size() < 4) {
        return KilnError{KilnError::Parse, "key blob is too short"};
    }
    uint32_t type_len = (static_cast<uint32_t>(static_cast<unsigned char>(raw[0])) << 24) |
                        (static_cast<uint32_t>(static_cast<unsigned char>(raw[1])) << 16) |
                        (static_cast<uint32_t>(static_cast<unsigned char>(raw[2])) << 8) |
                        static_cast<uint32_t>(static_cast<unsigned char>(raw[3]));
    if (type_len > raw.size() - 4) {
        return KilnError{KilnError::Parse, "key blob type string is truncated"};
    }
    if (raw.compare(4, type_len, type) != 0) {
        return KilnError{KilnError::Parse,
            "key type '" + type + "' does not match key blob '" +
            raw.substr(4, type_len) + "'"};
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    const auto& bytes = blob.value();
    if (EVP_Digest(bytes.data(), bytes.size(), md, &md_len,
                   EVP_sha256(), nullptr) != 1) {
        return openssl_error(KilnError::IO, "EVP_Digest(sha256)");
    }

    std::string b64 = base64_encode(
        std::string(reinterpret_cast<const char*>(md), md_len));
    while (!b64.empty() && b64.back() == '=') b64.pop_back();
    return Result<std::string>::ok("SHA256:" + b64);
}

} // namespace kiln
