/*******************************************************************************
    Project: Volcano Controller Manager

    File: credential_bundle.cpp

    Description:
        RSA key generation (OpenSSL EVP), OpenSSH public key encoding and
        the ssh client config listing every pod of a job.
*******************************************************************************/

#include "plugins/ssh/credential_bundle.h"
#include "common/errors.h"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace volcano {
namespace plugins {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

std::string openssl_error(const std::string& what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return what + ": " + buf;
}

PkeyPtr generate_rsa_key(int bits) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx ||
        EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        throw PluginError(openssl_error("rsa keygen setup failed"));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw PluginError(openssl_error("rsa generateKey failed"));
    }
    return PkeyPtr(raw, &EVP_PKEY_free);
}

std::string bio_contents(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) return "";
    return std::string(data, static_cast<size_t>(len));
}

std::string encode_private_key_pem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio) {
        throw PluginError(openssl_error("cannot allocate memory BIO"));
    }
    // Traditional format keeps the PKCS#1 "RSA PRIVATE KEY" block.
    if (PEM_write_bio_PrivateKey_traditional(bio.get(), key, nullptr, nullptr, 0,
                                             nullptr, nullptr) != 1) {
        throw PluginError(openssl_error("cannot encode private key"));
    }
    return bio_contents(bio.get());
}

//------------------------------------------------------------------------------
// SSH wire encoding (RFC 4253 section 6.6): string "ssh-rsa", mpint e, mpint n
//------------------------------------------------------------------------------

void put_uint32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xff));
    out.push_back(static_cast<char>((value >> 16) & 0xff));
    out.push_back(static_cast<char>((value >> 8) & 0xff));
    out.push_back(static_cast<char>(value & 0xff));
}

void put_string(std::string& out, const std::string& value) {
    put_uint32(out, static_cast<uint32_t>(value.size()));
    out += value;
}

void put_mpint(std::string& out, const BIGNUM* bn) {
    std::vector<unsigned char> bytes(static_cast<size_t>(BN_num_bytes(bn)));
    BN_bn2bin(bn, bytes.data());
    // Positive numbers with the high bit set get a leading zero byte.
    if (!bytes.empty() && (bytes[0] & 0x80)) {
        bytes.insert(bytes.begin(), 0);
    }
    put_string(out, std::string(bytes.begin(), bytes.end()));
}

BignumPtr get_bn_param(EVP_PKEY* key, const char* param) {
    BIGNUM* raw = nullptr;
    if (EVP_PKEY_get_bn_param(key, param, &raw) != 1) {
        throw PluginError(openssl_error(std::string("cannot read RSA parameter ") + param));
    }
    return BignumPtr(raw, &BN_free);
}

std::string base64(const std::string& data) {
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

std::string encode_authorized_key(EVP_PKEY* key) {
    BignumPtr e = get_bn_param(key, OSSL_PKEY_PARAM_RSA_E);
    BignumPtr n = get_bn_param(key, OSSL_PKEY_PARAM_RSA_N);

    std::string blob;
    put_string(blob, "ssh-rsa");
    put_mpint(blob, e.get());
    put_mpint(blob, n.get());

    return "ssh-rsa " + base64(blob) + "\n";
}

} // namespace

std::string credential_bundle_name(const std::string& job_name,
                                   const std::string& job_uid,
                                   const std::string& plugin_name) {
    return job_name + "-" + job_uid + "-" + plugin_name;
}

std::string generate_ssh_config(const Job& job) {
    std::string config = "StrictHostKeyChecking no\nUserKnownHostsFile /dev/null\n";

    for (const auto& task : job.tasks) {
        const PodSpec& spec = task.pod_template.spec;
        for (int i = 0; i < task.replicas; ++i) {
            std::string hostname = spec.hostname;
            std::string subdomain = spec.subdomain;
            if (hostname.empty()) {
                hostname = make_pod_name(job.name, task.name, i);
            }
            if (subdomain.empty()) {
                subdomain = job.name;
            }

            config += "Host " + hostname + "\n";
            config += "  HostName " + hostname + "." + subdomain + "\n";

            if (!spec.hostname.empty()) {
                break;
            }
        }
    }

    return config;
}

CredentialBundle generate_credential_bundle(const Job& job) {
    PkeyPtr key = generate_rsa_key(kSshKeyBits);

    CredentialBundle bundle;
    bundle.private_key_pem = encode_private_key_pem(key.get());
    bundle.public_key_authorized = encode_authorized_key(key.get());
    bundle.config_text = generate_ssh_config(job);
    return bundle;
}

PrivateKeyInfo inspect_private_key(const std::string& private_key_pem) {
    BioPtr bio(BIO_new_mem_buf(private_key_pem.data(), static_cast<int>(private_key_pem.size())),
               &BIO_free);
    if (!bio) {
        throw PluginError(openssl_error("cannot allocate memory BIO"));
    }

    PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
    if (!key) {
        throw PluginError(openssl_error("cannot parse private key"));
    }
    if (EVP_PKEY_get_base_id(key.get()) != EVP_PKEY_RSA) {
        throw PluginError("private key is not an RSA key");
    }

    PrivateKeyInfo info;
    info.bits = EVP_PKEY_get_bits(key.get());
    info.public_key_authorized = encode_authorized_key(key.get());
    return info;
}

} // namespace plugins
} // namespace volcano
