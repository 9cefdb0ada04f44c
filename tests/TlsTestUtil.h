#pragma once

#include <cstdio>
#include <memory>
#include <string>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace wsgate::test
{
    // Writes a fresh self-signed RSA certificate for CN=localhost and its key as PEM files.
    inline bool WriteSelfSignedCert(const std::string& certPath, const std::string& keyPath)
    {
        std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)> kctx(
            ::EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &::EVP_PKEY_CTX_free);
        if (!kctx || ::EVP_PKEY_keygen_init(kctx.get()) <= 0)
            return false;
        if (::EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048) <= 0)
            return false;

        EVP_PKEY* rawKey = nullptr;
        if (::EVP_PKEY_keygen(kctx.get(), &rawKey) <= 0)
            return false;
        std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)> key(rawKey, &::EVP_PKEY_free);

        std::unique_ptr<X509, decltype(&::X509_free)> cert(::X509_new(), &::X509_free);
        if (!cert)
            return false;

        ::X509_set_version(cert.get(), 2);
        ::ASN1_INTEGER_set(::X509_get_serialNumber(cert.get()), 1);
        ::X509_gmtime_adj(::X509_getm_notBefore(cert.get()), 0);
        ::X509_gmtime_adj(::X509_getm_notAfter(cert.get()), 3600);
        ::X509_set_pubkey(cert.get(), key.get());

        X509_NAME* name = ::X509_get_subject_name(cert.get());
        ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        ::X509_set_issuer_name(cert.get(), name);

        if (::X509_sign(cert.get(), key.get(), ::EVP_sha256()) <= 0)
            return false;

        std::unique_ptr<FILE, decltype(&::fclose)> cf(std::fopen(certPath.c_str(), "wb"), &::fclose);
        if (!cf || ::PEM_write_X509(cf.get(), cert.get()) != 1)
            return false;

        std::unique_ptr<FILE, decltype(&::fclose)> kf(std::fopen(keyPath.c_str(), "wb"), &::fclose);
        if (!kf || ::PEM_write_PrivateKey(kf.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
            return false;

        return true;
    }
}
