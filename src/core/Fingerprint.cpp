#include "Fingerprint.h"
#include "JSONWriter.h"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace link_scope {

std::string sha256_hex(const std::string& data){
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    if(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
       || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
       || EVP_DigestFinal_ex(ctx.get(), md, &mdlen) != 1)
        throw std::runtime_error("SHA-256 digest failed");
    static const char* hx = "0123456789abcdef";
    std::string out; out.reserve(mdlen*2);
    for(unsigned i=0;i<mdlen;i++){ out.push_back(hx[md[i]>>4]); out.push_back(hx[md[i]&0xF]); }
    return out;
}

std::string inventory_fingerprint(const std::vector<Device>& devices){
    JSONWriter w;
    return sha256_hex(w.write_devices(devices, false));
}

}
