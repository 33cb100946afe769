#include "crypto.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <unordered_map>

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// hashlib spellings that libcrypto registers under another name
const EVP_MD* lookup_digest(const std::string& algorithm) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"blake2b", "BLAKE2b512"},
        {"blake2s", "BLAKE2s256"},
    };

    std::string name = algorithm;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (auto it = aliases.find(name); it != aliases.end())
        name = it->second;

    if (const EVP_MD* md = EVP_get_digestbyname(name.c_str()))
        return md;
    std::replace(name.begin(), name.end(), '_', '-');
    return EVP_get_digestbyname(name.c_str());
}

class Digest {
public:
    explicit Digest(const std::string& algorithm)
        : ctx_(EVP_MD_CTX_new())
    {
        const EVP_MD* md = lookup_digest(algorithm);
        if (md == nullptr)
            throw UnsupportedAlgorithm(algorithm);
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1)
            throw ManifestlyError("failed to initialise digest " + algorithm);
    }

    void update(const char* data, std::size_t len) {
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1)
            throw ManifestlyError("digest update failed");
    }

    std::string hexdigest() {
        std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1)
            throw ManifestlyError("digest finalisation failed");
        out.resize(len);
        return hex_encode(out);
    }

private:
    md_ctx_ptr ctx_;
};

} // namespace

std::string hash_stream(std::istream& in, const std::string& algorithm, std::size_t chunk_size) {
    Digest digest(algorithm);
    std::vector<char> buffer(chunk_size == 0 ? 8192 : chunk_size);
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        digest.update(buffer.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad())
        throw ManifestlyError("read error while hashing");
    return digest.hexdigest();
}

std::string hash_string(const std::string& data, const std::string& algorithm) {
    Digest digest(algorithm);
    digest.update(data.data(), data.size());
    return digest.hexdigest();
}

bool is_supported_algorithm(const std::string& algorithm) {
    return lookup_digest(algorithm) != nullptr;
}

std::string hex_encode(const std::vector<unsigned char>& data) {
    std::ostringstream oss;
    for (auto byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return oss.str();
}
