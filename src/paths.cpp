#include "paths.hpp"
#include <stdexcept>

std::string normalize_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/')
            continue;
        out += c;
    }
    if (out.size() > 1 && out.back() == '/')
        out.pop_back();
    return out;
}

std::string join_path(const std::string& base, const std::string& relative) {
    std::string b = normalize_path(base);
    std::string r = normalize_path(relative);
    while (!r.empty() && r.front() == '/') r.erase(r.begin());
    if (b.empty()) return r;
    if (r.empty()) return b;
    if (b.back() == '/') return b + r;
    return b + "/" + r;
}

std::string parent_path(const std::string& path) {
    std::string p = normalize_path(path);
    auto pos = p.rfind('/');
    if (pos == std::string::npos) return "";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

std::string base_name(const std::string& path) {
    std::string p = normalize_path(path);
    auto pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string relative_to(const std::string& path, const std::string& root) {
    std::string p = normalize_path(path);
    std::string r = normalize_path(root);
    if (r.empty() || r == ".") {
        if (p.rfind("./", 0) == 0) p.erase(0, 2);
        while (!p.empty() && p.front() == '/') p.erase(p.begin());
        return p;
    }
    if (p.compare(0, r.size(), r) != 0)
        throw std::invalid_argument("path " + p + " is not under " + r);
    std::string rest = p.substr(r.size());
    if (!rest.empty() && rest.front() != '/' && r.back() != '/')
        throw std::invalid_argument("path " + p + " is not under " + r);
    while (!rest.empty() && rest.front() == '/') rest.erase(rest.begin());
    return rest;
}

bool is_valid_utf8(const std::string& path) {
    std::size_t i = 0;
    const std::size_t n = path.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(path[i]);
        std::size_t len = 0;
        unsigned int cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(path[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += len;
    }
    return true;
}
