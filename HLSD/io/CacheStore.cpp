#include "CacheStore.h"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <memory>

#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace {
constexpr std::size_t kKeyLength = 16;

std::string segmentName(std::uint64_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "segment_%05llu.ts", static_cast<unsigned long long>(index));
    return name;
}
}

CacheStore::CacheStore(const std::string& root, const std::string& key)
    : cacheDir((fs::path(root) / key).string()) {
}

std::string CacheStore::keyFor(const std::string& manifestUrl) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (!ctx
        || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), manifestUrl.data(), manifestUrl.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLen) != 1) {
        return {};
    }

    static const char hex[] = "0123456789abcdef";
    std::string key;
    key.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        key.push_back(hex[digest[i] >> 4]);
        key.push_back(hex[digest[i] & 0x0f]);
    }

    key.resize(kKeyLength);
    return key;
}

std::string CacheStore::defaultRoot() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg)
        return (fs::path(xdg) / "hlsd").string();
    if (const char* home = std::getenv("HOME"); home && *home)
        return (fs::path(home) / ".cache" / "hlsd").string();
    return (fs::current_path() / ".hlsd-cache").string();
}

bool CacheStore::ensureDirectory(std::string& error) {
    std::error_code ec;
    fs::create_directories(cacheDir, ec);
    if (ec || !fs::is_directory(cacheDir, ec)) {
        error = "cannot create cache directory " + cacheDir
            + (ec ? ": " + ec.message() : std::string());
        return false;
    }
    return true;
}

bool CacheStore::exists() const {
    std::error_code ec;
    return fs::exists(cacheDir, ec);
}

std::string CacheStore::segmentPath(std::uint64_t index) const {
    return (fs::path(cacheDir) / segmentName(index)).string();
}

std::uint64_t CacheStore::sizeOf(std::uint64_t index) const {
    std::error_code ec;
    const auto path = segmentPath(index);
    if (!fs::is_regular_file(path, ec))
        return 0;

    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool CacheStore::isComplete(std::uint64_t index) const {
    return sizeOf(index) > 0;
}

CacheScan CacheStore::scan(std::uint64_t totalSegments) const {
    CacheScan result;
    for (std::uint64_t i = 0; i < totalSegments; ++i) {
        const auto size = sizeOf(i);
        if (size > 0) {
            result.complete.insert(i);
            result.bytes += size;
        }
    }
    return result;
}

bool CacheStore::write(std::uint64_t index, const std::string& data, std::string& error) {
    const std::string finalPath = segmentPath(index);
    const std::string tmpPath = finalPath + ".part";

    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "cannot open " + tmpPath;
            return false;
        }

        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            error = "short write to " + tmpPath;
            out.close();
            std::error_code ignored;
            fs::remove(tmpPath, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, finalPath, ec);

    if (ec) {
        error = "cannot rename " + tmpPath + ": " + ec.message();
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        return false;
    }

    return true;
}

bool CacheStore::purge(std::string& error) {
    std::error_code ec;
    fs::remove_all(cacheDir, ec);
    if (ec) {
        error = "cannot remove " + cacheDir + ": " + ec.message();
        return false;
    }
    return true;
}
