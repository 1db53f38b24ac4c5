#include "llmgate/core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <random>
#include <regex>

#include <openssl/evp.h>
#include <uuid.h>

namespace llmgate::utils {

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), ::tolower);
    return result;
}

auto sha256(std::string_view data) -> std::string {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                               &EVP_MD_CTX_free);
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return {};
    }

    static constexpr std::string_view hex = "0123456789abcdef";
    std::string out;
    out.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        out += hex[hash[i] >> 4];
        out += hex[hash[i] & 0x0f];
    }
    return out;
}

auto fingerprint(std::string_view secret) -> std::string {
    if (secret.empty()) return "<empty>";
    return sha256(secret).substr(0, 8);
}

auto is_http_url(std::string_view url) -> bool {
    static const std::regex url_re(R"(^https?://[^\s/?#:]+(:\d+)?([/?#]\S*)?$)",
                                   std::regex::icase);
    return std::regex_match(url.begin(), url.end(), url_re);
}

} // namespace llmgate::utils
