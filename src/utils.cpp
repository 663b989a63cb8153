#include "utils.hpp"
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext new_sha256_context(){
    DigestContext ctx(EVP_MD_CTX_new());
    if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return nullptr;
    return ctx;
}

std::optional<std::string> finish_hex(EVP_MD_CTX* ctx){
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx, out.data(), &length) != 1) return std::nullopt;
    out.resize(length);
    return hex_from_bytes(out);
}

} // namespace

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string sha256_hex(const std::string& data){
    auto ctx = new_sha256_context();
    if(!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return "";
    return finish_hex(ctx.get()).value_or("");
}

std::optional<std::string> sha256_file_hex(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) return std::nullopt;
    auto ctx = new_sha256_context();
    if(!ctx) return std::nullopt;
    std::array<char, 8192> buffer{};
    while(in){
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if(got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1){
            return std::nullopt;
        }
    }
    if(in.bad()) return std::nullopt;
    return finish_hex(ctx.get());
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}
