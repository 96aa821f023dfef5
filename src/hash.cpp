// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "cartograph/hash.hpp"

#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace cartograph {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

std::array<unsigned char, EVP_MAX_MD_SIZE> digest(std::string_view data, unsigned int &len) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }
    return out;
}

} // namespace

std::string sha256_hex(std::string_view data) {
    static constexpr char kHex[] = "0123456789abcdef";
    unsigned int len = 0;
    auto bytes = digest(data, len);

    std::string result;
    result.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        result.push_back(kHex[(bytes[i] >> 4) & 0x0F]);
        result.push_back(kHex[bytes[i] & 0x0F]);
    }
    return result;
}

SymbolUID stable_symbol_uid(RowId repo_id, std::string_view qualified_name) {
    std::string key = std::to_string(repo_id);
    key.push_back(':');
    key.append(qualified_name);

    unsigned int len = 0;
    auto bytes = digest(key, len);

    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | bytes[i];
    }
    value &= 0x7FFFFFFFFFFFFFFFULL;
    return value == 0 ? 1 : static_cast<SymbolUID>(value);
}

} // namespace cartograph
