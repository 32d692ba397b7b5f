#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <tuple>
#include <charconv>
#include <cassert>

#include "fixsizevector.hpp"

#include "script/script.h"

#include "secp256k1_extrakeys.h"

#include "common_error.hpp"

namespace ordguard {

using std::get;
using std::move;

typedef std::vector<uint8_t> bytevector;
typedef std::vector<std::string> stringvector;

typedef cex::fixsize_vector<uint8_t, 33> compressed_pubkey;

class xonly_pubkey : public cex::fixsize_vector<uint8_t, 32>
{
public:
    typedef cex::fixsize_vector<uint8_t, 32> base;
    typedef base::base base_vector;

    xonly_pubkey() = default;
    xonly_pubkey(const xonly_pubkey&) = default;
    xonly_pubkey(xonly_pubkey&&) noexcept = default;
    xonly_pubkey(const base::base& v) : cex::fixsize_vector<uint8_t, 32>(v) {}
    xonly_pubkey(base::base&& v) noexcept : cex::fixsize_vector<uint8_t, 32>(move(v)) {}
    xonly_pubkey(const secp256k1_context *ctx, const secp256k1_xonly_pubkey &pk)
    : cex::fixsize_vector<uint8_t, 32>()
    { set(ctx, pk); }

    xonly_pubkey& operator=(const xonly_pubkey&) = default;
    xonly_pubkey& operator=(xonly_pubkey&&) = default;

    const base_vector& get_vector() const noexcept
    { return *this; }

    base_vector& get_vector() noexcept
    { return *this; }

    void set(const secp256k1_context *ctx, const secp256k1_xonly_pubkey &pk)
    {
        if (!secp256k1_xonly_pubkey_serialize(ctx, data(), &pk)) {
            throw KeyError("x-only key serialize");
        }
    }

    secp256k1_xonly_pubkey get(const secp256k1_context *ctx) const {
        secp256k1_xonly_pubkey pk;
        if (!secp256k1_xonly_pubkey_parse(ctx, &pk, data())) {
            throw KeyError("x-only key parse");
        }
        return pk;
    }
};

CScript& operator<<(CScript& script, const xonly_pubkey& pk);

extern const std::array<std::array<char, 2>, 256> byte_to_hex;

template<typename SPAN>
std::string hex(const SPAN& s)
{
    std::string res(s.size() * 2, '\0');

    char* it = res.data();
    for (uint8_t v : s) {
        *it = byte_to_hex[v][0];
        ++it;
        *it = byte_to_hex[v][1];
        ++it;
    }

    assert(it == res.data() + res.size());
    return res;
}

template<typename R>
R unhex(std::string_view str) {
    if (str.length()%2) {
        throw InputError("Wrong hex string length: " + std::string(str));
    }

    R res;
    res.resize(str.length() / 2);

    auto ins = res.begin();
    for (auto i = str.begin(); i != str.end(); i+=2) {
        uint8_t byte = 0;
        auto conv_res = std::from_chars(i, i+2, byte, 16);
        if (conv_res.ec != std::errc() || conv_res.ptr != i+2) {
            throw InputError("Wrong hex string: " + std::string(str));
        }
        *ins++ = byte;
    }
    return res;
}

}
