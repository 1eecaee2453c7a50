#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>

using namespace std;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

inline vector<string_view> split(string_view str, string_view delims = " ") {
    vector<string_view> res;
    std::size_t current, previous = 0;
    current = str.find_first_of(delims);
    while (current != std::string_view::npos) {
        res.push_back(str.substr(previous, current - previous));
        previous = current + 1;
        current = str.find_first_of(delims, previous);
    }
    res.push_back(str.substr(previous, current - previous));
    return res;
}

inline string symbol_to_string(const eosio::symbol &s) {
    return std::to_string(s.precision()) + "," + s.code().to_string();
}

inline bool is_zero_id(const eosio::checksum256& id) {
    auto bytes = id.extract_as_byte_array();
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b){ return b == 0; });
}

inline string id_to_hex(const eosio::checksum256& id) {
    static const char* digits = "0123456789abcdef";
    auto bytes = id.extract_as_byte_array();
    string hex;
    hex.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        hex += digits[(b >> 4) & 0x0f];
        hex += digits[b & 0x0f];
    }
    return hex;
}
