#pragma once

#include <eosio/eosio.hpp>

namespace vaultfi { namespace safemath {
    // a * b / c, rounded down
    inline uint128_t mul_div_down(uint128_t a, uint128_t b, uint128_t c) {
        return a * b / c;
    }

    // a * b / c, rounded up
    inline uint128_t mul_div_up(uint128_t a, uint128_t b, uint128_t c) {
        uint128_t tmp = a * b;
        return tmp / c + (tmp % c == 0 ? 0 : 1);
    }

} } //safemath
