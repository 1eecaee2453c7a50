#pragma once

#include <cstdint>
#include <eosio/name.hpp>
#include <eosio/asset.hpp>

namespace vaultfi {

using namespace eosio;

static constexpr uint16_t  PCT_BOOST               = 10000;
static constexpr uint16_t  DEFAULT_SYSTEM_FEE_RATE = 1000;          //10%
static constexpr uint8_t   MAX_REFERRAL_LEVELS     = 5;
static constexpr uint32_t  MAX_ERROR_MSG_SIZE      = 256;

static constexpr eosio::name active_perm           {"active"_n};

enum class err: uint8_t {
   NONE                    = 0,
   RECORD_NOT_FOUND        = 1,
   RECORD_EXISTING         = 2,
   CONTRACT_MISMATCH       = 3,
   SYMBOL_MISMATCH         = 4,
   PARAM_ERROR             = 5,
   MEMO_FORMAT_ERROR       = 6,
   PAUSED                  = 7,
   NO_AUTH                 = 8,
   NOT_POSITIVE            = 9,
   OVERSIZED               = 11,
   ACCOUNT_INVALID         = 15,
   STATUS_ERROR            = 18,
   INCORRECT_AMOUNT        = 19,
   INSUFFICIENT_SHARES     = 23,
   INSUFFICIENT_LIQUIDITY  = 24,
   INSUFFICIENT_FUND       = 25,
   NO_AVAILABLE_AMOUNT     = 26,
   CONCURRENT_MODIFICATION = 27,
   SYSTEM_ERROR            = 200
};

//withdraw request status
namespace request_status {
   static constexpr eosio::name PENDING     = "pending"_n;
   static constexpr eosio::name SUCCESS     = "success"_n;
   static constexpr eosio::name FAILED      = "failed"_n;
}

inline bool is_terminal_status( const name& status ) {
   return status == request_status::SUCCESS || status == request_status::FAILED;
}

} //namespace vaultfi
