#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

namespace vaultfi {

using namespace eosio;

/**
 * Strategy side of the gateway. Funds reach a strategy as a token transfer
 * from the vault with memo "deposit"; `withdraw` returns principal plus
 * realized interest to the vault within the same transaction.
 */
class [[eosio::contract("lp.strategy")]] lp_strategy : public contract {
   public:
      using contract::contract;

      [[eosio::action]]
      void withdraw( const name& vault, const name& bank, const asset& principal, const asset& interest );

      using withdraw_action      = eosio::action_wrapper<"withdraw"_n, &lp_strategy::withdraw>;
};
} //namespace vaultfi
