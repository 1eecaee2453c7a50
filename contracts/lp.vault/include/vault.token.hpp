#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

#define TRANSFER(bank, to, quantity, memo) \
    {	vaultfi::token::transfer_action act{ bank, { {_self, active_perm} } };\
            act.send( _self, to, quantity , memo );}

namespace vaultfi {

using std::string;
using namespace eosio;

/**
 * Interface of a standard token bank contract, only the transfer action is used by the vault.
 */
class [[eosio::contract("vault.token")]] token : public contract {
   public:
      using contract::contract;

      [[eosio::action]]
      void transfer( const name& from, const name& to, const asset& quantity, const string& memo );

      using transfer_action = eosio::action_wrapper<"transfer"_n, &token::transfer>;
};

} //namespace vaultfi
