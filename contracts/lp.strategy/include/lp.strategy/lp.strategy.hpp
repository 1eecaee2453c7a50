#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <lp.strategy/lp.strategy.db.hpp>

namespace vaultfi {

using std::string;

using namespace eosio;

/**
 * Reference yield strategy for `lp.vault`.
 *
 * Holds the principal the vault deposits (transfer memo "deposit"), accepts interest from
 * its refueler and pays principal plus interest back to the vault on `withdraw`.
 */
class [[eosio::contract("lp.strategy")]] lp_strategy : public contract {
   public:
      using contract::contract;

   lp_strategy(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ~lp_strategy() {
      if( _gstate_changed )
         _global.set( _gstate, get_self() );
   }

   ACTION init(const name& vault, const name& refueler, const bool& enabled);

   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   ACTION withdraw( const name& vault, const name& bank, const asset& principal, const asset& interest );
   using withdraw_action      = eosio::action_wrapper<"withdraw"_n, &lp_strategy::withdraw>;

   [[eosio::action, eosio::read_only]] asset pendingintr(const symbol& sym);

   private:
      void _add_position( const name& token_bank, const asset& principal, const asset& interest );

      global_singleton     _global;
      global_t             _gstate;
      bool                          _gstate_changed = false;
};
} //namespace vaultfi
