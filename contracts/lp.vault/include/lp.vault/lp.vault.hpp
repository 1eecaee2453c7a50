#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <lp.vault/lp.vault.db.hpp>

namespace vaultfi {

using std::string;
using std::vector;

using namespace eosio;

/**
 * The `lp.vault` contract pools user deposits per asset and accounts them as LP shares.
 *
 * Deposits arrive as token transfers with memo `deposit` and mint shares at the current
 * exchange rate (total_amount / total_lp_shares). Withdrawals either burn shares immediately
 * (`withdraw`, `redeemall`) or go through withdraw requests that a backend account fills
 * over time (`reqwithdraw`, `setreqstatus`, `wdrequested`).
 *
 * Idle custody can be deployed to registered strategy contracts (`strdeposit`). When a
 * strategy returns funds with realized interest (`strwithdraw`), the system fee is taken
 * from the interest and split across the depositor's referral chain; referrers claim their
 * pending rewards with `claimreward`.
 */
class [[eosio::contract("lp.vault")]] lp_vault : public contract {
   public:
      using contract::contract;

   lp_vault(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value),
        _global_state(global_state::make_global(get_self()))
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ~lp_vault() {
      if( _gstate_changed )
         _global.set( _gstate, get_self() );
      _global_state->save(get_self());
   }

   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   //admin
   ACTION init(const name& admin, const name& registrar, const name& backend, const name& fee_collector, const bool& enabled);
   ACTION setfeeconf(const uint16_t& system_fee_rate, const vector<uint16_t>& referral_rates, const uint8_t& max_referral_levels);
   ACTION addasset(const extended_symbol& sym, const asset& min_deposit, const asset& max_deposit,
                   const asset& min_withdraw, const asset& max_withdraw);
   ACTION setasset(const symbol& sym, const asset& min_deposit, const asset& max_deposit,
                   const asset& min_withdraw, const asset& max_withdraw,
                   const bool& enabled_for_deposit, const bool& enabled_for_withdraw);
   ACTION addstrategy(const name& strategy, const name& type_tag, const bool& enabled);
   ACTION setwalletfee(const checksum256& wallet_id, const optional<uint16_t>& system_fee_rate, const vector<uint16_t>& referral_rates);

   //registrar
   ACTION regwallet(const name& registrar, const checksum256& wallet_id, const name& owner, const checksum256& referrer_id);

   //user
   ACTION withdraw(const name& owner, const asset& quant);
   ACTION redeemall(const name& owner, const symbol& sym);
   ACTION reqwithdraw(const name& owner, const asset& quant);
   ACTION wdrequested(const name& owner, const symbol& sym);
   ACTION cancelreq(const name& owner, const uint64_t& request_id);
   ACTION claimreward(const name& owner, const symbol& sym);

   //backend
   ACTION setreqstatus(const name& backend, const checksum256& wallet_id, const uint64_t& request_id,
                       const asset& available_add, const name& status, const string& error_message,
                       const uint64_t& expected_version);
   ACTION strdeposit(const name& backend, const checksum256& wallet_id, const symbol& sym,
                     const name& strategy, const asset& quant);
   ACTION strwithdraw(const name& backend, const checksum256& wallet_id, const symbol& sym,
                      const name& strategy, const asset& principal, const asset& interest);

   //queries
   [[eosio::action, eosio::read_only]] withdrawal_state_st getwdstate(const checksum256& wallet_id, const symbol& sym);
   [[eosio::action, eosio::read_only]] vector<withdraw_request_t> getwdreqs(const checksum256& wallet_id, const name& status);
   [[eosio::action, eosio::read_only]] asset_state_t getasset(const symbol& sym);
   [[eosio::action, eosio::read_only]] vector<asset_state_t> getassets();
   [[eosio::action, eosio::read_only]] reward_map getpendrefs(const checksum256& wallet_id);

   //logs
   ACTION depositlog(const deposit_log_t& log);
   using depositlog_action    = action_wrapper<"depositlog"_n,    &lp_vault::depositlog>;
   ACTION withdrawlog(const withdraw_log_t& log);
   using withdrawlog_action   = action_wrapper<"withdrawlog"_n,   &lp_vault::withdrawlog>;
   ACTION reqlog(const name& owner, const withdraw_request_t& req);
   using reqlog_action        = action_wrapper<"reqlog"_n,        &lp_vault::reqlog>;
   ACTION reqstatuslog(const name& owner, const withdraw_request_t& req);
   using reqstatuslog_action  = action_wrapper<"reqstatuslog"_n,  &lp_vault::reqstatuslog>;
   ACTION sharelog(const fee_share_log_t& log);
   using sharelog_action      = action_wrapper<"sharelog"_n,      &lp_vault::sharelog>;

   //asserts a strategy paid back everything owed by `strwithdraw`, sent after the strategy's withdraw
   ACTION chkreturn(const name& strategy, const symbol& sym);
   using chkreturn_action     = action_wrapper<"chkreturn"_n,     &lp_vault::chkreturn>;

   private:
      void _ondeposit( const name& from, const name& token_bank, const asset& quant );
      void _onstrategyreturn( const name& strategy, const name& token_bank, const asset& quant );

      int64_t _burn_shares( const wallet_t& wallet, asset_state_t::tbl_t& assets, const asset& quant );
      void _payout( const wallet_t& wallet, const name& token_bank, const asset& quant, const int64_t& shares,
                    const vector<uint64_t>& request_ids );
      void _update_request( const wallet_t& wallet, withdraw_request_t::tbl_t& requests,
                            const withdraw_request_t::tbl_t::const_iterator& req_itr,
                            const asset& available_add, const name& status, const string& error_message );

      void _distribute_interest( const wallet_t& wallet, asset_state_t::tbl_t& assets, const asset& interest );
      void _credit_reward( const wallet_t& referrer, const asset& reward );

      wallet_t _get_wallet( const checksum256& wallet_id );
      wallet_t _get_owner_wallet( const name& owner );
      asset_state_t::tbl_t::const_iterator _get_asset_itr( asset_state_t::tbl_t& assets, const symbol& sym );
      void _check_limits( const symbol& sym, const asset& min_quant, const asset& max_quant );
      void _check_range( const asset& quant, const asset& min_quant, const asset& max_quant );
      void _check_fee_rate( const uint16_t& rate );

      global_singleton     _global;
      global_t             _gstate;
      bool                 _gstate_changed = false;
      global_state::ptr_t  _global_state;
};

#define NOTIFY_DEPOSIT_LOG( log ) \
     { lp_vault::depositlog_action act{ _self, { {_self, active_perm} } };\
            act.send( log );}

#define NOTIFY_WITHDRAW_LOG( log ) \
     { lp_vault::withdrawlog_action act{ _self, { {_self, active_perm} } };\
            act.send( log );}

#define NOTIFY_REQ_LOG( owner, req ) \
     { lp_vault::reqlog_action act{ _self, { {_self, active_perm} } };\
            act.send( owner, req );}

#define NOTIFY_REQ_STATUS_LOG( owner, req ) \
     { lp_vault::reqstatuslog_action act{ _self, { {_self, active_perm} } };\
            act.send( owner, req );}

#define NOTIFY_SHARE_LOG( log ) \
     { lp_vault::sharelog_action act{ _self, { {_self, active_perm} } };\
            act.send( log );}

} //namespace vaultfi
