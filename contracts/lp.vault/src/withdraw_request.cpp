#include <lp.vault/lp.vault.hpp>
#include <lp.vault/lp.vault.math.hpp>

#include <eosio/time.hpp>

namespace vaultfi {

using namespace std;

static inline uint128_t asset_request_key( const symbol& sym, const uint64_t& request_id ) {
   return (uint128_t)sym.code().raw() << 64 | request_id;
}

void lp_vault::reqwithdraw(const name& owner, const asset& quant) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "request quantity must be positive: " + quant.to_string() )

   auto wallet       = _get_owner_wallet( owner );
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, quant.symbol );
   CHECKC( asset_itr->enabled_for_withdraw, err::PAUSED, "withdraw disabled: " + quant.symbol.code().to_string() )
   _check_range( quant, asset_itr->min_withdraw, asset_itr->max_withdraw );

   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( quant.symbol.code().raw() );
   CHECKC( acct_itr != accounts.end(), err::INSUFFICIENT_FUND, "no position in asset: " + quant.symbol.code().to_string() )
   auto position     = acct_itr->position();
   CHECKC( lock_request( position, quant.amount ) == err::NONE, err::INSUFFICIENT_FUND,
           "insufficient fund: " + (acct_itr->current_amount - acct_itr->requested_amount).to_string() )

   auto wallets      = wallet_t::tbl_t(_self, _self.value);
   auto wallet_itr   = wallets.find( wallet.id );
   auto request_id   = wallet_itr->next_request_id;
   wallets.modify( wallet_itr, same_payer, [&]( auto& w ) {
      w.next_request_id++;
   });

   auto now          = time_point_sec(current_time_point());
   auto zero         = asset(0, quant.symbol);
   auto requests     = withdraw_request_t::tbl_t(_self, wallet.id);
   auto req_itr      = requests.emplace( _self, [&]( auto& r ) {
      r.request_id                  = request_id;
      r.wallet_id                   = wallet.wallet_id;
      r.sym                         = quant.symbol;
      r.requested_amount            = quant;
      r.available_amount            = zero;
      r.settled_amount              = zero;
      r.status                      = request_status::PENDING;
      r.version                     = 1;
      r.requested_at                = now;
      r.updated_at                  = now;
   });

   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      a.requested_amount.amount     = position.requested_amount;
      a.updated_at                  = now;
   });

   NOTIFY_REQ_LOG( owner, *req_itr )
}

void lp_vault::setreqstatus(const name& backend, const checksum256& wallet_id, const uint64_t& request_id,
                            const asset& available_add, const name& status, const string& error_message,
                            const uint64_t& expected_version) {
   require_auth( backend );
   CHECKC( backend == _gstate.backend, err::NO_AUTH, "no auth for operate" )

   auto wallet       = _get_wallet( wallet_id );
   auto requests     = withdraw_request_t::tbl_t(_self, wallet.id);
   auto req_itr      = requests.find( request_id );
   CHECKC( req_itr != requests.end(), err::RECORD_NOT_FOUND, "withdraw request not found: " + to_string(request_id) )
   CHECKC( available_add.symbol == req_itr->sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + available_add.to_string() )
   CHECKC( req_itr->version == expected_version, err::CONCURRENT_MODIFICATION,
           "request version changed: " + to_string(req_itr->version) + " != " + to_string(expected_version) )

   _update_request( wallet, requests, req_itr, available_add, status, error_message );
}

void lp_vault::cancelreq(const name& owner, const uint64_t& request_id) {
   require_auth( owner );

   auto wallet       = _get_owner_wallet( owner );
   auto requests     = withdraw_request_t::tbl_t(_self, wallet.id);
   auto req_itr      = requests.find( request_id );
   CHECKC( req_itr != requests.end(), err::RECORD_NOT_FOUND, "withdraw request not found: " + to_string(request_id) )
   CHECKC( req_itr->available_amount.amount == 0, err::STATUS_ERROR, "request has available amount, settle it first" )

   _update_request( wallet, requests, req_itr, asset(0, req_itr->sym), request_status::FAILED, "cancelled by owner" );
}

void lp_vault::_update_request( const wallet_t& wallet, withdraw_request_t::tbl_t& requests,
                                const withdraw_request_t::tbl_t::const_iterator& req_itr,
                                const asset& available_add, const name& status, const string& error_message ) {
   auto amounts      = req_itr->amounts();
   auto code         = check_request_update( req_itr->status, status, available_add.amount, amounts, error_message );
   CHECKC( code == err::NONE, code, "invalid withdraw request update: " + req_itr->status.to_string() + " -> " + status.to_string() )

   auto unlocked     = apply_request_update( amounts, status, available_add.amount );
   auto now          = time_point_sec(current_time_point());
   requests.modify( req_itr, same_payer, [&]( auto& r ) {
      r.available_amount.amount     = amounts.available;
      if( status == request_status::FAILED )
         r.error_message            = error_message;
      r.status                      = status;
      r.version++;
      r.updated_at                  = now;
   });

   if( unlocked > 0 ) {
      auto accounts  = account_asset_t::tbl_t(_self, wallet.id);
      auto acct_itr  = accounts.find( req_itr->sym.code().raw() );
      CHECKC( acct_itr != accounts.end(), err::SYSTEM_ERROR, "locked position not found" )
      auto position  = acct_itr->position();
      unlock_request( position, unlocked );
      accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
         a.requested_amount.amount  = position.requested_amount;
         a.updated_at               = now;
      });
   }

   NOTIFY_REQ_STATUS_LOG( wallet.owner, *req_itr )
}

/**
 * Settles the available amount of every request of `owner` in `sym`.
 * A pending request becomes success once its settled amount reaches the requested amount.
 */
void lp_vault::wdrequested(const name& owner, const symbol& sym) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   auto wallet       = _get_owner_wallet( owner );
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, sym );
   CHECKC( asset_itr->enabled_for_withdraw, err::PAUSED, "withdraw disabled: " + sym.code().to_string() )
   auto token_bank   = asset_itr->sym.get_contract();

   auto now          = time_point_sec(current_time_point());
   auto total        = asset(0, sym);
   vector<uint64_t> request_ids;
   auto requests     = withdraw_request_t::tbl_t(_self, wallet.id);
   auto asset_idx    = requests.get_index<"byasset"_n>();
   auto upper_key    = asset_request_key( sym, std::numeric_limits<uint64_t>::max() );
   for( auto itr = asset_idx.lower_bound( asset_request_key(sym, 0) ); itr != asset_idx.end() && itr->by_asset() <= upper_key; itr++ ) {
      if( itr->available_amount.amount == 0 ) continue;

      auto amounts   = itr->amounts();
      auto status    = itr->status;
      total.amount   += settle_request( amounts, status );
      request_ids.push_back( itr->request_id );
      asset_idx.modify( itr, same_payer, [&]( auto& r ) {
         r.settled_amount.amount    = amounts.settled;
         r.available_amount.amount  = amounts.available;
         r.status                   = status;
         r.version++;
         r.updated_at               = now;
      });
   }
   CHECKC( total.amount > 0, err::NO_AVAILABLE_AMOUNT, "no available amount to withdraw: " + sym.code().to_string() )

   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( sym.code().raw() );
   CHECKC( acct_itr != accounts.end(), err::SYSTEM_ERROR, "locked position not found" )
   auto position     = acct_itr->position();
   unlock_request( position, total.amount );
   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      a.requested_amount.amount     = position.requested_amount;
   });

   auto shares       = _burn_shares( wallet, assets, total );
   _payout( wallet, token_bank, total, shares, request_ids );
}

withdrawal_state_st lp_vault::getwdstate(const checksum256& wallet_id, const symbol& sym) {
   auto wallet       = _get_wallet( wallet_id );

   withdrawal_state_st state;
   state.requested   = asset(0, sym);
   state.available   = asset(0, sym);
   auto requests     = withdraw_request_t::tbl_t(_self, wallet.id);
   auto asset_idx    = requests.get_index<"byasset"_n>();
   auto upper_key    = asset_request_key( sym, std::numeric_limits<uint64_t>::max() );
   for( auto itr = asset_idx.lower_bound( asset_request_key(sym, 0) ); itr != asset_idx.end() && itr->by_asset() <= upper_key; itr++ ) {
      //open: still pending or holding an unsettled available amount
      if( itr->status != request_status::PENDING && itr->available_amount.amount == 0 ) continue;
      state.requested   += itr->requested_amount;
      state.available   += itr->available_amount;
   }
   state.settled     = state.requested.amount == 0;
   return state;
}

vector<withdraw_request_t> lp_vault::getwdreqs(const checksum256& wallet_id, const name& status) {
   CHECKC( status == request_status::PENDING || is_terminal_status(status), err::PARAM_ERROR, "invalid status: " + status.to_string() )
   auto wallet       = _get_wallet( wallet_id );

   vector<withdraw_request_t> res;
   auto requests     = withdraw_request_t::tbl_t(_self, wallet.id);
   auto status_idx   = requests.get_index<"bystatus"_n>();
   for( auto itr = status_idx.lower_bound( status.value ); itr != status_idx.end() && itr->status == status; itr++ ) {
      res.push_back( *itr );
   }
   return res;
}

} //namespace vaultfi
