#include <lp.vault/lp.vault.hpp>
#include <lp.vault/lp.vault.math.hpp>
#include <lp.strategy/lp.strategy.hpp>
#include <vault.token.hpp>

#include <eosio/time.hpp>

namespace vaultfi {

using namespace std;

#define STRATEGY_WITHDRAW(strategy, bank, principal, interest) \
    {	lp_strategy::withdraw_action act{ strategy, { {_self, active_perm} } };\
            act.send( _self, bank, principal, interest );}

#define CHECK_RETURN(strategy, sym) \
    {	lp_vault::chkreturn_action act{ _self, { {_self, active_perm} } };\
            act.send( strategy, sym );}

void lp_vault::addstrategy(const name& strategy, const name& type_tag, const bool& enabled) {
   require_auth( _gstate.admin );
   CHECKC( is_account(strategy), err::ACCOUNT_INVALID, "strategy account invalid: " + strategy.to_string() )
   CHECKC( strategy != get_self(), err::ACCOUNT_INVALID, "vault cannot be its own strategy" )
   CHECKC( type_tag.value != 0, err::PARAM_ERROR, "type tag must not be empty" )

   auto strategies   = strategy_t::tbl_t(_self, _self.value);
   auto itr          = strategies.find( strategy.value );
   if( itr == strategies.end() ) {
      strategies.emplace( _self, [&]( auto& s ) {
         s.strategy     = strategy;
         s.type_tag     = type_tag;
         s.enabled      = enabled;
         s.created_at   = time_point_sec(current_time_point());
      });
   } else {
      strategies.modify( itr, same_payer, [&]( auto& s ) {
         s.type_tag     = type_tag;
         s.enabled      = enabled;
      });
   }
}

void lp_vault::strdeposit(const name& backend, const checksum256& wallet_id, const symbol& sym,
                          const name& strategy, const asset& quant) {
   require_auth( backend );
   CHECKC( backend == _gstate.backend, err::NO_AUTH, "no auth for operate" )
   CHECKC( quant.symbol == sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + quant.to_string() )
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "quantity must be positive: " + quant.to_string() )

   auto strategies   = strategy_t::tbl_t(_self, _self.value);
   auto str_itr      = strategies.find( strategy.value );
   CHECKC( str_itr != strategies.end(), err::RECORD_NOT_FOUND, "strategy not found: " + strategy.to_string() )
   CHECKC( str_itr->enabled, err::PAUSED, "strategy disabled: " + strategy.to_string() )

   auto wallet       = _get_wallet( wallet_id );
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, sym );
   CHECKC( asset_itr->idle_amount() >= quant, err::INSUFFICIENT_LIQUIDITY,
           "insufficient idle liquidity: " + asset_itr->idle_amount().to_string() )

   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( sym.code().raw() );
   CHECKC( acct_itr != accounts.end(), err::RECORD_NOT_FOUND, "no position in asset: " + sym.code().to_string() )
   auto undistributed = acct_itr->current_amount - acct_itr->distributed_amount;
   CHECKC( undistributed >= quant, err::INSUFFICIENT_FUND, "insufficient undistributed principal: " + undistributed.to_string() )

   auto now          = time_point_sec(current_time_point());
   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      a.distributed_amount          += quant;
      a.updated_at                  = now;
   });
   assets.modify( asset_itr, same_payer, [&]( auto& s ) {
      s.deployed_amount             += quant;
      s.total_distributed_amount    += quant;
      s.updated_at                  = now;
   });
   strategies.modify( str_itr, same_payer, [&]( auto& s ) {
      if( s.deployed.count(sym) == 0 )
         s.deployed[sym] = quant;
      else
         s.deployed[sym] += quant;
   });

   TRANSFER( asset_itr->sym.get_contract(), strategy, quant, "deposit" )
}

/**
 * @brief takes `principal` back from `strategy` together with the realized `interest`
 *
 * The strategy returns both in one transfer within this transaction, `chkreturn` runs after
 * the strategy's withdraw and aborts the transaction when the transfer did not arrive.
 */
void lp_vault::strwithdraw(const name& backend, const checksum256& wallet_id, const symbol& sym,
                           const name& strategy, const asset& principal, const asset& interest) {
   require_auth( backend );
   CHECKC( backend == _gstate.backend, err::NO_AUTH, "no auth for operate" )
   CHECKC( principal.symbol == sym && interest.symbol == sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + symbol_to_string(sym) )
   CHECKC( principal.amount >= 0 && interest.amount >= 0, err::NOT_POSITIVE, "principal and interest must not be negative" )
   CHECKC( principal.amount + interest.amount > 0, err::NOT_POSITIVE, "nothing to withdraw from strategy" )

   auto strategies   = strategy_t::tbl_t(_self, _self.value);
   auto str_itr      = strategies.find( strategy.value );
   CHECKC( str_itr != strategies.end(), err::RECORD_NOT_FOUND, "strategy not found: " + strategy.to_string() )
   auto deployed     = str_itr->deployed.count(sym) ? str_itr->deployed.at(sym) : asset(0, sym);
   CHECKC( principal <= deployed, err::INSUFFICIENT_FUND, "principal exceeds strategy deployed: " + deployed.to_string() )

   auto wallet       = _get_wallet( wallet_id );
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, sym );
   auto token_bank   = asset_itr->sym.get_contract();

   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( sym.code().raw() );
   CHECKC( acct_itr != accounts.end(), err::RECORD_NOT_FOUND, "no position in asset: " + sym.code().to_string() )
   CHECKC( principal <= acct_itr->distributed_amount, err::INSUFFICIENT_FUND,
           "principal exceeds wallet distributed: " + acct_itr->distributed_amount.to_string() )
   CHECKC( principal <= asset_itr->deployed_amount, err::SYSTEM_ERROR, "principal exceeds pool deployed" )

   auto now          = time_point_sec(current_time_point());
   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      a.distributed_amount          -= principal;
      a.updated_at                  = now;
   });
   assets.modify( asset_itr, same_payer, [&]( auto& s ) {
      s.deployed_amount             -= principal;
      s.updated_at                  = now;
   });
   auto owed         = principal + interest;
   strategies.modify( str_itr, same_payer, [&]( auto& s ) {
      if( principal.amount > 0 ) {
         s.deployed[sym] -= principal;
         if( s.deployed[sym].amount == 0 ) s.deployed.erase( sym );
      }
      if( s.pending_returns.count(sym) == 0 )
         s.pending_returns[sym] = owed;
      else
         s.pending_returns[sym] += owed;
   });

   STRATEGY_WITHDRAW( strategy, token_bank, principal, interest )

   if( interest.amount > 0 )
      _distribute_interest( wallet, assets, interest );

   CHECK_RETURN( strategy, sym )
}

void lp_vault::_onstrategyreturn( const name& strategy, const name& token_bank, const asset& quant ) {
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, quant.symbol );
   CHECKC( asset_itr->sym.get_contract() == token_bank, err::CONTRACT_MISMATCH, "token contract mismatch: " + token_bank.to_string() )

   auto strategies   = strategy_t::tbl_t(_self, _self.value);
   auto str_itr      = strategies.find( strategy.value );
   auto owed         = str_itr->pending_returns;
   auto code         = book_strategy_return( owed, quant );
   CHECKC( code != err::PARAM_ERROR, code, "nothing owed by strategy: " + strategy.to_string() )
   CHECKC( code == err::NONE, code, "strategy returned more than owed: " + str_itr->pending_returns.at(quant.symbol).to_string() )

   strategies.modify( str_itr, same_payer, [&]( auto& s ) {
      s.pending_returns             = owed;
   });
}

void lp_vault::chkreturn(const name& strategy, const symbol& sym) {
   require_auth( get_self() );

   auto strategies   = strategy_t::tbl_t(_self, _self.value);
   auto str_itr      = strategies.find( strategy.value );
   CHECKC( str_itr != strategies.end(), err::RECORD_NOT_FOUND, "strategy not found: " + strategy.to_string() )
   auto code         = check_strategy_returned( str_itr->pending_returns, sym );
   CHECKC( code == err::NONE, code, "strategy did not return: " + str_itr->pending_returns.at(sym).to_string() )
}

} //namespace vaultfi
