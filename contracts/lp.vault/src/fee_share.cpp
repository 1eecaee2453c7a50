#include <lp.vault/lp.vault.hpp>
#include <lp.vault/lp.vault.math.hpp>
#include <vault.token.hpp>

#include <eosio/time.hpp>

namespace vaultfi {

using namespace std;

/**
 * @brief splits realized interest of `wallet` into the system fee and the net interest
 *
 * The net interest stays in the pool and raises the share price. The system fee is shared
 * along the referrer chain, level 1 first, the remainder is paid to the fee collector.
 * Referral rewards stay in custody as pending until the referrer claims them.
 */
void lp_vault::_distribute_interest( const wallet_t& wallet, asset_state_t::tbl_t& assets, const asset& interest ) {
   auto sym          = interest.symbol;
   auto asset_itr    = _get_asset_itr( assets, sym );
   auto token_bank   = asset_itr->sym.get_contract();

   auto fee_rate     = wallet.system_fee_rate ? *wallet.system_fee_rate : _gstate.system_fee_rate;
   const auto& rates = wallet.referral_rates.empty() ? _gstate.referral_rates : wallet.referral_rates;
   auto system_fee   = asset( calc_system_fee(interest.amount, fee_rate), sym );
   auto net_interest = interest - system_fee;

   //a schedule accepted under a higher level cap is cut to the current cap
   auto levels       = std::min( rates.size(), (size_t)_gstate.max_referral_levels );
   vector<wallet_t> chain;
   auto wallets      = wallet_t::tbl_t(_self, _self.value);
   referral_chain( wallet.referrer, levels, [&]( const uint64_t& id, uint64_t& next ) {
      auto ref_itr   = wallets.find( id );
      if( ref_itr == wallets.end() ) return false;
      chain.push_back( *ref_itr );
      next           = ref_itr->referrer;
      return true;
   });

   auto split        = calc_referral_shares( system_fee.amount, rates, chain.size() );
   auto now          = time_point_sec(current_time_point());

   fee_share_log_t log;
   log.id            = _global_state->new_share_id();
   log.wallet_id     = wallet.wallet_id;
   log.interest      = interest;
   log.system_fee    = system_fee;
   log.net_interest  = net_interest;
   log.retained_fee  = asset( split.retained, sym );
   log.fee_collector = _gstate.fee_collector;
   log.created_at    = now;

   auto referral_total = asset(0, sym);
   for( size_t i = 0; i < split.rewards.size(); i++ ) {
      auto reward    = asset( split.rewards[i], sym );
      if( reward.amount > 0 )
         _credit_reward( chain[i], reward );
      referral_total += reward;
      log.referral_shares.push_back( referral_share_st{ (uint8_t)(i + 1), chain[i].wallet_id, chain[i].owner, reward } );
   }

   assets.modify( asset_itr, same_payer, [&]( auto& s ) {
      s.total_amount                += net_interest;
      s.pending_rewards             += referral_total;
      s.retained_fees               += log.retained_fee;
      s.updated_at                  = now;
   });
   check_ledger( asset_itr->total_amount.amount, asset_itr->total_lp_shares );

   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( sym.code().raw() );
   CHECKC( acct_itr != accounts.end(), err::SYSTEM_ERROR, "interest earner position not found" )
   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      a.interest_amount             += interest;
      a.interest_share_amount       += net_interest;
      a.updated_at                  = now;
   });

   if( log.retained_fee.amount > 0 )
      TRANSFER( token_bank, _gstate.fee_collector, log.retained_fee, "system fee" )

   NOTIFY_SHARE_LOG( log )
}

void lp_vault::_credit_reward( const wallet_t& referrer, const asset& reward ) {
   auto now          = time_point_sec(current_time_point());
   auto accounts     = account_asset_t::tbl_t(_self, referrer.id);
   auto acct_itr     = accounts.find( reward.symbol.code().raw() );
   if( acct_itr == accounts.end() ) {
      acct_itr = accounts.emplace( _self, [&]( auto& a ) {
         a = account_asset_t( reward.symbol, now );
      });
   }
   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      if( a.rewards.count(reward.symbol) == 0 )
         a.rewards[reward.symbol] = reward;
      else
         a.rewards[reward.symbol] += reward;
      a.updated_at                  = now;
   });
}

} //namespace vaultfi
