#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include <eosio/eosio.hpp>

#include <lp.vault.const.hpp>
#include <lp.vault.utils.hpp>
#include "safemath.hpp"

namespace vaultfi {

using std::string;
using std::vector;
using namespace safemath;

inline int64_t to_amount( const uint128_t& v ) {
   CHECKC( v <= (uint128_t)std::numeric_limits<int64_t>::max(), err::OVERSIZED, "amount overflow" )
   return (int64_t)v;
}

inline void check_ledger( const int64_t& total_amount, const int64_t& total_shares ) {
   CHECKC( total_amount >= 0 && total_shares >= 0, err::SYSTEM_ERROR, "ledger totals must not be negative" )
   CHECKC( total_shares == 0 || total_amount > 0, err::SYSTEM_ERROR, "pool has shares but no amount" )
}

/**
 * LP shares minted for a deposit of `amount`.
 * The first depositor (no shares outstanding) gets one share per unit,
 * afterwards floor(amount * total_shares / total_amount).
 */
inline int64_t shares_for_deposit( const int64_t& amount, const int64_t& total_amount, const int64_t& total_shares ) {
   CHECKC( amount >= 0, err::NOT_POSITIVE, "amount must not be negative" )
   check_ledger( total_amount, total_shares );
   if( total_shares == 0 )
      return amount;

   return to_amount( mul_div_down( amount, total_shares, total_amount ) );
}

/**
 * Asset amount represented by `shares`, rounded down.
 */
inline int64_t amount_for_shares( const int64_t& shares, const int64_t& total_amount, const int64_t& total_shares ) {
   CHECKC( shares >= 0, err::NOT_POSITIVE, "shares must not be negative" )
   check_ledger( total_amount, total_shares );
   if( total_shares == 0 )
      return 0;

   CHECKC( shares <= total_shares, err::SYSTEM_ERROR, "shares exceed total shares" )
   return to_amount( mul_div_down( shares, total_amount, total_shares ) );
}

/**
 * Shares that must be burned to pay out exactly `amount`, rounded up so the
 * burned shares always cover the payout.
 */
inline int64_t shares_for_withdraw( const int64_t& amount, const int64_t& total_amount, const int64_t& total_shares ) {
   CHECKC( amount >= 0, err::NOT_POSITIVE, "amount must not be negative" )
   check_ledger( total_amount, total_shares );
   CHECKC( total_shares > 0, err::INSUFFICIENT_SHARES, "no shares outstanding" )
   CHECKC( amount <= total_amount, err::SYSTEM_ERROR, "amount exceeds pool amount" )

   return to_amount( mul_div_up( amount, total_shares, total_amount ) );
}

//principal released when `shares` of a position holding `lp_amount` are burned
inline int64_t principal_for_shares( const int64_t& shares, const int64_t& lp_amount, const int64_t& current_amount ) {
   CHECKC( shares >= 0 && lp_amount >= 0 && current_amount >= 0, err::SYSTEM_ERROR, "negative position" )
   CHECKC( shares <= lp_amount, err::INSUFFICIENT_SHARES, "shares exceed position" )
   if( shares == lp_amount )
      return current_amount;

   return to_amount( mul_div_down( current_amount, shares, lp_amount ) );
}

struct pool_st {
   int64_t     total_amount   = 0;
   int64_t     total_shares   = 0;
   int64_t     idle_amount    = 0;        //not deployed to strategies
};

struct position_st {
   int64_t     lp_amount         = 0;
   int64_t     current_amount    = 0;
   int64_t     requested_amount  = 0;     //locked by open withdraw requests
};

struct withdraw_plan_st {
   err         code        = err::NONE;
   int64_t     shares      = 0;
   int64_t     principal   = 0;
};

inline bool in_range( const int64_t& amount, const int64_t& min_amount, const int64_t& max_amount ) {
   return amount >= min_amount && amount <= max_amount;
}

/**
 * Shares burned and principal released when `position` pays out `amount`.
 * What the position's shares are worth is checked first (INSUFFICIENT_SHARES),
 * then whether the pool holds enough undeployed funds (INSUFFICIENT_LIQUIDITY),
 * then the principal left must still cover the request lock (INSUFFICIENT_FUND).
 * Paying out the whole entitlement burns every share of the position.
 */
inline withdraw_plan_st plan_withdraw( const int64_t& amount, const position_st& position, const pool_st& pool ) {
   withdraw_plan_st plan;
   if( amount <= 0 ) {
      plan.code = err::NOT_POSITIVE;
      return plan;
   }
   auto entitled = position.lp_amount > 0 ? amount_for_shares( position.lp_amount, pool.total_amount, pool.total_shares ) : 0;
   if( entitled < amount ) {
      plan.code = err::INSUFFICIENT_SHARES;
      return plan;
   }
   if( pool.idle_amount < amount ) {
      plan.code = err::INSUFFICIENT_LIQUIDITY;
      return plan;
   }

   plan.shares    = entitled == amount ? position.lp_amount : shares_for_withdraw( amount, pool.total_amount, pool.total_shares );
   plan.principal = principal_for_shares( plan.shares, position.lp_amount, position.current_amount );
   if( position.current_amount - plan.principal < position.requested_amount )
      plan.code = err::INSUFFICIENT_FUND;
   return plan;
}

inline void apply_withdraw( pool_st& pool, position_st& position, const int64_t& amount, const withdraw_plan_st& plan ) {
   CHECKC( plan.code == err::NONE, err::SYSTEM_ERROR, "withdraw plan rejected" )
   position.lp_amount         -= plan.shares;
   position.current_amount    -= plan.principal;
   pool.total_amount          -= amount;
   pool.total_shares          -= plan.shares;
   pool.idle_amount           -= amount;
   check_ledger( pool.total_amount, pool.total_shares );
}

//locks `amount` of the unlocked principal for a withdraw request
inline err lock_request( position_st& position, const int64_t& amount ) {
   if( amount <= 0 ) return err::NOT_POSITIVE;
   if( position.current_amount - position.requested_amount < amount ) return err::INSUFFICIENT_FUND;
   position.requested_amount += amount;
   return err::NONE;
}

inline void unlock_request( position_st& position, const int64_t& amount ) {
   CHECKC( amount >= 0 && amount <= position.requested_amount, err::SYSTEM_ERROR, "locked amount underflow" )
   position.requested_amount -= amount;
}

inline int64_t calc_system_fee( const int64_t& interest, const uint16_t& fee_rate ) {
   CHECKC( interest >= 0, err::NOT_POSITIVE, "interest must not be negative" )
   CHECKC( fee_rate <= PCT_BOOST, err::OVERSIZED, "fee rate must be <= " + to_string(PCT_BOOST) )
   return to_amount( mul_div_down( interest, fee_rate, PCT_BOOST ) );
}

struct referral_split_st {
   vector<int64_t>   rewards;          //level 1 first
   int64_t           retained  = 0;    //system fee kept by the fee collector
};

inline void check_referral_rates( const vector<uint16_t>& rates, const uint8_t& max_levels ) {
   CHECKC( rates.size() <= max_levels, err::OVERSIZED, "too many referral levels: " + to_string(rates.size()) )
   uint32_t total = 0;
   for( auto& rate : rates ) {
      total += rate;
   }
   CHECKC( total <= PCT_BOOST, err::OVERSIZED, "sum of referral rates exceeds " + to_string(PCT_BOOST) )
}

/**
 * Split `system_fee` across a referral chain of `chain_length` referrers.
 * Level i gets system_fee * rates[i] / PCT_BOOST. Levels beyond the chain
 * receive nothing and their share stays in `retained`.
 */
/**
 * Referrer chain of a wallet, level 1 first, at most `max_levels` deep.
 * `load_referrer(id, next)` sets `next` to the referrer of wallet `id` and returns
 * false when the wallet does not exist, which ends the chain.
 */
template<typename Loader>
inline vector<uint64_t> referral_chain( uint64_t referrer, const size_t& max_levels, Loader&& load_referrer ) {
   vector<uint64_t> chain;
   while( referrer != 0 && chain.size() < max_levels ) {
      uint64_t next = 0;
      if( !load_referrer( referrer, next ) ) break;
      chain.push_back( referrer );
      referrer = next;
   }
   return chain;
}

inline referral_split_st calc_referral_shares( const int64_t& system_fee, const vector<uint16_t>& rates, const size_t& chain_length ) {
   CHECKC( system_fee >= 0, err::NOT_POSITIVE, "system fee must not be negative" )

   referral_split_st split;
   split.retained = system_fee;
   auto levels = std::min( rates.size(), chain_length );
   for( size_t i = 0; i < levels; i++ ) {
      auto reward = to_amount( mul_div_down( system_fee, rates[i], PCT_BOOST ) );
      CHECKC( reward <= split.retained, err::SYSTEM_ERROR, "referral rewards exceed system fee" )
      split.rewards.push_back( reward );
      split.retained -= reward;
   }
   return split;
}

struct request_amounts_st {
   int64_t     requested   = 0;
   int64_t     available   = 0;
   int64_t     settled     = 0;
};

/**
 * Validates a backend status update of a withdraw request.
 * Returns err::NONE when the transition is allowed.
 */
inline err check_request_update( const name& current_status, const name& new_status, const int64_t& available_add,
                                 const request_amounts_st& amounts, const string& error_message ) {
   if( is_terminal_status(current_status) )
      return err::STATUS_ERROR;
   if( available_add < 0 )
      return err::NOT_POSITIVE;
   if( amounts.settled + amounts.available + available_add > amounts.requested )
      return err::OVERSIZED;

   if( new_status == request_status::PENDING ) {
      if( !error_message.empty() ) return err::PARAM_ERROR;
      if( available_add == 0 )     return err::PARAM_ERROR;
      return err::NONE;
   }
   if( new_status == request_status::SUCCESS ) {
      if( !error_message.empty() ) return err::PARAM_ERROR;
      if( amounts.settled + amounts.available + available_add != amounts.requested )
         return err::INCORRECT_AMOUNT;
      return err::NONE;
   }
   if( new_status == request_status::FAILED ) {
      if( error_message.empty() || error_message.size() > MAX_ERROR_MSG_SIZE ) return err::PARAM_ERROR;
      if( available_add > 0 )      return err::PARAM_ERROR;
      return err::NONE;
   }
   return err::STATUS_ERROR;
}

//applies an update accepted by check_request_update, returns the amount unlocked from the position
inline int64_t apply_request_update( request_amounts_st& amounts, const name& new_status, const int64_t& available_add ) {
   if( new_status == request_status::FAILED ) {
      amounts.available = 0;
      return amounts.requested - amounts.settled;
   }
   amounts.available += available_add;
   return 0;
}

/**
 * Moves the available amount of a request into settled and returns it.
 * A pending request becomes success once its settled amount reaches the requested amount.
 */
inline int64_t settle_request( request_amounts_st& amounts, name& status ) {
   auto paid = amounts.available;
   amounts.settled   += paid;
   amounts.available = 0;
   if( status == request_status::PENDING && amounts.settled == amounts.requested )
      status = request_status::SUCCESS;
   return paid;
}

//books a strategy transfer against what the strategy owes
inline err book_strategy_return( std::map<symbol, asset>& owed, const asset& returned ) {
   if( returned.amount <= 0 ) return err::NOT_POSITIVE;
   auto itr = owed.find( returned.symbol );
   if( itr == owed.end() ) return err::PARAM_ERROR;
   if( returned.amount > itr->second.amount ) return err::INCORRECT_AMOUNT;

   itr->second.amount -= returned.amount;
   if( itr->second.amount == 0 )
      owed.erase( itr );
   return err::NONE;
}

inline err check_strategy_returned( const std::map<symbol, asset>& owed, const symbol& sym ) {
   return owed.count( sym ) ? err::INCORRECT_AMOUNT : err::NONE;
}

} //namespace vaultfi
