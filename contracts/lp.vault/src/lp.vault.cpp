#include <lp.vault/lp.vault.hpp>
#include <lp.vault/lp.vault.math.hpp>
#include <vault.token.hpp>

#include <eosio/time.hpp>

namespace vaultfi {

using namespace std;

void lp_vault::init(const name& admin, const name& registrar, const name& backend, const name& fee_collector, const bool& enabled) {
   require_auth( _self );
   CHECKC( is_account(admin),          err::ACCOUNT_INVALID, "admin account invalid: " + admin.to_string() )
   CHECKC( is_account(registrar),      err::ACCOUNT_INVALID, "registrar account invalid: " + registrar.to_string() )
   CHECKC( is_account(backend),        err::ACCOUNT_INVALID, "backend account invalid: " + backend.to_string() )
   CHECKC( is_account(fee_collector),  err::ACCOUNT_INVALID, "fee collector account invalid: " + fee_collector.to_string() )

   _gstate.admin                    = admin;
   _gstate.registrar                = registrar;
   _gstate.backend                  = backend;
   _gstate.fee_collector            = fee_collector;
   _gstate.enabled                  = enabled;
   _gstate_changed                  = true;
}

void lp_vault::setfeeconf(const uint16_t& system_fee_rate, const vector<uint16_t>& referral_rates, const uint8_t& max_referral_levels) {
   require_auth( _gstate.admin );
   _check_fee_rate( system_fee_rate );
   CHECKC( max_referral_levels > 0 && max_referral_levels <= MAX_REFERRAL_LEVELS, err::PARAM_ERROR,
           "max referral levels must be in range [1, " + to_string(MAX_REFERRAL_LEVELS) + "]" )
   check_referral_rates( referral_rates, max_referral_levels );

   _gstate.system_fee_rate          = system_fee_rate;
   _gstate.referral_rates           = referral_rates;
   _gstate.max_referral_levels      = max_referral_levels;
   _gstate_changed                  = true;
}

void lp_vault::addasset(const extended_symbol& sym, const asset& min_deposit, const asset& max_deposit,
                        const asset& min_withdraw, const asset& max_withdraw) {
   require_auth( _gstate.admin );
   auto symb = sym.get_symbol();
   CHECKC( symb.is_valid(), err::PARAM_ERROR, "invalid symbol: " + symbol_to_string(symb) )
   CHECKC( is_account(sym.get_contract()), err::ACCOUNT_INVALID, "token contract invalid: " + sym.get_contract().to_string() )
   _check_limits( symb, min_deposit, max_deposit );
   _check_limits( symb, min_withdraw, max_withdraw );

   auto assets = asset_state_t::tbl_t(_self, _self.value);
   CHECKC( assets.find(symb.code().raw()) == assets.end(), err::RECORD_EXISTING, "asset already exists: " + symb.code().to_string() )

   auto now = time_point_sec(current_time_point());
   auto zero = asset(0, symb);
   assets.emplace( _self, [&]( auto& s ) {
      s.sym                         = sym;
      s.total_amount                = zero;
      s.total_distributed_amount    = zero;
      s.deployed_amount             = zero;
      s.pending_rewards             = zero;
      s.retained_fees               = zero;
      s.min_deposit                 = min_deposit;
      s.max_deposit                 = max_deposit;
      s.min_withdraw                = min_withdraw;
      s.max_withdraw                = max_withdraw;
      s.created_at                  = now;
      s.updated_at                  = now;
   });
}

void lp_vault::setasset(const symbol& sym, const asset& min_deposit, const asset& max_deposit,
                        const asset& min_withdraw, const asset& max_withdraw,
                        const bool& enabled_for_deposit, const bool& enabled_for_withdraw) {
   require_auth( _gstate.admin );
   _check_limits( sym, min_deposit, max_deposit );
   _check_limits( sym, min_withdraw, max_withdraw );

   auto assets    = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr = _get_asset_itr( assets, sym );
   assets.modify( asset_itr, same_payer, [&]( auto& s ) {
      s.min_deposit                 = min_deposit;
      s.max_deposit                 = max_deposit;
      s.min_withdraw                = min_withdraw;
      s.max_withdraw                = max_withdraw;
      s.enabled_for_deposit         = enabled_for_deposit;
      s.enabled_for_withdraw        = enabled_for_withdraw;
      s.updated_at                  = time_point_sec(current_time_point());
   });
}

void lp_vault::regwallet(const name& registrar, const checksum256& wallet_id, const name& owner, const checksum256& referrer_id) {
   require_auth( registrar );
   CHECKC( registrar == _gstate.registrar, err::NO_AUTH, "no auth for operate" )
   CHECKC( !is_zero_id(wallet_id), err::PARAM_ERROR, "wallet id must not be zero" )
   CHECKC( is_account(owner), err::ACCOUNT_INVALID, "owner account invalid: " + owner.to_string() )

   auto wallets      = wallet_t::tbl_t(_self, _self.value);
   auto id_idx       = wallets.get_index<"bywalletid"_n>();
   CHECKC( id_idx.find(wallet_id) == id_idx.end(), err::RECORD_EXISTING, "wallet already registered: " + id_to_hex(wallet_id) )
   auto owner_idx    = wallets.get_index<"byowner"_n>();
   CHECKC( owner_idx.find(owner.value) == owner_idx.end(), err::RECORD_EXISTING, "owner already has a wallet: " + owner.to_string() )

   uint64_t referrer = 0;
   if( !is_zero_id(referrer_id) ) {
      auto ref_itr   = id_idx.find( referrer_id );
      CHECKC( ref_itr != id_idx.end(), err::RECORD_NOT_FOUND, "referrer wallet not found: " + id_to_hex(referrer_id) )
      referrer       = ref_itr->id;
   }

   wallets.emplace( _self, [&]( auto& w ) {
      w.id              = _global_state->new_wallet_id();
      w.wallet_id       = wallet_id;
      w.owner           = owner;
      w.referrer        = referrer;
      w.created_at      = time_point_sec(current_time_point());
   });
}

void lp_vault::setwalletfee(const checksum256& wallet_id, const optional<uint16_t>& system_fee_rate, const vector<uint16_t>& referral_rates) {
   require_auth( _gstate.admin );
   if( system_fee_rate )
      _check_fee_rate( *system_fee_rate );
   check_referral_rates( referral_rates, _gstate.max_referral_levels );

   auto wallet       = _get_wallet( wallet_id );
   auto wallets      = wallet_t::tbl_t(_self, _self.value);
   auto wallet_itr   = wallets.find( wallet.id );
   wallets.modify( wallet_itr, same_payer, [&]( auto& w ) {
      w.system_fee_rate = system_fee_rate;
      w.referral_rates  = referral_rates;
   });
}

/**
 * @brief incoming transfers
 *
 * @param memo: "deposit" - owner deposits into the pool of the transferred asset
 *        transfers from a registered strategy are the principal and interest owed by `strwithdraw`
 */
void lp_vault::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC( from != to, err::ACCOUNT_INVALID, "cannot transfer to self" );
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "must transfer positive quantity: " + quant.to_string() )
   auto token_bank = get_first_receiver();

   auto strategies = strategy_t::tbl_t(_self, _self.value);
   if( strategies.find(from.value) != strategies.end() ) {
      _onstrategyreturn( from, token_bank, quant );
      return;
   }

   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   vector<string_view> params = split(memo, ":");
   CHECKC( params.size() == 1 && params[0] == "deposit", err::MEMO_FORMAT_ERROR, "invalid memo format: " + memo )
   _ondeposit( from, token_bank, quant );
}

void lp_vault::_ondeposit( const name& from, const name& token_bank, const asset& quant ) {
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, quant.symbol );
   CHECKC( asset_itr->sym.get_contract() == token_bank, err::CONTRACT_MISMATCH, "token contract mismatch: " + token_bank.to_string() )
   CHECKC( asset_itr->enabled_for_deposit, err::PAUSED, "deposit disabled: " + quant.symbol.code().to_string() )
   _check_range( quant, asset_itr->min_deposit, asset_itr->max_deposit );

   auto wallet       = _get_owner_wallet( from );
   auto shares       = shares_for_deposit( quant.amount, asset_itr->total_amount.amount, asset_itr->total_lp_shares );
   CHECKC( shares > 0, err::INCORRECT_AMOUNT, "deposit too small to mint shares: " + quant.to_string() )

   auto now          = time_point_sec(current_time_point());
   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( quant.symbol.code().raw() );
   if( acct_itr == accounts.end() ) {
      acct_itr = accounts.emplace( _self, [&]( auto& a ) {
         a = account_asset_t( quant.symbol, now );
      });
   }
   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      a.current_amount              += quant;
      a.deposited_amount            += quant;
      a.lp_amount                   += shares;
      a.updated_at                  = now;
   });

   assets.modify( asset_itr, same_payer, [&]( auto& s ) {
      s.total_amount                += quant;
      s.total_lp_shares             += shares;
      s.updated_at                  = now;
   });
   check_ledger( asset_itr->total_amount.amount, asset_itr->total_lp_shares );

   deposit_log_t log;
   log.id            = _global_state->new_deposit_id();
   log.owner         = from;
   log.wallet_id     = wallet.wallet_id;
   log.quant         = extended_asset( quant, token_bank );
   log.shares        = shares;
   log.created_at    = now;
   NOTIFY_DEPOSIT_LOG( log )
}

void lp_vault::withdraw(const name& owner, const asset& quant) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "withdraw quantity must be positive: " + quant.to_string() )

   auto wallet       = _get_owner_wallet( owner );
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, quant.symbol );
   CHECKC( asset_itr->enabled_for_withdraw, err::PAUSED, "withdraw disabled: " + quant.symbol.code().to_string() )
   _check_range( quant, asset_itr->min_withdraw, asset_itr->max_withdraw );

   auto token_bank   = asset_itr->sym.get_contract();
   auto shares       = _burn_shares( wallet, assets, quant );
   _payout( wallet, token_bank, quant, shares, {} );
}

void lp_vault::redeemall(const name& owner, const symbol& sym) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   auto wallet       = _get_owner_wallet( owner );
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, sym );
   CHECKC( asset_itr->enabled_for_withdraw, err::PAUSED, "withdraw disabled: " + sym.code().to_string() )

   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( sym.code().raw() );
   CHECKC( acct_itr != accounts.end() && acct_itr->lp_amount > 0, err::INSUFFICIENT_SHARES, "no shares to redeem" )

   auto shares       = acct_itr->lp_amount;
   auto quant        = asset( amount_for_shares(shares, asset_itr->total_amount.amount, asset_itr->total_lp_shares), sym );
   CHECKC( quant.amount > 0, err::INCORRECT_AMOUNT, "shares redeem to nothing" )
   _check_range( quant, asset_itr->min_withdraw, asset_itr->max_withdraw );

   auto token_bank   = asset_itr->sym.get_contract();
   CHECKC( _burn_shares( wallet, assets, quant ) == shares, err::SYSTEM_ERROR, "redeem must burn every share" )
   _payout( wallet, token_bank, quant, shares, {} );
}

/**
 * Burns the shares of `wallet` paying out `quant` and returns them.
 * The wallet's own entitlement is checked before the pool's idle liquidity.
 */
int64_t lp_vault::_burn_shares( const wallet_t& wallet, asset_state_t::tbl_t& assets, const asset& quant ) {
   auto asset_itr    = _get_asset_itr( assets, quant.symbol );
   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( quant.symbol.code().raw() );
   CHECKC( acct_itr != accounts.end(), err::INSUFFICIENT_SHARES, "no shares in asset: " + quant.symbol.code().to_string() )

   auto pool         = asset_itr->pool();
   auto position     = acct_itr->position();
   auto plan         = plan_withdraw( quant.amount, position, pool );
   CHECKC( plan.code != err::INSUFFICIENT_SHARES, err::INSUFFICIENT_SHARES,
           "insufficient shares for " + quant.to_string() + ": " + to_string(acct_itr->lp_amount) )
   CHECKC( plan.code != err::INSUFFICIENT_LIQUIDITY, err::INSUFFICIENT_LIQUIDITY,
           "insufficient idle liquidity: " + asset_itr->idle_amount().to_string() )
   CHECKC( plan.code != err::INSUFFICIENT_FUND, err::INSUFFICIENT_FUND,
           "amount locked by withdraw requests: " + acct_itr->requested_amount.to_string() )
   CHECKC( plan.code == err::NONE, plan.code, "invalid withdraw: " + quant.to_string() )
   apply_withdraw( pool, position, quant.amount, plan );

   auto now          = time_point_sec(current_time_point());
   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      a.lp_amount                   = position.lp_amount;
      a.current_amount.amount       = position.current_amount;
      a.withdrawn_amount            += quant;
      a.updated_at                  = now;
   });
   assets.modify( asset_itr, same_payer, [&]( auto& s ) {
      s.total_amount.amount         = pool.total_amount;
      s.total_lp_shares             = pool.total_shares;
      s.updated_at                  = now;
   });
   return plan.shares;
}

void lp_vault::_payout( const wallet_t& wallet, const name& token_bank, const asset& quant, const int64_t& shares,
                        const vector<uint64_t>& request_ids ) {
   TRANSFER( token_bank, wallet.owner, quant, "withdraw" )

   withdraw_log_t log;
   log.id            = _global_state->new_withdraw_id();
   log.owner         = wallet.owner;
   log.wallet_id     = wallet.wallet_id;
   log.quant         = extended_asset( quant, token_bank );
   log.shares        = shares;
   log.request_ids   = request_ids;
   log.created_at    = time_point_sec(current_time_point());
   NOTIFY_WITHDRAW_LOG( log )
}

void lp_vault::claimreward(const name& owner, const symbol& sym) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   auto wallet       = _get_owner_wallet( owner );
   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   auto acct_itr     = accounts.find( sym.code().raw() );
   CHECKC( acct_itr != accounts.end(), err::RECORD_NOT_FOUND, "no rewards in asset: " + sym.code().to_string() )
   auto reward_itr   = acct_itr->rewards.find( sym );
   CHECKC( reward_itr != acct_itr->rewards.end() && reward_itr->second.amount > 0, err::RECORD_NOT_FOUND,
           "no pending rewards in asset: " + sym.code().to_string() )
   auto reward       = reward_itr->second;

   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   auto asset_itr    = _get_asset_itr( assets, sym );
   CHECKC( asset_itr->pending_rewards >= reward, err::SYSTEM_ERROR, "pending rewards underflow" )

   auto now          = time_point_sec(current_time_point());
   accounts.modify( acct_itr, same_payer, [&]( auto& a ) {
      a.rewards.erase( sym );
      if( a.claimed_rewards.count(sym) == 0 )
         a.claimed_rewards[sym] = reward;
      else
         a.claimed_rewards[sym] += reward;
      a.updated_at                  = now;
   });
   assets.modify( asset_itr, same_payer, [&]( auto& s ) {
      s.pending_rewards             -= reward;
      s.updated_at                  = now;
   });

   TRANSFER( asset_itr->sym.get_contract(), owner, reward, "referral reward" )
}

asset_state_t lp_vault::getasset(const symbol& sym) {
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   return *_get_asset_itr( assets, sym );
}

vector<asset_state_t> lp_vault::getassets() {
   auto assets       = asset_state_t::tbl_t(_self, _self.value);
   vector<asset_state_t> res;
   for( auto itr = assets.begin(); itr != assets.end(); itr++ ) {
      res.push_back( *itr );
   }
   return res;
}

reward_map lp_vault::getpendrefs(const checksum256& wallet_id) {
   auto wallet       = _get_wallet( wallet_id );
   auto accounts     = account_asset_t::tbl_t(_self, wallet.id);
   reward_map res;
   for( auto itr = accounts.begin(); itr != accounts.end(); itr++ ) {
      for( auto& reward : itr->rewards ) {
         if( res.count(reward.first) == 0 )
            res[reward.first] = reward.second;
         else
            res[reward.first] += reward.second;
      }
   }
   return res;
}

wallet_t lp_vault::_get_wallet( const checksum256& wallet_id ) {
   auto wallets      = wallet_t::tbl_t(_self, _self.value);
   auto id_idx       = wallets.get_index<"bywalletid"_n>();
   auto itr          = id_idx.find( wallet_id );
   CHECKC( itr != id_idx.end(), err::RECORD_NOT_FOUND, "wallet not found: " + id_to_hex(wallet_id) )
   return *itr;
}

wallet_t lp_vault::_get_owner_wallet( const name& owner ) {
   auto wallets      = wallet_t::tbl_t(_self, _self.value);
   auto owner_idx    = wallets.get_index<"byowner"_n>();
   auto itr          = owner_idx.find( owner.value );
   CHECKC( itr != owner_idx.end(), err::RECORD_NOT_FOUND, "wallet not registered for: " + owner.to_string() )
   return *itr;
}

asset_state_t::tbl_t::const_iterator lp_vault::_get_asset_itr( asset_state_t::tbl_t& assets, const symbol& sym ) {
   auto itr = assets.find( sym.code().raw() );
   CHECKC( itr != assets.end(), err::RECORD_NOT_FOUND, "asset not supported: " + sym.code().to_string() )
   CHECKC( itr->sym.get_symbol() == sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + symbol_to_string(sym) )
   return itr;
}

void lp_vault::_check_limits( const symbol& sym, const asset& min_quant, const asset& max_quant ) {
   CHECKC( min_quant.symbol == sym && max_quant.symbol == sym, err::SYMBOL_MISMATCH, "limit symbol mismatch: " + symbol_to_string(sym) )
   CHECKC( min_quant.amount > 0, err::NOT_POSITIVE, "min limit must be positive: " + min_quant.to_string() )
   CHECKC( min_quant <= max_quant, err::PARAM_ERROR, "min limit exceeds max limit: " + max_quant.to_string() )
}

void lp_vault::_check_range( const asset& quant, const asset& min_quant, const asset& max_quant ) {
   CHECKC( quant.symbol == min_quant.symbol && quant.symbol == max_quant.symbol, err::SYMBOL_MISMATCH,
           "limit symbol mismatch: " + quant.to_string() )
   CHECKC( in_range(quant.amount, min_quant.amount, max_quant.amount), err::INCORRECT_AMOUNT,
           "amount out of range [" + min_quant.to_string() + ", " + max_quant.to_string() + "]: " + quant.to_string() )
}

void lp_vault::_check_fee_rate( const uint16_t& rate ) {
   CHECKC( rate <= PCT_BOOST, err::OVERSIZED, "fee rate must be <= " + to_string(PCT_BOOST) )
}

void lp_vault::depositlog(const deposit_log_t& log) {
   require_auth(get_self());
   require_recipient(log.owner);
}

void lp_vault::withdrawlog(const withdraw_log_t& log) {
   require_auth(get_self());
   require_recipient(log.owner);
}

void lp_vault::reqlog(const name& owner, const withdraw_request_t& req) {
   require_auth(get_self());
   require_recipient(owner);
}

void lp_vault::reqstatuslog(const name& owner, const withdraw_request_t& req) {
   require_auth(get_self());
   require_recipient(owner);
}

void lp_vault::sharelog(const fee_share_log_t& log) {
   require_auth(get_self());
   require_recipient(log.fee_collector);
}

} //namespace vaultfi
