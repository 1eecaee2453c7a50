#include <lp.strategy/lp.strategy.hpp>
#include <lp.vault.const.hpp>
#include <vault.token.hpp>

#include <eosio/time.hpp>

namespace vaultfi {

using namespace std;

void lp_strategy::init(const name& vault, const name& refueler, const bool& enabled) {
   require_auth( _self );
   CHECKC( is_account(vault),    err::ACCOUNT_INVALID, "vault account invalid: " + vault.to_string() )
   CHECKC( is_account(refueler), err::ACCOUNT_INVALID, "refueler account invalid: " + refueler.to_string() )

   _gstate.vault                 = vault;
   _gstate.refueler              = refueler;
   _gstate.enabled               = enabled;
   _gstate_changed               = true;
}

/**
 * @brief funds from the vault or the refueler
 *
 * @param memo: "deposit"  - principal deployed by the vault
 *              "interest" - realized interest topped up by the refueler
 */
void lp_strategy::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "must transfer positive quantity: " + quant.to_string() )
   auto token_bank = get_first_receiver();

   if( from == _gstate.vault && memo == "deposit" ) {
      _add_position( token_bank, quant, asset(0, quant.symbol) );
      return;
   }
   if( from == _gstate.refueler && memo == "interest" ) {
      _add_position( token_bank, asset(0, quant.symbol), quant );
      return;
   }
   CHECKC( false, err::PARAM_ERROR, "from: " + from.to_string() + " quant: " + quant.to_string() + " memo: " + memo )
}

void lp_strategy::_add_position( const name& token_bank, const asset& principal, const asset& interest ) {
   auto sym       = principal.symbol;
   auto positions = position_t::tbl_t(_self, _self.value);
   auto itr       = positions.find( sym.code().raw() );
   auto now       = time_point_sec(current_time_point());
   if( itr == positions.end() ) {
      positions.emplace( _self, [&]( auto& p ) {
         p.sym             = extended_symbol( sym, token_bank );
         p.principal       = principal;
         p.interest        = interest;
         p.total_interest  = asset(0, sym);
         p.updated_at      = now;
      });
      return;
   }

   CHECKC( itr->sym.get_contract() == token_bank, err::CONTRACT_MISMATCH, "token contract mismatch: " + token_bank.to_string() )
   CHECKC( itr->sym.get_symbol() == sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + symbol_to_string(sym) )
   positions.modify( itr, same_payer, [&]( auto& p ) {
      p.principal          += principal;
      p.interest           += interest;
      p.updated_at         = now;
   });
}

void lp_strategy::withdraw( const name& vault, const name& bank, const asset& principal, const asset& interest ) {
   require_auth( vault );
   CHECKC( vault == _gstate.vault, err::NO_AUTH, "no auth for operate" )
   CHECKC( principal.symbol == interest.symbol, err::SYMBOL_MISMATCH, "principal and interest symbol mismatch" )
   CHECKC( principal.amount >= 0 && interest.amount >= 0, err::NOT_POSITIVE, "principal and interest must not be negative" )

   auto positions = position_t::tbl_t(_self, _self.value);
   auto itr       = positions.find( principal.symbol.code().raw() );
   CHECKC( itr != positions.end(), err::RECORD_NOT_FOUND, "position not found: " + principal.symbol.code().to_string() )
   CHECKC( itr->sym.get_contract() == bank, err::CONTRACT_MISMATCH, "token contract mismatch: " + bank.to_string() )
   CHECKC( principal <= itr->principal, err::INSUFFICIENT_FUND, "principal exceeds position: " + itr->principal.to_string() )
   CHECKC( interest <= itr->interest, err::INSUFFICIENT_FUND, "interest exceeds refueled: " + itr->interest.to_string() )

   positions.modify( itr, same_payer, [&]( auto& p ) {
      p.principal          -= principal;
      p.interest           -= interest;
      p.total_interest     += interest;
      p.updated_at         = time_point_sec(current_time_point());
   });

   auto quant = principal + interest;
   if( quant.amount > 0 )
      TRANSFER( bank, vault, quant, "strategy return" )
}

asset lp_strategy::pendingintr(const symbol& sym) {
   auto positions = position_t::tbl_t(_self, _self.value);
   auto itr       = positions.find( sym.code().raw() );
   if( itr == positions.end() )
      return asset(0, sym);
   return itr->interest;
}

} //namespace vaultfi
