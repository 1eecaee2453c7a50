#pragma once

#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>
#include <eosio/privileged.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <lp.vault.const.hpp>
#include <lp.vault.utils.hpp>
#include <lp.vault/lp.vault.math.hpp>

#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <type_traits>

namespace vaultfi {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("lp.vault")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("lp.vault")]]

NTBL("global") global_t {
    name                admin                   = "vault.admin"_n;
    name                registrar               = "vault.admin"_n;                  //wallet registration authority
    name                backend                 = "vault.backend"_n;                //fills withdraw requests, moves strategy funds
    name                fee_collector           = "vault.fee"_n;                    //receives the retained system fee

    uint16_t            system_fee_rate         = DEFAULT_SYSTEM_FEE_RATE;          //global default, wallets may override
    vector<uint16_t>    referral_rates          = { 500, 200 };                     //level 1 first, of the system fee
    uint8_t             max_referral_levels     = MAX_REFERRAL_LEVELS;
    bool                enabled                 = true;

    EOSLIB_SERIALIZE( global_t, (admin)(registrar)(backend)(fee_collector)
                                (system_fee_rate)(referral_rates)(max_referral_levels)(enabled) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: _self
TBL asset_state_t {
    extended_symbol     sym;                                        //PK: sym.code, e.g. 6,MUSDT@amax.mtoken
    asset               total_amount;                               //custody under vault control incl. deployed funds
    int64_t             total_lp_shares             = 0;
    asset               total_distributed_amount;                   //cumulative sent to strategies
    asset               deployed_amount;                            //currently out in strategies
    asset               pending_rewards;                            //referral rewards owed, held in custody
    asset               retained_fees;                              //cumulative fee paid to fee_collector

    asset               min_deposit;
    asset               max_deposit;
    asset               min_withdraw;
    asset               max_withdraw;
    bool                enabled_for_deposit         = true;
    bool                enabled_for_withdraw        = true;

    time_point_sec      created_at;
    time_point_sec      updated_at;

    asset_state_t() {}
    uint64_t primary_key()const { return sym.get_symbol().code().raw(); }

    asset idle_amount()const { return total_amount - deployed_amount; }
    pool_st pool()const { return pool_st{ total_amount.amount, total_lp_shares, idle_amount().amount }; }

    typedef multi_index<"assets"_n, asset_state_t> tbl_t;

    EOSLIB_SERIALIZE( asset_state_t,    (sym)(total_amount)(total_lp_shares)(total_distributed_amount)
                                        (deployed_amount)(pending_rewards)(retained_fees)
                                        (min_deposit)(max_deposit)(min_withdraw)(max_withdraw)
                                        (enabled_for_deposit)(enabled_for_withdraw)
                                        (created_at)(updated_at) )
};

//Scope: _self
TBL wallet_t {
    uint64_t                id;                                     //PK, surrogate key used as scope of the wallet's rows
    checksum256             wallet_id;                              //external 32-byte wallet identifier
    name                    owner;
    uint64_t                referrer                = 0;            //surrogate id of the referrer wallet, 0: none
    vector<uint16_t>        referral_rates;                         //empty: use global referral_rates
    optional<uint16_t>      system_fee_rate;                        //override of global system_fee_rate
    uint64_t                next_request_id         = 1;
    time_point_sec          created_at;

    wallet_t() {}
    wallet_t(const uint64_t& i): id(i) {}

    uint64_t primary_key()const { return id; }
    checksum256 by_wallet_id()const { return wallet_id; }
    uint64_t by_owner()const { return owner.value; }

    typedef multi_index<"wallets"_n, wallet_t,
        indexed_by<"bywalletid"_n, const_mem_fun<wallet_t, checksum256, &wallet_t::by_wallet_id> >,
        indexed_by<"byowner"_n,    const_mem_fun<wallet_t, uint64_t,    &wallet_t::by_owner> >
    > tbl_t;

    EOSLIB_SERIALIZE( wallet_t, (id)(wallet_id)(owner)(referrer)(referral_rates)(system_fee_rate)
                                (next_request_id)(created_at) )
};

using reward_map = std::map<eosio::symbol, asset>;

//Scope: wallet surrogate id
TBL account_asset_t {
    symbol              sym;                                        //PK: sym.code
    asset               current_amount;                             //net principal position
    asset               deposited_amount;
    int64_t             lp_amount                   = 0;            //shares held
    asset               swap_in_amount;
    asset               swap_out_amount;
    asset               distributed_amount;                         //principal currently sent to strategies
    asset               withdrawn_amount;
    asset               interest_amount;                            //gross yield attributed
    asset               interest_share_amount;                      //net yield after system fee
    asset               requested_amount;                           //locked by open withdraw requests
    reward_map          rewards;                                    //pending referral rewards by source asset
    reward_map          claimed_rewards;
    time_point_sec      created_at;
    time_point_sec      updated_at;

    account_asset_t() {}
    account_asset_t(const symbol& s, const time_point_sec& now): sym(s),
        current_amount(0, s), deposited_amount(0, s), swap_in_amount(0, s), swap_out_amount(0, s),
        distributed_amount(0, s), withdrawn_amount(0, s), interest_amount(0, s),
        interest_share_amount(0, s), requested_amount(0, s), created_at(now), updated_at(now) {}

    uint64_t primary_key()const { return sym.code().raw(); }

    position_st position()const { return position_st{ lp_amount, current_amount.amount, requested_amount.amount }; }

    typedef multi_index<"accounts"_n, account_asset_t> tbl_t;

    EOSLIB_SERIALIZE( account_asset_t,  (sym)(current_amount)(deposited_amount)(lp_amount)
                                        (swap_in_amount)(swap_out_amount)(distributed_amount)(withdrawn_amount)
                                        (interest_amount)(interest_share_amount)(requested_amount)
                                        (rewards)(claimed_rewards)(created_at)(updated_at) )
};

//Scope: wallet surrogate id
TBL withdraw_request_t {
    uint64_t            request_id;                                 //PK, increases per wallet
    checksum256         wallet_id;
    symbol              sym;
    asset               requested_amount;
    asset               available_amount;                           //sourced by backend, not yet settled
    asset               settled_amount;
    name                status                      = request_status::PENDING;
    string              error_message;
    uint64_t            version                     = 1;            //bumped on every update
    time_point_sec      requested_at;
    time_point_sec      updated_at;

    withdraw_request_t() {}
    withdraw_request_t(const uint64_t& i): request_id(i) {}

    uint64_t primary_key()const { return request_id; }
    uint128_t by_asset()const { return (uint128_t)sym.code().raw() << 64 | request_id; }
    uint64_t by_status()const { return status.value; }

    request_amounts_st amounts()const {
        return request_amounts_st{ requested_amount.amount, available_amount.amount, settled_amount.amount };
    }

    typedef multi_index<"wdrequests"_n, withdraw_request_t,
        indexed_by<"byasset"_n,  const_mem_fun<withdraw_request_t, uint128_t, &withdraw_request_t::by_asset> >,
        indexed_by<"bystatus"_n, const_mem_fun<withdraw_request_t, uint64_t,  &withdraw_request_t::by_status> >
    > tbl_t;

    EOSLIB_SERIALIZE( withdraw_request_t,   (request_id)(wallet_id)(sym)(requested_amount)(available_amount)
                                            (settled_amount)(status)(error_message)(version)
                                            (requested_at)(updated_at) )
};

//Scope: _self
TBL strategy_t {
    name                strategy;                                   //PK: strategy contract account
    name                type_tag;                                   //e.g. lending, staking
    bool                enabled                     = true;
    reward_map          deployed;                                   //principal held by the strategy per asset
    reward_map          pending_returns;                            //owed back within the current strwithdraw
    time_point_sec      created_at;

    strategy_t() {}
    strategy_t(const name& s): strategy(s) {}

    uint64_t primary_key()const { return strategy.value; }

    typedef multi_index<"strategies"_n, strategy_t> tbl_t;

    EOSLIB_SERIALIZE( strategy_t, (strategy)(type_tag)(enabled)(deployed)(pending_returns)(created_at) )
};

TBL globalidx {
    uint64_t        wallet_seq                  = 0;               // the auto-increament wallet surrogate id
    uint64_t        deposit_id                  = 0;               // the auto-increament id of deposit logs
    uint64_t        withdraw_id                 = 0;               // the auto-increament id of withdraw logs
    uint64_t        share_id                    = 0;               // the auto-increament id of fee share events
};
typedef eosio::singleton< "globalidx"_n, globalidx > global_table;

struct global_state: public globalidx {
    public:
        bool changed = false;

        using ptr_t = std::unique_ptr<global_state>;

        static ptr_t make_global(const name &contract) {
            auto ret = std::make_unique<global_state>();
            ret->_global_tbl = std::make_unique<global_table>(contract, contract.value);

            if (ret->_global_tbl->exists()) {
                static_cast<globalidx&>(*ret) = ret->_global_tbl->get();
            }
            return ret;
        }

        inline uint64_t new_auto_inc_id(uint64_t &id) {
            if (id == 0 || id == std::numeric_limits<uint64_t>::max()) {
                id = 1;
            } else {
                id++;
            }
            change();
            return id;
        }

        inline uint64_t new_wallet_id() {
            return new_auto_inc_id(wallet_seq);
        }
        inline uint64_t new_deposit_id() {
            return new_auto_inc_id(deposit_id);
        }
        inline uint64_t new_withdraw_id() {
            return new_auto_inc_id(withdraw_id);
        }
        inline uint64_t new_share_id() {
            return new_auto_inc_id(share_id);
        }
        inline void change() {
            changed = true;
        }

        inline void save(const name &payer) {
            if (changed) {
                auto &g = static_cast<globalidx&>(*this);
                _global_tbl->set(g, payer);
                changed = false;
            }
        }
    private:
        std::unique_ptr<global_table> _global_tbl;
};

//log records, carried by the notify actions only
struct deposit_log_t {
    uint64_t            id;
    name                owner;
    checksum256         wallet_id;
    extended_asset      quant;
    int64_t             shares;
    time_point_sec      created_at;

    EOSLIB_SERIALIZE( deposit_log_t, (id)(owner)(wallet_id)(quant)(shares)(created_at) )
};

struct withdraw_log_t {
    uint64_t            id;
    name                owner;
    checksum256         wallet_id;
    extended_asset      quant;
    int64_t             shares;
    vector<uint64_t>    request_ids;                                //empty for a synchronous withdraw
    time_point_sec      created_at;

    EOSLIB_SERIALIZE( withdraw_log_t, (id)(owner)(wallet_id)(quant)(shares)(request_ids)(created_at) )
};

struct referral_share_st {
    uint8_t             level;
    checksum256         wallet_id;
    name                owner;
    asset               reward;

    EOSLIB_SERIALIZE( referral_share_st, (level)(wallet_id)(owner)(reward) )
};

struct fee_share_log_t {
    uint64_t                    id;
    checksum256                 wallet_id;
    asset                       interest;
    asset                       system_fee;
    asset                       net_interest;
    vector<referral_share_st>   referral_shares;
    asset                       retained_fee;
    name                        fee_collector;
    time_point_sec              created_at;

    EOSLIB_SERIALIZE( fee_share_log_t, (id)(wallet_id)(interest)(system_fee)(net_interest)
                                       (referral_shares)(retained_fee)(fee_collector)(created_at) )
};

//read-only query results
struct withdrawal_state_st {
    asset               requested;
    asset               available;
    bool                settled;

    EOSLIB_SERIALIZE( withdrawal_state_st, (requested)(available)(settled) )
};

} //namespace vaultfi
