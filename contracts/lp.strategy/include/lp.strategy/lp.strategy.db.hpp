#pragma once

#include <eosio/asset.hpp>
#include <eosio/privileged.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <lp.vault.utils.hpp>

#include <string>

namespace vaultfi {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("lp.strategy")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("lp.strategy")]]

NTBL("global") global_t {
    name        vault                   = "lp.vault"_n;                     //only account allowed to deposit and withdraw
    name        refueler                = "vault.backend"_n;                //tops up realized interest
    bool        enabled                 = true;

    EOSLIB_SERIALIZE( global_t, (vault)(refueler)(enabled) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: _self
TBL position_t {
    extended_symbol     sym;                                                //PK: sym.code
    asset               principal;                                          //deployed by the vault
    asset               interest;                                           //refueled, not yet returned
    asset               total_interest;                                     //cumulative interest returned
    time_point_sec      updated_at;

    position_t() {}
    uint64_t primary_key()const { return sym.get_symbol().code().raw(); }

    typedef multi_index<"positions"_n, position_t> tbl_t;

    EOSLIB_SERIALIZE( position_t, (sym)(principal)(interest)(total_interest)(updated_at) )
};

} //namespace vaultfi
