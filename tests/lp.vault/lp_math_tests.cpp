#include <eosio/tester.hpp>

#include <cstring>

#include <lp.vault/lp.vault.math.hpp>

using namespace eosio;
using namespace eosio::native;
using namespace vaultfi;

EOSIO_TEST_BEGIN(first_deposit_test)
   // empty pool mints one share per unit
   CHECK_EQUAL( shares_for_deposit(1000, 0, 0), 1000 )
   // second depositor at 1:1
   CHECK_EQUAL( shares_for_deposit(500, 1000, 1000), 500 )
   // dust left behind after every share burned still mints 1:1
   CHECK_EQUAL( shares_for_deposit(300, 7, 0), 300 )
   CHECK_EQUAL( shares_for_deposit(0, 1000, 1000), 0 )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(exchange_rate_test)
   // pool earned 100 interest, rate 1100/1000
   CHECK_EQUAL( amount_for_shares(500, 1100, 1000), 550 )
   CHECK_EQUAL( amount_for_shares(1000, 1100, 1000), 1100 )
   CHECK_EQUAL( shares_for_deposit(1100, 1100, 1000), 1000 )
   // floor on both directions
   CHECK_EQUAL( shares_for_deposit(1, 1100, 1000), 0 )
   CHECK_EQUAL( amount_for_shares(1, 1100, 1000), 1 )
   CHECK_EQUAL( amount_for_shares(3, 1000, 1100), 2 )
   CHECK_EQUAL( amount_for_shares(0, 0, 0), 0 )
   CHECK_EQUAL( amount_for_shares(10, 1000, 0), 0 )

   // burning for an exact payout rounds up
   CHECK_EQUAL( shares_for_withdraw(550, 1100, 1000), 500 )
   CHECK_EQUAL( shares_for_withdraw(1, 1100, 1000), 1 )
   CHECK_EQUAL( shares_for_withdraw(40, 100, 100), 40 )
   CHECK_EQUAL( shares_for_withdraw(1100, 1100, 1000), 1000 )

   // large totals go through 128-bit intermediates
   int64_t big = 4000000000000000000LL;
   CHECK_EQUAL( shares_for_deposit(big, big, big), big )
   CHECK_EQUAL( amount_for_shares(big / 2, big, big), big / 2 )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(share_monotonicity_test)
   const int64_t total_amount = 1337;
   const int64_t total_shares = 1000;
   int64_t last_shares = 0;
   int64_t last_amount = 0;
   for( int64_t x = 0; x <= 3000; x++ ) {
      auto shares = shares_for_deposit( x, total_amount, total_shares );
      REQUIRE_EQUAL( shares >= last_shares, true )
      last_shares = shares;
   }
   for( int64_t s = 0; s <= total_shares; s++ ) {
      auto amount = amount_for_shares( s, total_amount, total_shares );
      REQUIRE_EQUAL( amount >= last_amount, true )
      last_amount = amount;
   }
EOSIO_TEST_END

EOSIO_TEST_BEGIN(round_trip_bound_test)
   const int64_t totals[][2] = { {1000, 1000}, {1100, 1000}, {1000, 1100}, {999983, 7}, {7, 999983} };
   for( auto& t : totals ) {
      for( int64_t x = 1; x <= 2000; x++ ) {
         auto shares = shares_for_deposit( x, t[0], t[1] );
         // the minted shares become part of the pool before they are valued
         auto amount = amount_for_shares( shares, t[0] + x, t[1] + shares );
         REQUIRE_EQUAL( amount <= x, true )

         if( x <= t[0] ) {
            // paying out exactly x never burns fewer shares than x is worth
            auto burned = shares_for_withdraw( x, t[0], t[1] );
            REQUIRE_EQUAL( amount_for_shares(burned, t[0], t[1]) >= x, true )
         }
      }
   }
EOSIO_TEST_END

EOSIO_TEST_BEGIN(principal_release_test)
   CHECK_EQUAL( principal_for_shares(500, 1000, 1000), 500 )
   CHECK_EQUAL( principal_for_shares(1000, 1000, 1000), 1000 )
   CHECK_EQUAL( principal_for_shares(1, 3, 10), 3 )
   // the last share takes the remaining principal
   CHECK_EQUAL( principal_for_shares(3, 3, 10), 10 )
   CHECK_EQUAL( principal_for_shares(0, 3, 10), 0 )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(ledger_guard_test)
   CHECK_ASSERT( "[[200]] amount exceeds pool amount", ([]() {
      shares_for_withdraw( 1200, 1100, 1000 );
   }) )
   CHECK_ASSERT( "[[23]] no shares outstanding", ([]() {
      shares_for_withdraw( 10, 1000, 0 );
   }) )
   CHECK_ASSERT( "[[23]] shares exceed position", ([]() {
      principal_for_shares( 4, 3, 10 );
   }) )
   CHECK_ASSERT( "[[200]] pool has shares but no amount", ([]() {
      shares_for_deposit( 10, 0, 5 );
   }) )
   CHECK_ASSERT( "[[200]] ledger totals must not be negative", ([]() {
      amount_for_shares( 1, -1, 5 );
   }) )
   CHECK_ASSERT( "[[200]] shares exceed total shares", ([]() {
      amount_for_shares( 6, 100, 5 );
   }) )
   CHECK_ASSERT( "[[9]] amount must not be negative", ([]() {
      shares_for_deposit( -1, 100, 100 );
   }) )
   CHECK_ASSERT( "[[11]] amount overflow", ([]() {
      to_amount( (uint128_t)std::numeric_limits<int64_t>::max() + 1 );
   }) )
EOSIO_TEST_END

static position_st position_of( int64_t lp_amount, int64_t current_amount, int64_t requested_amount ) {
   position_st position;
   position.lp_amount         = lp_amount;
   position.current_amount    = current_amount;
   position.requested_amount  = requested_amount;
   return position;
}

static pool_st pool_of( int64_t total_amount, int64_t total_shares, int64_t idle_amount ) {
   pool_st pool;
   pool.total_amount = total_amount;
   pool.total_shares = total_shares;
   pool.idle_amount  = idle_amount;
   return pool;
}

static int64_t deposit_into( pool_st& pool, position_st& position, int64_t amount ) {
   auto shares = shares_for_deposit( amount, pool.total_amount, pool.total_shares );
   pool.total_amount          += amount;
   pool.total_shares          += shares;
   pool.idle_amount           += amount;
   position.lp_amount         += shares;
   position.current_amount    += amount;
   return shares;
}

EOSIO_TEST_BEGIN(withdraw_error_order_test)
   // 100 shares in a 1000/1000 pool asking for 5000 is short on shares, not on liquidity
   auto pool      = pool_of( 1000, 1000, 1000 );
   auto position  = position_of( 100, 100, 0 );
   CHECK_EQUAL( plan_withdraw(5000, position, pool).code, err::INSUFFICIENT_SHARES )
   CHECK_EQUAL( plan_withdraw(101, position, pool).code, err::INSUFFICIENT_SHARES )

   // most of the pool deployed: entitled wallets hit the liquidity error
   pool = pool_of( 1000, 1000, 50 );
   CHECK_EQUAL( plan_withdraw(80, position, pool).code, err::INSUFFICIENT_LIQUIDITY )
   CHECK_EQUAL( plan_withdraw(500, position, pool).code, err::INSUFFICIENT_SHARES )
   CHECK_EQUAL( plan_withdraw(50, position, pool).code, err::NONE )

   // no position at all
   CHECK_EQUAL( plan_withdraw(1, position_of(0, 0, 0), pool).code, err::INSUFFICIENT_SHARES )
   CHECK_EQUAL( plan_withdraw(0, position, pool).code, err::NOT_POSITIVE )

   // principal still locked by a withdraw request
   pool = pool_of( 1000, 1000, 1000 );
   position = position_of( 100, 100, 60 );
   CHECK_EQUAL( plan_withdraw(50, position, pool).code, err::INSUFFICIENT_FUND )
   CHECK_EQUAL( plan_withdraw(40, position, pool).code, err::NONE )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(withdraw_plan_test)
   // 1100 backing 1000 shares, withdraw 550 burns 500 shares
   auto pool      = pool_of( 1100, 1000, 1100 );
   auto position  = position_of( 1000, 1000, 0 );
   auto plan      = plan_withdraw( 550, position, pool );
   REQUIRE_EQUAL( plan.code, err::NONE )
   CHECK_EQUAL( plan.shares, 500 )
   CHECK_EQUAL( plan.principal, 500 )

   apply_withdraw( pool, position, 550, plan );
   CHECK_EQUAL( pool.total_amount, 550 )
   CHECK_EQUAL( pool.total_shares, 500 )
   CHECK_EQUAL( pool.idle_amount, 550 )
   CHECK_EQUAL( position.lp_amount, 500 )
   CHECK_EQUAL( position.current_amount, 500 )

   // the whole entitlement burns every remaining share
   plan = plan_withdraw( 550, position, pool );
   REQUIRE_EQUAL( plan.code, err::NONE )
   CHECK_EQUAL( plan.shares, 500 )
   CHECK_EQUAL( plan.principal, 500 )

   CHECK_ASSERT( "[[200]] withdraw plan rejected", ([]() {
      auto pool      = pool_of( 1000, 1000, 1000 );
      auto position  = position_of( 10, 10, 0 );
      apply_withdraw( pool, position, 20, plan_withdraw(20, position, pool) );
   }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(ledger_conservation_test)
   pool_st pool;
   position_st alice;
   position_st bob;

   CHECK_EQUAL( deposit_into(pool, alice, 1000), 1000 )
   CHECK_EQUAL( deposit_into(pool, bob, 500), 500 )

   const int64_t alice_out[] = { 300, 7, 93 };
   for( auto amount : alice_out ) {
      auto plan = plan_withdraw( amount, alice, pool );
      REQUIRE_EQUAL( plan.code, err::NONE )
      apply_withdraw( pool, alice, amount, plan );
      REQUIRE_EQUAL( pool.total_amount, alice.current_amount + bob.current_amount )
      REQUIRE_EQUAL( pool.total_shares, alice.lp_amount + bob.lp_amount )
   }

   deposit_into( pool, alice, 250 );
   auto plan = plan_withdraw( 500, bob, pool );
   REQUIRE_EQUAL( plan.code, err::NONE )
   apply_withdraw( pool, bob, 500, plan );

   CHECK_EQUAL( bob.lp_amount, 0 )
   CHECK_EQUAL( bob.current_amount, 0 )
   CHECK_EQUAL( pool.total_amount, alice.current_amount )
   CHECK_EQUAL( pool.total_shares, alice.lp_amount )
   CHECK_EQUAL( pool.total_amount, 850 )
EOSIO_TEST_END

int main(int argc, char** argv) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(first_deposit_test)
   EOSIO_TEST(exchange_rate_test)
   EOSIO_TEST(share_monotonicity_test)
   EOSIO_TEST(round_trip_bound_test)
   EOSIO_TEST(principal_release_test)
   EOSIO_TEST(ledger_guard_test)
   EOSIO_TEST(withdraw_error_order_test)
   EOSIO_TEST(withdraw_plan_test)
   EOSIO_TEST(ledger_conservation_test)
   return has_failed();
}
