#include <eosio/tester.hpp>

#include <cstring>

#include <lp.vault/lp.vault.math.hpp>

using namespace eosio;
using namespace eosio::native;
using namespace vaultfi;

static request_amounts_st amounts_of( int64_t requested, int64_t available, int64_t settled ) {
   request_amounts_st amounts;
   amounts.requested = requested;
   amounts.available = available;
   amounts.settled   = settled;
   return amounts;
}

EOSIO_TEST_BEGIN(partial_fill_test)
   // request 100, backend sourced 40 and keeps it pending
   auto amounts   = amounts_of( 100, 0, 0 );
   auto status    = request_status::PENDING;
   REQUIRE_EQUAL( check_request_update(status, request_status::PENDING, 40, amounts, ""), err::NONE )
   CHECK_EQUAL( apply_request_update(amounts, request_status::PENDING, 40), 0 )
   CHECK_EQUAL( amounts.available, 40 )

   // owner settles exactly the available amount, request stays pending
   CHECK_EQUAL( settle_request(amounts, status), 40 )
   CHECK_EQUAL( amounts.requested, 100 )
   CHECK_EQUAL( amounts.available, 0 )
   CHECK_EQUAL( amounts.settled, 40 )
   CHECK_EQUAL( status, request_status::PENDING )

   // nothing left to settle
   CHECK_EQUAL( settle_request(amounts, status), 0 )
   CHECK_EQUAL( amounts.settled, 40 )

   // final fill
   CHECK_EQUAL( check_request_update(status, request_status::SUCCESS, 50, amounts, ""), err::INCORRECT_AMOUNT )
   CHECK_EQUAL( check_request_update(status, request_status::PENDING, 61, amounts, ""), err::OVERSIZED )
   REQUIRE_EQUAL( check_request_update(status, request_status::SUCCESS, 60, amounts, ""), err::NONE )
   apply_request_update( amounts, request_status::SUCCESS, 60 );
   status = request_status::SUCCESS;
   CHECK_EQUAL( settle_request(amounts, status), 60 )
   CHECK_EQUAL( amounts.settled, 100 )
   CHECK_EQUAL( status, request_status::SUCCESS )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(auto_success_test)
   // the backend sourced the rest but left the request pending
   auto amounts   = amounts_of( 100, 0, 40 );
   auto status    = request_status::PENDING;
   REQUIRE_EQUAL( check_request_update(status, request_status::PENDING, 60, amounts, ""), err::NONE )
   apply_request_update( amounts, request_status::PENDING, 60 );
   CHECK_EQUAL( settle_request(amounts, status), 60 )
   CHECK_EQUAL( amounts.settled, 100 )
   CHECK_EQUAL( status, request_status::SUCCESS )
   CHECK_EQUAL( check_request_update(status, request_status::PENDING, 1, amounts, ""), err::STATUS_ERROR )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(request_lock_test)
   position_st position;
   position.lp_amount         = 1000;
   position.current_amount    = 1000;

   CHECK_EQUAL( lock_request(position, 100), err::NONE )
   CHECK_EQUAL( position.requested_amount, 100 )
   CHECK_EQUAL( lock_request(position, 901), err::INSUFFICIENT_FUND )
   CHECK_EQUAL( lock_request(position, 0), err::NOT_POSITIVE )
   CHECK_EQUAL( position.requested_amount, 100 )

   // 40 of the 100 settled
   unlock_request( position, 40 );
   CHECK_EQUAL( position.requested_amount, 60 )

   // the request then fails, the unsettled rest is released
   auto amounts   = amounts_of( 100, 0, 40 );
   REQUIRE_EQUAL( check_request_update(request_status::PENDING, request_status::FAILED, 0, amounts, "liquidity unavailable"), err::NONE )
   auto unlocked  = apply_request_update( amounts, request_status::FAILED, 0 );
   CHECK_EQUAL( unlocked, 60 )
   unlock_request( position, unlocked );
   CHECK_EQUAL( position.requested_amount, 0 )
   CHECK_EQUAL( position.current_amount, 1000 )

   CHECK_ASSERT( "[[200]] locked amount underflow", ([]() {
      position_st position;
      position.current_amount    = 100;
      position.requested_amount  = 10;
      unlock_request( position, 11 );
   }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(failed_with_available_test)
   // sourced but unsettled funds go back to the position when the request fails
   auto amounts   = amounts_of( 100, 30, 40 );
   CHECK_EQUAL( apply_request_update(amounts, request_status::FAILED, 0), 60 )
   CHECK_EQUAL( amounts.available, 0 )
   CHECK_EQUAL( amounts.settled, 40 )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(withdraw_range_test)
   // max_withdraw 100 applies to requests as well as instant withdraws
   CHECK_EQUAL( in_range(1000, 1, 100), false )
   CHECK_EQUAL( in_range(100, 1, 100), true )
   CHECK_EQUAL( in_range(1, 1, 100), true )
   CHECK_EQUAL( in_range(0, 1, 100), false )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(success_rules_test)
   auto amounts = amounts_of( 100, 30, 0 );
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::SUCCESS, 70, amounts, ""), err::NONE )
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::SUCCESS, 70, amounts, "done"), err::PARAM_ERROR )

   // already fully sourced, success without adding
   amounts = amounts_of( 100, 100, 0 );
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::SUCCESS, 0, amounts, ""), err::NONE )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(pending_rules_test)
   auto amounts = amounts_of( 100, 10, 20 );
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::PENDING, 0, amounts, ""), err::PARAM_ERROR )
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::PENDING, -5, amounts, ""), err::NOT_POSITIVE )
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::PENDING, 5, amounts, "oops"), err::PARAM_ERROR )
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::PENDING, 70, amounts, ""), err::NONE )
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::PENDING, 71, amounts, ""), err::OVERSIZED )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(failed_rules_test)
   auto amounts = amounts_of( 100, 40, 0 );
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::FAILED, 0, amounts, "liquidity unavailable"), err::NONE )
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::FAILED, 0, amounts, ""), err::PARAM_ERROR )
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::FAILED, 10, amounts, "liquidity unavailable"), err::PARAM_ERROR )

   std::string long_message( MAX_ERROR_MSG_SIZE, 'x' );
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::FAILED, 0, amounts, long_message), err::NONE )
   long_message.push_back( 'x' );
   CHECK_EQUAL( check_request_update(request_status::PENDING, request_status::FAILED, 0, amounts, long_message), err::PARAM_ERROR )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(terminal_status_test)
   auto amounts = amounts_of( 100, 0, 100 );
   const name statuses[] = { request_status::PENDING, request_status::SUCCESS, request_status::FAILED };
   for( auto& status : statuses ) {
      CHECK_EQUAL( check_request_update(request_status::SUCCESS, status, 0, amounts, ""), err::STATUS_ERROR )
      CHECK_EQUAL( check_request_update(request_status::FAILED, status, 0, amounts, "again"), err::STATUS_ERROR )
   }
   CHECK_EQUAL( is_terminal_status(request_status::SUCCESS), true )
   CHECK_EQUAL( is_terminal_status(request_status::FAILED), true )
   CHECK_EQUAL( is_terminal_status(request_status::PENDING), false )

   // unknown target status
   amounts = amounts_of( 100, 0, 0 );
   CHECK_EQUAL( check_request_update(request_status::PENDING, "cancelled"_n, 10, amounts, ""), err::STATUS_ERROR )
EOSIO_TEST_END

int main(int argc, char** argv) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(partial_fill_test)
   EOSIO_TEST(auto_success_test)
   EOSIO_TEST(request_lock_test)
   EOSIO_TEST(failed_with_available_test)
   EOSIO_TEST(withdraw_range_test)
   EOSIO_TEST(success_rules_test)
   EOSIO_TEST(pending_rules_test)
   EOSIO_TEST(failed_rules_test)
   EOSIO_TEST(terminal_status_test)
   return has_failed();
}
