#define BOOST_TEST_MODULE LedgerTests
#include <boost/test/unit_test.hpp>

#include <mart/db/field_store.hpp>
#include <mart/marketplace/bid_record.hpp>
#include <mart/marketplace/collection_record.hpp>
#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>
#include <mart/marketplace/listing_record.hpp>
#include <mart/marketplace/platform_record.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant.hpp>

#include <limits>

using namespace mart::marketplace;

static address make_address( unsigned char tag )
{
   word_type w = mart::db::zero_word();
   w.data[0] = char( tag );
   return address( w );
}

BOOST_AUTO_TEST_CASE( words_are_big_endian )
{
   const word_type w = to_word( uint256( 0x0102 ) );
   BOOST_CHECK_EQUAL( int( w.data[30] ), 1 );
   BOOST_CHECK_EQUAL( int( w.data[31] ), 2 );
   BOOST_CHECK_EQUAL( int( w.data[0] ), 0 );

   uint256 back;
   from_word( w, back );
   BOOST_CHECK( back == 0x0102 );

   const uint256 max = std::numeric_limits<uint256>::max();
   from_word( to_word( max ), back );
   BOOST_CHECK( back == max );

   bool flag = false;
   from_word( to_word( true ), flag );
   BOOST_CHECK( flag );
   from_word( mart::db::zero_word(), flag );
   BOOST_CHECK( !flag );
}

BOOST_AUTO_TEST_CASE( safe_add_never_wraps )
{
   const uint256 max = std::numeric_limits<uint256>::max();
   BOOST_CHECK( safe_add( max - 1, 1 ) == max );
   BOOST_CHECK_THROW( safe_add( max, 1 ), addition_overflow );
   BOOST_CHECK_THROW( safe_add( max - 5, 6 ), addition_overflow );
}

BOOST_AUTO_TEST_CASE( address_hex_conversion )
{
   const address a = make_address( 0xab );
   const std::string hex = std::string( a );
   BOOST_CHECK_EQUAL( hex.size(), 64u );
   BOOST_CHECK_EQUAL( hex.substr( 0, 4 ), "ab00" );
   BOOST_CHECK( address( hex ) == a );
   BOOST_CHECK( fc::variant( a ).as<address>() == a );

   BOOST_CHECK( address().is_null() );
   BOOST_CHECK( !a.is_null() );
   BOOST_CHECK_THROW( address( std::string( "abcd" ) ), invalid_argument );
}

BOOST_AUTO_TEST_CASE( uint256_variant_is_decimal )
{
   const uint256 big = std::numeric_limits<uint256>::max();
   const fc::variant v( big );
   BOOST_CHECK_EQUAL( v.as_string(), big.str() );
   BOOST_CHECK( v.as<uint256>() == big );
}

BOOST_AUTO_TEST_CASE( listing_ledger_lifecycle )
{
   try {
      mart::db::memory_field_store store;
      listing_ledger listings( store );

      BOOST_CHECK( !listings.is_initialized() );
      BOOST_CHECK( listings.next_id() == MART_FIRST_RECORD_ID );
      listings.initialize();
      BOOST_CHECK( listings.is_initialized() );

      const address collection = make_address( 1 );
      const address seller     = make_address( 2 );

      BOOST_CHECK( listings.create( collection, 7, seller, 1000 ) == 1 );
      BOOST_CHECK( listings.create( collection, 8, seller, 2000 ) == 2 );
      BOOST_CHECK( listings.next_id() == 3 );

      BOOST_CHECK( !listings.is_valid_id( 0 ) );
      BOOST_CHECK( listings.is_valid_id( 2 ) );
      BOOST_CHECK( !listings.is_valid_id( 3 ) );

      listing_record rec = listings.require_active( 2 );
      BOOST_CHECK( rec.id == 2 );
      BOOST_CHECK( rec.token_id == 8 );
      BOOST_CHECK( rec.price == 2000 );

      listings.deactivate( 2 );
      BOOST_CHECK_THROW( listings.require_active( 2 ), record_inactive );
      BOOST_CHECK( !listings.get( 2 ).active );
      BOOST_CHECK( listings.get( 2 ).price == 2000 );
      BOOST_CHECK( listings.get( 1 ).active );

      BOOST_CHECK_THROW( listings.get( 0 ), record_not_found );
      BOOST_CHECK_THROW( listings.get( 3 ), record_not_found );
      BOOST_CHECK_THROW( listings.deactivate( 3 ), record_not_found );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( bid_ids_are_independent_of_listing_ids )
{
   mart::db::memory_field_store store;
   listing_ledger listings( store );
   bid_ledger     bids( store );
   listings.initialize();
   bids.initialize();

   listings.create( make_address( 1 ), 1, make_address( 2 ), 10 );
   listings.create( make_address( 1 ), 2, make_address( 2 ), 10 );

   BOOST_CHECK( bids.create( make_address( 1 ), 1, make_address( 3 ), 5 ) == 1 );
   BOOST_CHECK( bids.next_id() == 2 );
   BOOST_CHECK( listings.next_id() == 3 );

   const bid_record bid = bids.get( 1 );
   BOOST_CHECK( bid.bidder == make_address( 3 ) );
   BOOST_CHECK( bid.amount == 5 );
   BOOST_CHECK( bid.active );

   bids.deactivate( 1 );
   BOOST_CHECK_THROW( bids.require_active( 1 ), record_inactive );
   BOOST_CHECK_THROW( bids.get( 2 ), record_not_found );
}

BOOST_AUTO_TEST_CASE( collection_registry_terms )
{
   mart::db::memory_field_store store;
   collection_registry registry( store );
   const address collection = make_address( 1 );
   const address recipient  = make_address( 2 );

   BOOST_CHECK( !registry.is_registered( collection ) );
   BOOST_CHECK_THROW( registry.update_royalty( collection, 10, recipient ), collection_not_registered );

   BOOST_CHECK_THROW( registry.register_collection( address(), 10, recipient ), null_address );
   BOOST_CHECK_THROW( registry.register_collection( collection, MART_MAX_ROYALTY_BPS + 1, recipient ), bps_out_of_range );
   BOOST_CHECK_THROW( registry.register_collection( collection, 10, address() ), null_address );
   BOOST_CHECK_EQUAL( store.size(), 0u );

   registry.register_collection( collection, 0, recipient );
   BOOST_CHECK( registry.is_registered( collection ) );
   BOOST_CHECK( registry.royalty_of( collection ).royalty_bps == 0 );

   registry.update_royalty( collection, MART_MAX_ROYALTY_BPS, make_address( 3 ) );
   const collection_record rec = registry.get( collection );
   BOOST_CHECK( rec.registered );
   BOOST_CHECK( rec.royalty_bps == MART_MAX_ROYALTY_BPS );
   BOOST_CHECK( rec.royalty_recipient == make_address( 3 ) );
}

BOOST_AUTO_TEST_CASE( platform_accounting_bounds )
{
   mart::db::memory_field_store store;
   platform_accounting platform( store );

   BOOST_CHECK_THROW( platform.set_fee_bps( MART_MAX_PLATFORM_FEE_BPS + 1 ), bps_out_of_range );
   platform.set_fee_bps( MART_MAX_PLATFORM_FEE_BPS );
   BOOST_CHECK( platform.fee_bps() == MART_MAX_PLATFORM_FEE_BPS );

   BOOST_CHECK_THROW( platform.set_fee_recipient( address() ), null_address );
   platform.set_fee_recipient( make_address( 9 ) );
   BOOST_CHECK( platform.fee_recipient() == make_address( 9 ) );

   platform.increment_listing_count();
   platform.increment_listing_count();
   BOOST_CHECK( platform.total_listings() == 2 );

   const uint256 max = std::numeric_limits<uint256>::max();
   platform.record_volume( max - 10 );
   BOOST_CHECK_THROW( platform.record_volume( 11 ), addition_overflow );
   BOOST_CHECK( platform.total_volume() == max - 10 );
   platform.record_volume( 10 );
   BOOST_CHECK( platform.get().total_volume == max );
}
