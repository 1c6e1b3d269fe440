#define BOOST_TEST_MODULE ContractAbiTests
#include <boost/test/unit_test.hpp>

#include "marketplace_fixture.hpp"

struct abi_fixture : public contract_fixture
{
   bytes call( const address& sender, const string& method, const call_data_writer& args = call_data_writer() )
   {
      return contract->execute( sender, method_selector( method ), args.data() );
   }

   void deploy( const address& recipient, const uint256& fee_bps )
   {
      call_data_writer args;
      args.write_address( recipient ).write_uint256( fee_bps );
      contract->on_deployment( admin, args.data() );
   }

   static bool is_true( const bytes& result )
   {
      return result.size() == 1 && result[0] == 1;
   }
};

BOOST_AUTO_TEST_CASE( selectors_are_sha256_prefixes )
{
   BOOST_CHECK_EQUAL( method_selector( "listNFT" ),          0xbddede2eu );
   BOOST_CHECK_EQUAL( method_selector( "getPlatformInfo" ),  0x0a01d387u );
   BOOST_CHECK_EQUAL( method_selector( "ownerOf" ),          0xa5fbc116u );
   BOOST_CHECK_EQUAL( method_selector( "isApprovedForAll" ), 0xef3050fbu );
   BOOST_CHECK_EQUAL( method_selector( "safeTransferFrom" ), 0x9177aa2cu );
}

BOOST_FIXTURE_TEST_CASE( exposes_every_marketplace_method, abi_fixture )
{
   const auto methods = contract->methods();
   BOOST_CHECK_EQUAL( methods.size(), 14u );
   BOOST_CHECK_EQUAL( methods.at( method_selector( "acceptBid" ) ), "acceptBid" );
   BOOST_CHECK_EQUAL( methods.at( method_selector( "updateRoyalty" ) ), "updateRoyalty" );
}

BOOST_FIXTURE_TEST_CASE( deployment_reads_recipient_then_fee, abi_fixture )
{
   try {
      deploy( fee_recipient, 250 );

      call_data_reader info( call( alice, "getPlatformInfo" ) );
      BOOST_CHECK_EQUAL( info.remaining(), 4u * MART_WORD_SIZE );
      BOOST_CHECK( info.read_uint256() == 250 );
      BOOST_CHECK( info.read_address() == fee_recipient );
      BOOST_CHECK( info.read_uint256() == 0 );
      BOOST_CHECK( info.read_uint256() == 0 );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( deployment_rejects_bad_input, abi_fixture )
{
   call_data_writer short_args;
   short_args.write_address( fee_recipient );
   BOOST_CHECK_THROW( contract->on_deployment( admin, short_args.data() ), malformed_calldata );

   call_data_writer args;
   args.write_address( fee_recipient ).write_uint256( 100 );
   BOOST_CHECK_THROW( contract->on_deployment( alice, args.data() ), unauthorized );

   BOOST_CHECK_THROW( deploy( address(), 100 ), null_address );
   BOOST_CHECK_THROW( deploy( fee_recipient, 501 ), bps_out_of_range );

   deploy( fee_recipient, 100 );
   BOOST_CHECK_THROW( deploy( fee_recipient, 100 ), unauthorized );
}

BOOST_FIXTURE_TEST_CASE( calls_before_deployment_are_rejected, abi_fixture )
{
   call_data_writer bid_args;
   bid_args.write_address( collection ).write_uint256( 7 ).write_uint256( 500 );
   BOOST_CHECK_THROW( call( bob, "placeBid", bid_args ), not_deployed );
   BOOST_CHECK_EQUAL( store.size(), 0u );

   deploy( fee_recipient, 250 );
   BOOST_CHECK( call_data_reader( call( bob, "placeBid", bid_args ) ).read_uint256() == 1 );
}

BOOST_FIXTURE_TEST_CASE( listing_round_trip_through_calldata, abi_fixture )
{
   try {
      deploy( fee_recipient, 250 );
      give( alice, 7 );

      call_data_writer list_args;
      list_args.write_address( collection ).write_uint256( 7 ).write_uint256( 1000 );
      const bytes id_bytes = call( alice, "listNFT", list_args );
      BOOST_REQUIRE_EQUAL( id_bytes.size(), size_t( MART_WORD_SIZE ) );
      BOOST_CHECK( call_data_reader( id_bytes ).read_uint256() == 1 );

      call_data_writer id_args;
      id_args.write_uint256( 1 );
      call_data_reader listing( call( bob, "getListing", id_args ) );
      BOOST_CHECK_EQUAL( listing.remaining(), 5u * MART_WORD_SIZE );
      BOOST_CHECK( listing.read_address() == collection );
      BOOST_CHECK( listing.read_uint256() == 7 );
      BOOST_CHECK( listing.read_address() == alice );
      BOOST_CHECK( listing.read_uint256() == 1000 );
      BOOST_CHECK( listing.read_uint256() == 1 );

      BOOST_CHECK( is_true( call( bob, "buyNFT", id_args ) ) );

      call_data_reader sold( call( bob, "getListing", id_args ) );
      sold.read_address(); sold.read_uint256(); sold.read_address(); sold.read_uint256();
      BOOST_CHECK( sold.read_uint256() == 0 );

      call_data_reader info( call( bob, "getPlatformInfo" ) );
      info.read_uint256(); info.read_address();
      BOOST_CHECK( info.read_uint256() == 1000 );
      BOOST_CHECK( info.read_uint256() == 1 );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( bid_round_trip_through_calldata, abi_fixture )
{
   deploy( fee_recipient, 250 );
   give( alice, 7 );

   call_data_writer bid_args;
   bid_args.write_address( collection ).write_uint256( 7 ).write_uint256( 500 );
   BOOST_CHECK( call_data_reader( call( bob, "placeBid", bid_args ) ).read_uint256() == 1 );

   call_data_writer id_args;
   id_args.write_uint256( 1 );
   call_data_reader bid( call( carol, "getBid", id_args ) );
   BOOST_CHECK( bid.read_address() == collection );
   BOOST_CHECK( bid.read_uint256() == 7 );
   BOOST_CHECK( bid.read_address() == bob );
   BOOST_CHECK( bid.read_uint256() == 500 );
   BOOST_CHECK( bid.read_uint256() == 1 );

   BOOST_CHECK( is_true( call( alice, "acceptBid", id_args ) ) );
   BOOST_CHECK( nft.owner( collection, 7 ) == bob );

   call_data_writer second;
   second.write_address( collection ).write_uint256( 8 ).write_uint256( 10 );
   call( bob, "placeBid", second );
   call_data_writer second_id;
   second_id.write_uint256( 2 );
   BOOST_CHECK( is_true( call( bob, "cancelBid", second_id ) ) );
   BOOST_CHECK_THROW( call( bob, "cancelBid", second_id ), record_inactive );
}

BOOST_FIXTURE_TEST_CASE( admin_methods_through_calldata, abi_fixture )
{
   deploy( fee_recipient, 250 );

   call_data_writer reg;
   reg.write_address( collection ).write_uint256( 250 ).write_address( royalty_recipient );
   BOOST_CHECK_THROW( call( alice, "registerCollection", reg ), unauthorized );
   BOOST_CHECK( is_true( call( admin, "registerCollection", reg ) ) );
   BOOST_CHECK_EQUAL( events.last().name, "CollectionRegistered" );

   call_data_writer collection_arg;
   collection_arg.write_address( collection );
   call_data_reader info( call( alice, "getCollectionInfo", collection_arg ) );
   BOOST_CHECK_EQUAL( info.remaining(), 3u * MART_WORD_SIZE );
   BOOST_CHECK( info.read_uint256() == 1 );
   BOOST_CHECK( info.read_uint256() == 250 );
   BOOST_CHECK( info.read_address() == royalty_recipient );

   call_data_writer update;
   update.write_address( collection ).write_uint256( 1001 ).write_address( royalty_recipient );
   BOOST_CHECK_THROW( call( admin, "updateRoyalty", update ), bps_out_of_range );

   call_data_writer fee;
   fee.write_uint256( 400 );
   BOOST_CHECK( is_true( call( admin, "setPlatformFee", fee ) ) );

   call_data_writer recipient;
   recipient.write_address( carol );
   BOOST_CHECK( is_true( call( admin, "setPlatformFeeRecipient", recipient ) ) );

   call_data_reader platform( call( alice, "getPlatformInfo" ) );
   BOOST_CHECK( platform.read_uint256() == 400 );
   BOOST_CHECK( platform.read_address() == carol );
}

BOOST_FIXTURE_TEST_CASE( rejects_unknown_and_truncated_calls, abi_fixture )
{
   deploy( fee_recipient, 250 );

   BOOST_CHECK_THROW( call( alice, "transferOwnership" ), unknown_method );
   BOOST_CHECK_THROW( call( alice, "getListing" ), malformed_calldata );

   call_data_writer truncated;
   truncated.write_address( collection ).write_uint256( 7 );
   BOOST_CHECK_THROW( call( alice, "listNFT", truncated ), malformed_calldata );
   BOOST_CHECK( engine().next_listing_id() == 1 );

   BOOST_CHECK_THROW( contract->execute( alice, bytes( 2, 'x' ) ), malformed_calldata );
}

BOOST_FIXTURE_TEST_CASE( selector_prefixed_input, abi_fixture )
{
   deploy( fee_recipient, 250 );
   give( alice, 7 );

   call_data_writer input;
   input.write_selector( method_selector( "listNFT" ) )
        .write_address( collection )
        .write_uint256( 7 )
        .write_uint256( 1000 );
   BOOST_CHECK( call_data_reader( contract->execute( alice, input.data() ) ).read_uint256() == 1 );
}

BOOST_FIXTURE_TEST_CASE( outgoing_calls_use_fixed_layouts, abi_fixture )
{
   deploy( fee_recipient, 250 );
   give( alice, 7 );
   engine().list_nft( alice, collection, 7, 1000 );
   engine().buy_nft( bob, 1 );

   BOOST_REQUIRE_EQUAL( nft.calls.size(), 3u );
   BOOST_CHECK( nft.calls[0].first == collection );
   BOOST_CHECK_EQUAL( nft.calls[0].second.size(), 36u );
   BOOST_CHECK_EQUAL( nft.calls[1].second.size(), 68u );
   BOOST_CHECK_EQUAL( nft.calls[2].second.size(), 100u );

   call_data_reader approval( nft.calls[1].second );
   BOOST_CHECK_EQUAL( approval.read_selector(), nft.is_approved_for_all_selector );
   BOOST_CHECK( approval.read_address() == alice );
   BOOST_CHECK( approval.read_address() == marketplace_address );

   call_data_reader transfer( nft.calls[2].second );
   BOOST_CHECK_EQUAL( transfer.read_selector(), nft.transfer_selector );
   BOOST_CHECK( transfer.read_address() == alice );
   BOOST_CHECK( transfer.read_address() == bob );
   BOOST_CHECK( transfer.read_uint256() == 7 );
}
