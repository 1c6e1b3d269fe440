#include <mart/marketplace/call_data.hpp>
#include <mart/marketplace/config.hpp>
#include <mart/marketplace/events.hpp>

#include <fc/exception/exception.hpp>

namespace mart { namespace marketplace {

   const char* const listing_created_event::name       = "ListingCreated";
   const char* const listing_cancelled_event::name     = "ListingCancelled";
   const char* const listing_sold_event::name          = "ListingSold";
   const char* const bid_placed_event::name            = "BidPlaced";
   const char* const bid_cancelled_event::name         = "BidCancelled";
   const char* const bid_accepted_event::name          = "BidAccepted";
   const char* const collection_registered_event::name = "CollectionRegistered";

   bytes listing_created_event::pack()const
   {
      call_data_writer w( 3 * MART_WORD_SIZE + 2 * MART_ADDRESS_SIZE );
      w.write_uint256( listing_id )
       .write_address( collection )
       .write_uint256( token_id )
       .write_address( seller )
       .write_uint256( price );
      return w.data();
   }

   bytes listing_cancelled_event::pack()const
   {
      call_data_writer w( MART_WORD_SIZE );
      w.write_uint256( listing_id );
      return w.data();
   }

   bytes listing_sold_event::pack()const
   {
      call_data_writer w( 2 * MART_WORD_SIZE + MART_ADDRESS_SIZE );
      w.write_uint256( listing_id )
       .write_address( buyer )
       .write_uint256( price );
      return w.data();
   }

   bytes bid_placed_event::pack()const
   {
      call_data_writer w( 3 * MART_WORD_SIZE + 2 * MART_ADDRESS_SIZE );
      w.write_uint256( bid_id )
       .write_address( collection )
       .write_uint256( token_id )
       .write_address( bidder )
       .write_uint256( amount );
      return w.data();
   }

   bytes bid_cancelled_event::pack()const
   {
      call_data_writer w( MART_WORD_SIZE );
      w.write_uint256( bid_id );
      return w.data();
   }

   bytes bid_accepted_event::pack()const
   {
      call_data_writer w( MART_WORD_SIZE + MART_ADDRESS_SIZE );
      w.write_uint256( bid_id )
       .write_address( seller );
      return w.data();
   }

   bytes collection_registered_event::pack()const
   {
      call_data_writer w( MART_ADDRESS_SIZE + MART_WORD_SIZE );
      w.write_address( collection )
       .write_uint256( royalty_bps );
      return w.data();
   }

   void event_log::emit( const event_record& e )
   {
      _events.push_back( e );
   }

   const event_record& event_log::last()const
   {
      FC_ASSERT( !_events.empty(), "no events have been emitted" );
      return _events.back();
   }

} } // mart::marketplace
