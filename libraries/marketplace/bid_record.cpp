#include <mart/marketplace/bid_record.hpp>
#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>

namespace mart { namespace marketplace {

   bid_ledger::bid_ledger( db::field_store& store )
   :_next_id( store, field_pointer::next_bid_id ),
    _collection( store, field_pointer::bid_collection ),
    _token_id( store, field_pointer::bid_token_id ),
    _bidder( store, field_pointer::bid_bidder ),
    _amount( store, field_pointer::bid_amount ),
    _active( store, field_pointer::bid_active )
   {
   }

   void bid_ledger::initialize()
   {
      _next_id.set( MART_FIRST_RECORD_ID );
   }

   bool bid_ledger::is_initialized()const
   {
      return _next_id.get() != 0;
   }

   bid_id_type bid_ledger::next_id()const
   {
      const uint256 next = _next_id.get();
      return next == 0 ? uint256( MART_FIRST_RECORD_ID ) : next;
   }

   bool bid_ledger::is_valid_id( const bid_id_type& id )const
   {
      return id != 0 && id < next_id();
   }

   bid_id_type bid_ledger::create( const address& collection, const token_id_type& token_id,
                                   const address& bidder, const uint256& amount )
   { try {
      const bid_id_type id = next_id();
      _next_id.set( safe_add( id, 1 ) );

      _collection.set( id, collection );
      _token_id.set( id, token_id );
      _bidder.set( id, bidder );
      _amount.set( id, amount );
      _active.set( id, true );
      return id;
   } FC_CAPTURE_AND_RETHROW( (collection)(token_id)(bidder)(amount) ) }

   bid_record bid_ledger::get( const bid_id_type& id )const
   {
      if( !is_valid_id( id ) )
         FC_CAPTURE_AND_THROW( record_not_found, (id) );

      bid_record rec;
      rec.id         = id;
      rec.collection = _collection.get( id );
      rec.token_id   = _token_id.get( id );
      rec.bidder     = _bidder.get( id );
      rec.amount     = _amount.get( id );
      rec.active     = _active.get( id );
      return rec;
   }

   bid_record bid_ledger::require_active( const bid_id_type& id )const
   {
      const bid_record rec = get( id );
      if( !rec.active )
         FC_CAPTURE_AND_THROW( record_inactive, (id) );
      return rec;
   }

   void bid_ledger::deactivate( const bid_id_type& id )
   {
      if( !is_valid_id( id ) )
         FC_CAPTURE_AND_THROW( record_not_found, (id) );
      _active.set( id, false );
   }

} } // mart::marketplace
