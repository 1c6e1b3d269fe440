#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>
#include <mart/marketplace/listing_record.hpp>

namespace mart { namespace marketplace {

   listing_ledger::listing_ledger( db::field_store& store )
   :_next_id( store, field_pointer::next_listing_id ),
    _collection( store, field_pointer::listing_collection ),
    _token_id( store, field_pointer::listing_token_id ),
    _seller( store, field_pointer::listing_seller ),
    _price( store, field_pointer::listing_price ),
    _active( store, field_pointer::listing_active )
   {
   }

   void listing_ledger::initialize()
   {
      _next_id.set( MART_FIRST_RECORD_ID );
   }

   bool listing_ledger::is_initialized()const
   {
      return _next_id.get() != 0;
   }

   listing_id_type listing_ledger::next_id()const
   {
      const uint256 next = _next_id.get();
      return next == 0 ? uint256( MART_FIRST_RECORD_ID ) : next;
   }

   bool listing_ledger::is_valid_id( const listing_id_type& id )const
   {
      return id != 0 && id < next_id();
   }

   listing_id_type listing_ledger::create( const address& collection, const token_id_type& token_id,
                                           const address& seller, const uint256& price )
   { try {
      const listing_id_type id = next_id();
      _next_id.set( safe_add( id, 1 ) );

      _collection.set( id, collection );
      _token_id.set( id, token_id );
      _seller.set( id, seller );
      _price.set( id, price );
      _active.set( id, true );
      return id;
   } FC_CAPTURE_AND_RETHROW( (collection)(token_id)(seller)(price) ) }

   listing_record listing_ledger::get( const listing_id_type& id )const
   {
      if( !is_valid_id( id ) )
         FC_CAPTURE_AND_THROW( record_not_found, (id) );

      listing_record rec;
      rec.id         = id;
      rec.collection = _collection.get( id );
      rec.token_id   = _token_id.get( id );
      rec.seller     = _seller.get( id );
      rec.price      = _price.get( id );
      rec.active     = _active.get( id );
      return rec;
   }

   listing_record listing_ledger::require_active( const listing_id_type& id )const
   {
      const listing_record rec = get( id );
      if( !rec.active )
         FC_CAPTURE_AND_THROW( record_inactive, (id) );
      return rec;
   }

   void listing_ledger::deactivate( const listing_id_type& id )
   {
      if( !is_valid_id( id ) )
         FC_CAPTURE_AND_THROW( record_not_found, (id) );
      _active.set( id, false );
   }

} } // mart::marketplace
