#include <mart/marketplace/collection_record.hpp>
#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>

namespace mart { namespace marketplace {

   collection_registry::collection_registry( db::field_store& store )
   :_royalty_bps( store, field_pointer::collection_royalty_bps ),
    _royalty_recipient( store, field_pointer::collection_royalty_recipient ),
    _registered( store, field_pointer::collection_registered )
   {
   }

   void collection_registry::validate_terms( const uint256& royalty_bps, const address& royalty_recipient )const
   {
      if( royalty_bps > MART_MAX_ROYALTY_BPS )
         FC_THROW_EXCEPTION( bps_out_of_range, "royalty of ${bps} bps exceeds maximum of ${max}",
                             ("bps",royalty_bps)("max",MART_MAX_ROYALTY_BPS) );

      if( royalty_recipient.is_null() )
         FC_THROW_EXCEPTION( null_address, "invalid royalty recipient" );
   }

   void collection_registry::register_collection( const address& collection, const uint256& royalty_bps,
                                                  const address& royalty_recipient )
   { try {
      if( collection.is_null() )
         FC_THROW_EXCEPTION( null_address, "invalid collection address" );

      validate_terms( royalty_bps, royalty_recipient );

      _registered.set( collection, true );
      _royalty_bps.set( collection, royalty_bps );
      _royalty_recipient.set( collection, royalty_recipient );
   } FC_CAPTURE_AND_RETHROW( (collection)(royalty_bps)(royalty_recipient) ) }

   void collection_registry::update_royalty( const address& collection, const uint256& royalty_bps,
                                             const address& royalty_recipient )
   { try {
      if( !is_registered( collection ) )
         FC_CAPTURE_AND_THROW( collection_not_registered, (collection) );

      validate_terms( royalty_bps, royalty_recipient );

      _royalty_bps.set( collection, royalty_bps );
      _royalty_recipient.set( collection, royalty_recipient );
   } FC_CAPTURE_AND_RETHROW( (collection)(royalty_bps)(royalty_recipient) ) }

   bool collection_registry::is_registered( const address& collection )const
   {
      return _registered.get( collection );
   }

   royalty_info collection_registry::royalty_of( const address& collection )const
   {
      royalty_info info;
      info.royalty_bps       = _royalty_bps.get( collection );
      info.royalty_recipient = _royalty_recipient.get( collection );
      return info;
   }

   collection_record collection_registry::get( const address& collection )const
   {
      collection_record rec;
      rec.collection        = collection;
      rec.registered        = _registered.get( collection );
      rec.royalty_bps       = _royalty_bps.get( collection );
      rec.royalty_recipient = _royalty_recipient.get( collection );
      return rec;
   }

} } // mart::marketplace
