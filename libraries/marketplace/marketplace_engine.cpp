#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>
#include <mart/marketplace/marketplace_engine.hpp>

#include <fc/log/logger.hpp>

namespace mart { namespace marketplace {

   namespace detail
   {
      class marketplace_engine_impl
      {
         public:
            marketplace_engine_impl( const marketplace_config& cfg, db::field_store& store,
                                     collection_client& collections, event_sink& events )
            :_config(cfg),
             _listings(store),
             _bids(store),
             _collections(store),
             _platform(store),
             _collection_client(collections),
             _events(events)
            {
               _config.validate();
            }

            void require_administrator( const address& caller )const
            {
               if( caller != _config.administrator )
                  FC_THROW_EXCEPTION( unauthorized, "${caller} is not the marketplace administrator",
                                      ("caller",caller) );
            }

            bool is_deployed()const
            {
               return _listings.is_initialized() || _bids.is_initialized();
            }

            void require_deployed()const
            {
               if( !is_deployed() )
                  FC_THROW_EXCEPTION( not_deployed, "marketplace has not been deployed" );
            }

            void require_collection( const address& collection )const
            {
               if( collection.is_null() )
                  FC_THROW_EXCEPTION( null_address, "Invalid collection address" );
            }

            void verify_ownership( const address& collection, const token_id_type& token_id,
                                   const address& expected_owner )
            {
               const address owner = _collection_client.owner_of( collection, token_id );
               if( owner != expected_owner )
               {
                  wlog( "${caller} does not own token ${token} of ${collection}, owner is ${owner}",
                        ("caller",expected_owner)("token",token_id)("collection",collection)("owner",owner) );
                  FC_THROW_EXCEPTION( not_token_owner, "Caller is not the token owner",
                                      ("collection",collection)("token_id",token_id)("caller",expected_owner) );
               }
            }

            void verify_approval( const address& collection, const address& owner )
            {
               if( !_collection_client.is_approved_for_all( collection, owner, _config.contract_address ) )
               {
                  wlog( "${owner} has not approved ${operator} on ${collection}",
                        ("owner",owner)("operator",_config.contract_address)("collection",collection) );
                  FC_THROW_EXCEPTION( not_approved_for_all, "Marketplace not approved for transfers",
                                      ("collection",collection)("owner",owner) );
               }
            }

            /** the ledger was already settled when this is called, a failure leaves it settled */
            void transfer_after_settlement( const address& collection, const address& from, const address& to,
                                            const token_id_type& token_id )
            {
               try {
                  _collection_client.transfer( collection, from, to, token_id );
               } catch ( const fc::exception& e ) {
                  elog( "transfer of token ${token} of ${collection} from ${from} to ${to} failed after settlement: ${e}",
                        ("token",token_id)("collection",collection)("from",from)("to",to)("e",e.to_detail_string()) );
                  throw;
               }
            }

            marketplace_config         _config;
            listing_ledger             _listings;
            bid_ledger                 _bids;
            collection_registry        _collections;
            platform_accounting        _platform;
            collection_client&         _collection_client;
            event_sink&                _events;
      };
   }

   marketplace_engine::marketplace_engine( const marketplace_config& cfg, db::field_store& store,
                                           collection_client& collections, event_sink& events )
   :my( new detail::marketplace_engine_impl( cfg, store, collections, events ) )
   {
   }

   marketplace_engine::~marketplace_engine(){}

   void marketplace_engine::initialize( const address& caller, const address& fee_recipient,
                                        const uint256& fee_bps )
   { try {
      my->require_administrator( caller );
      if( my->is_deployed() )
         FC_THROW_EXCEPTION( unauthorized, "marketplace is already deployed" );

      if( fee_recipient.is_null() )
         FC_THROW_EXCEPTION( null_address, "Invalid fee recipient" );
      if( fee_bps > MART_MAX_PLATFORM_FEE_BPS )
         FC_THROW_EXCEPTION( bps_out_of_range, "Fee exceeds maximum 5%", ("fee_bps",fee_bps) );

      my->_platform.set_fee_recipient( fee_recipient );
      my->_platform.set_fee_bps( fee_bps );
      my->_listings.initialize();
      my->_bids.initialize();

      ilog( "marketplace deployed, fee ${bps} bps paid to ${recipient}", ("bps",fee_bps)("recipient",fee_recipient) );
   } FC_CAPTURE_AND_RETHROW( (caller)(fee_recipient)(fee_bps) ) }

   bool marketplace_engine::is_initialized()const
   {
      return my->is_deployed();
   }

   listing_id_type marketplace_engine::list_nft( const address& caller, const address& collection,
                                                 const token_id_type& token_id, const uint256& price )
   { try {
      my->require_deployed();
      my->require_collection( collection );
      if( price == 0 )
         FC_THROW_EXCEPTION( zero_amount, "Price must be greater than zero" );

      my->verify_ownership( collection, token_id, caller );
      my->verify_approval( collection, caller );

      const listing_id_type id = my->_listings.create( collection, token_id, caller, price );
      my->_platform.increment_listing_count();

      my->_events.emit_event( listing_created_event( id, collection, token_id, caller, price ) );
      ilog( "listing ${id}: token ${token} of ${collection} offered by ${seller} for ${price}",
            ("id",id)("token",token_id)("collection",collection)("seller",caller)("price",price) );
      return id;
   } FC_CAPTURE_AND_RETHROW( (caller)(collection)(token_id)(price) ) }

   void marketplace_engine::cancel_listing( const address& caller, const listing_id_type& id )
   { try {
      my->require_deployed();
      const listing_record listing = my->_listings.require_active( id );
      if( caller != listing.seller )
         FC_THROW_EXCEPTION( unauthorized, "Only seller can cancel", ("seller",listing.seller) );

      my->_listings.deactivate( id );

      my->_events.emit_event( listing_cancelled_event( id ) );
      ilog( "listing ${id} cancelled", ("id",id) );
   } FC_CAPTURE_AND_RETHROW( (caller)(id) ) }

   void marketplace_engine::buy_nft( const address& caller, const listing_id_type& id )
   { try {
      my->require_deployed();
      const listing_record listing = my->_listings.require_active( id );
      if( caller == listing.seller )
         FC_THROW_EXCEPTION( self_purchase, "Buyer cannot be seller" );

      my->_platform.record_volume( listing.price );
      my->_listings.deactivate( id );

      my->transfer_after_settlement( listing.collection, listing.seller, caller, listing.token_id );

      my->_events.emit_event( listing_sold_event( id, caller, listing.price ) );
      ilog( "listing ${id} sold to ${buyer} for ${price}", ("id",id)("buyer",caller)("price",listing.price) );
   } FC_CAPTURE_AND_RETHROW( (caller)(id) ) }

   bid_id_type marketplace_engine::place_bid( const address& caller, const address& collection,
                                              const token_id_type& token_id, const uint256& amount )
   { try {
      my->require_deployed();
      my->require_collection( collection );
      if( amount == 0 )
         FC_THROW_EXCEPTION( zero_amount, "Bid amount must be greater than zero" );

      const bid_id_type id = my->_bids.create( collection, token_id, caller, amount );

      my->_events.emit_event( bid_placed_event( id, collection, token_id, caller, amount ) );
      ilog( "bid ${id}: ${bidder} offers ${amount} for token ${token} of ${collection}",
            ("id",id)("bidder",caller)("amount",amount)("token",token_id)("collection",collection) );
      return id;
   } FC_CAPTURE_AND_RETHROW( (caller)(collection)(token_id)(amount) ) }

   void marketplace_engine::cancel_bid( const address& caller, const bid_id_type& id )
   { try {
      my->require_deployed();
      const bid_record bid = my->_bids.require_active( id );
      if( caller != bid.bidder )
         FC_THROW_EXCEPTION( unauthorized, "Only bidder can cancel", ("bidder",bid.bidder) );

      my->_bids.deactivate( id );

      my->_events.emit_event( bid_cancelled_event( id ) );
      ilog( "bid ${id} cancelled", ("id",id) );
   } FC_CAPTURE_AND_RETHROW( (caller)(id) ) }

   void marketplace_engine::accept_bid( const address& caller, const bid_id_type& id )
   { try {
      my->require_deployed();
      const bid_record bid = my->_bids.require_active( id );
      my->verify_ownership( bid.collection, bid.token_id, caller );

      my->_platform.record_volume( bid.amount );
      my->_bids.deactivate( id );

      my->transfer_after_settlement( bid.collection, caller, bid.bidder, bid.token_id );

      my->_events.emit_event( bid_accepted_event( id, caller ) );
      ilog( "bid ${id} accepted by ${seller}", ("id",id)("seller",caller) );
   } FC_CAPTURE_AND_RETHROW( (caller)(id) ) }

   void marketplace_engine::register_collection( const address& caller, const address& collection,
                                                 const uint256& royalty_bps, const address& royalty_recipient )
   { try {
      my->require_deployed();
      my->require_administrator( caller );
      my->_collections.register_collection( collection, royalty_bps, royalty_recipient );

      my->_events.emit_event( collection_registered_event( collection, royalty_bps ) );
      ilog( "collection ${collection} registered, royalty ${bps} bps paid to ${recipient}",
            ("collection",collection)("bps",royalty_bps)("recipient",royalty_recipient) );
   } FC_CAPTURE_AND_RETHROW( (caller)(collection)(royalty_bps)(royalty_recipient) ) }

   void marketplace_engine::update_royalty( const address& caller, const address& collection,
                                            const uint256& royalty_bps, const address& royalty_recipient )
   { try {
      my->require_deployed();
      my->require_administrator( caller );
      my->_collections.update_royalty( collection, royalty_bps, royalty_recipient );

      ilog( "collection ${collection} royalty changed to ${bps} bps paid to ${recipient}",
            ("collection",collection)("bps",royalty_bps)("recipient",royalty_recipient) );
   } FC_CAPTURE_AND_RETHROW( (caller)(collection)(royalty_bps)(royalty_recipient) ) }

   void marketplace_engine::set_platform_fee( const address& caller, const uint256& fee_bps )
   { try {
      my->require_deployed();
      my->require_administrator( caller );
      my->_platform.set_fee_bps( fee_bps );
      ilog( "platform fee set to ${bps} bps", ("bps",fee_bps) );
   } FC_CAPTURE_AND_RETHROW( (caller)(fee_bps) ) }

   void marketplace_engine::set_platform_fee_recipient( const address& caller, const address& recipient )
   { try {
      my->require_deployed();
      my->require_administrator( caller );
      my->_platform.set_fee_recipient( recipient );
      ilog( "platform fee recipient set to ${recipient}", ("recipient",recipient) );
   } FC_CAPTURE_AND_RETHROW( (caller)(recipient) ) }

   listing_record marketplace_engine::get_listing( const listing_id_type& id )const
   {
      return my->_listings.get( id );
   }

   bid_record marketplace_engine::get_bid( const bid_id_type& id )const
   {
      return my->_bids.get( id );
   }

   collection_record marketplace_engine::get_collection_info( const address& collection )const
   {
      return my->_collections.get( collection );
   }

   platform_record marketplace_engine::get_platform_info()const
   {
      return my->_platform.get();
   }

   royalty_info marketplace_engine::royalty_of( const address& collection )const
   {
      return my->_collections.royalty_of( collection );
   }

   listing_id_type marketplace_engine::next_listing_id()const
   {
      return my->_listings.next_id();
   }

   bid_id_type marketplace_engine::next_bid_id()const
   {
      return my->_bids.next_id();
   }

   const marketplace_config& marketplace_engine::config()const
   {
      return my->_config;
   }

} } // mart::marketplace
