#pragma once

#include <mart/marketplace/bid_record.hpp>
#include <mart/marketplace/collection_client.hpp>
#include <mart/marketplace/collection_record.hpp>
#include <mart/marketplace/events.hpp>
#include <mart/marketplace/listing_record.hpp>
#include <mart/marketplace/marketplace_config.hpp>
#include <mart/marketplace/platform_record.hpp>

#include <memory>

namespace mart { namespace marketplace {

   namespace detail { class marketplace_engine_impl; }

   /**
    *  @brief the marketplace business rules
    *
    *  Every operation runs to completion against the store or throws.  A throwing operation
    *  leaves no trace in the store with one exception: buy_nft() and accept_bid() settle the
    *  ledger and the volume before they ask the collection to transfer the token, and a
    *  failed transfer does not undo that settlement.  The host is expected to discard the
    *  whole unit of work when any operation throws.
    *
    *  Ownership and approval are asked of the collection on every call that needs them.
    *  Until initialize() succeeds every mutating operation throws not_deployed.
    */
   class marketplace_engine
   {
      public:
         marketplace_engine( const marketplace_config& cfg, db::field_store& store,
                             collection_client& collections, event_sink& events );
         ~marketplace_engine();

         /**
          *  Sets the platform fee terms and starts both id counters at 1.
          *
          *  @throws unauthorized unless caller is the administrator and the store is fresh
          */
         void                initialize( const address& caller, const address& fee_recipient,
                                         const uint256& fee_bps );
         bool                is_initialized()const;

         listing_id_type     list_nft( const address& caller, const address& collection,
                                       const token_id_type& token_id, const uint256& price );
         void                cancel_listing( const address& caller, const listing_id_type& id );
         void                buy_nft( const address& caller, const listing_id_type& id );

         bid_id_type         place_bid( const address& caller, const address& collection,
                                        const token_id_type& token_id, const uint256& amount );
         void                cancel_bid( const address& caller, const bid_id_type& id );
         void                accept_bid( const address& caller, const bid_id_type& id );

         /** administrator only */
         ///@{
         void                register_collection( const address& caller, const address& collection,
                                                  const uint256& royalty_bps, const address& royalty_recipient );
         void                update_royalty( const address& caller, const address& collection,
                                             const uint256& royalty_bps, const address& royalty_recipient );
         void                set_platform_fee( const address& caller, const uint256& fee_bps );
         void                set_platform_fee_recipient( const address& caller, const address& recipient );
         ///@}

         listing_record      get_listing( const listing_id_type& id )const;
         bid_record          get_bid( const bid_id_type& id )const;
         collection_record   get_collection_info( const address& collection )const;
         platform_record     get_platform_info()const;
         royalty_info        royalty_of( const address& collection )const;

         listing_id_type     next_listing_id()const;
         bid_id_type         next_bid_id()const;

         const marketplace_config& config()const;

      private:
         std::unique_ptr<detail::marketplace_engine_impl> my;
   };

} } // mart::marketplace
