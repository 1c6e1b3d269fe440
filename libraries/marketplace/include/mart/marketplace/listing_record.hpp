#pragma once

#include <mart/marketplace/address.hpp>
#include <mart/marketplace/stored_value.hpp>

namespace mart { namespace marketplace {

struct listing_record
{
    listing_id_type     id;
    address             collection;
    token_id_type       token_id;
    address             seller;
    uint256             price;
    bool                active = false;
};

/**
 *  @brief owns every sale listing and the listing id counter
 *
 *  Listings are never removed.  Once deactivated a listing stays inactive forever and
 *  its id is never handed out again; the economic terms are immutable after create().
 */
class listing_ledger
{
    public:
        listing_ledger( db::field_store& store );

        void                initialize();
        bool                is_initialized()const;

        listing_id_type     next_id()const;
        bool                is_valid_id( const listing_id_type& id )const;

        listing_id_type     create( const address& collection, const token_id_type& token_id,
                                    const address& seller, const uint256& price );

        /** @throws record_not_found if id is zero or was never handed out */
        listing_record      get( const listing_id_type& id )const;

        /**
         *  @throws record_not_found if id is zero or was never handed out
         *  @throws record_inactive if the listing was cancelled or sold
         */
        listing_record      require_active( const listing_id_type& id )const;

        void                deactivate( const listing_id_type& id );

    private:
        stored_value<uint256>               _next_id;
        stored_map<uint256, address>        _collection;
        stored_map<uint256, uint256>        _token_id;
        stored_map<uint256, address>        _seller;
        stored_map<uint256, uint256>        _price;
        stored_map<uint256, bool>           _active;
};

} } // mart::marketplace

FC_REFLECT( mart::marketplace::listing_record,
        (id)
        (collection)
        (token_id)
        (seller)
        (price)
        (active)
        )
