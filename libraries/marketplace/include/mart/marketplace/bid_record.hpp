#pragma once

#include <mart/marketplace/address.hpp>
#include <mart/marketplace/stored_value.hpp>

namespace mart { namespace marketplace {

struct bid_record
{
    bid_id_type         id;
    address             collection;
    token_id_type       token_id;
    address             bidder;
    uint256             amount;
    bool                active = false;
};

/**
 *  @brief owns every open and closed bid and the bid id counter
 *
 *  Bid ids are allocated independently of listing ids.  A bid does not reference a
 *  listing, it names the token directly.
 */
class bid_ledger
{
    public:
        bid_ledger( db::field_store& store );

        void                initialize();
        bool                is_initialized()const;

        bid_id_type         next_id()const;
        bool                is_valid_id( const bid_id_type& id )const;

        bid_id_type         create( const address& collection, const token_id_type& token_id,
                                    const address& bidder, const uint256& amount );
        bid_record          get( const bid_id_type& id )const;
        bid_record          require_active( const bid_id_type& id )const;
        void                deactivate( const bid_id_type& id );

    private:
        stored_value<uint256>               _next_id;
        stored_map<uint256, address>        _collection;
        stored_map<uint256, uint256>        _token_id;
        stored_map<uint256, address>        _bidder;
        stored_map<uint256, uint256>        _amount;
        stored_map<uint256, bool>           _active;
};

} } // mart::marketplace

FC_REFLECT( mart::marketplace::bid_record,
        (id)
        (collection)
        (token_id)
        (bidder)
        (amount)
        (active)
        )
