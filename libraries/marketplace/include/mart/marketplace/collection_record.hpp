#pragma once

#include <mart/marketplace/address.hpp>
#include <mart/marketplace/stored_value.hpp>

namespace mart { namespace marketplace {

struct collection_record
{
    address             collection;
    bool                registered = false;
    uint256             royalty_bps;
    address             royalty_recipient;
};

struct royalty_info
{
    uint256             royalty_bps;
    address             royalty_recipient;
};

/**
 *  @brief per collection royalty terms
 *
 *  The registry only validates and stores terms.  Whether the caller may change them is
 *  decided by the engine, which knows the administrator.
 */
class collection_registry
{
    public:
        collection_registry( db::field_store& store );

        /** inserts or overwrites the royalty terms of collection */
        void                register_collection( const address& collection, const uint256& royalty_bps,
                                                 const address& royalty_recipient );

        /** @throws collection_not_registered unless register_collection() was called first */
        void                update_royalty( const address& collection, const uint256& royalty_bps,
                                            const address& royalty_recipient );

        bool                is_registered( const address& collection )const;
        royalty_info        royalty_of( const address& collection )const;

        /** unregistered collections come back with registered = false and zeroed terms */
        collection_record   get( const address& collection )const;

    private:
        void                validate_terms( const uint256& royalty_bps, const address& royalty_recipient )const;

        stored_map<address, uint256>        _royalty_bps;
        stored_map<address, address>        _royalty_recipient;
        stored_map<address, bool>           _registered;
};

} } // mart::marketplace

FC_REFLECT( mart::marketplace::collection_record, (collection)(registered)(royalty_bps)(royalty_recipient) )
FC_REFLECT( mart::marketplace::royalty_info, (royalty_bps)(royalty_recipient) )
