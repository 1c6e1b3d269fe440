#pragma once

#include <mart/marketplace/address.hpp>
#include <mart/marketplace/stored_value.hpp>

namespace mart { namespace marketplace {

struct platform_record
{
    uint256             fee_bps;
    address             fee_recipient;
    uint256             total_volume;
    uint256             total_listings;
};

/**
 *  @brief global fee terms and cumulative trading statistics
 *
 *  total_volume and total_listings only ever grow.  An addition that would exceed the
 *  range of uint256 throws addition_overflow and leaves the counter untouched.
 */
class platform_accounting
{
    public:
        platform_accounting( db::field_store& store );

        void                set_fee_bps( const uint256& fee_bps );
        void                set_fee_recipient( const address& recipient );

        void                record_volume( const uint256& amount );
        void                increment_listing_count();

        uint256             fee_bps()const;
        address             fee_recipient()const;
        uint256             total_volume()const;
        uint256             total_listings()const;
        platform_record     get()const;

    private:
        stored_value<uint256>   _fee_bps;
        stored_value<address>   _fee_recipient;
        stored_value<uint256>   _total_volume;
        stored_value<uint256>   _total_listings;
};

} } // mart::marketplace

FC_REFLECT( mart::marketplace::platform_record, (fee_bps)(fee_recipient)(total_volume)(total_listings) )
