#pragma once

#include <fc/reflect/reflect.hpp>

#include <stdint.h>

namespace mart { namespace marketplace {

/**
 *  Storage layout of the marketplace.  Every field lives under its own pointer in the
 *  field store; map-like fields are further keyed by record id or collection address.
 *
 *  Changing these values relocates existing state.
 */
enum class field_pointer : uint16_t
{
    next_listing_id             = 1,
    listing_collection          = 2,
    listing_token_id            = 3,
    listing_seller              = 4,
    listing_price               = 5,
    listing_active              = 6,

    next_bid_id                 = 7,
    bid_collection              = 8,
    bid_token_id                = 9,
    bid_bidder                  = 10,
    bid_amount                  = 11,
    bid_active                  = 12,

    collection_royalty_bps      = 13,
    collection_royalty_recipient= 14,
    collection_registered       = 15,

    platform_fee_bps            = 16,
    platform_fee_recipient      = 17,
    total_volume                = 18,
    total_listings              = 19
};

} } // mart::marketplace

FC_REFLECT_TYPENAME( mart::marketplace::field_pointer )
FC_REFLECT_ENUM( mart::marketplace::field_pointer,
        (next_listing_id)
        (listing_collection)
        (listing_token_id)
        (listing_seller)
        (listing_price)
        (listing_active)
        (next_bid_id)
        (bid_collection)
        (bid_token_id)
        (bid_bidder)
        (bid_amount)
        (bid_active)
        (collection_royalty_bps)
        (collection_royalty_recipient)
        (collection_registered)
        (platform_fee_bps)
        (platform_fee_recipient)
        (total_volume)
        (total_listings)
        );
