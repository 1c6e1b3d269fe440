#pragma once

#include <stdint.h>

/** @file mart/marketplace/config.hpp
 *  @brief Defines global constants that determine marketplace behavior
 */

/**
 *  All rates are expressed in basis points of this denominator.  The marketplace
 *  only stores rates, splitting a settlement amount is left to the payment layer.
 */
#define MART_BPS_DENOMINATOR                                10000
#define MART_MAX_ROYALTY_BPS                                1000 // 10%
#define MART_MAX_PLATFORM_FEE_BPS                           500  // 5%

/** the first id handed out by the listing and bid ledgers */
#define MART_FIRST_RECORD_ID                                1

#define MART_WORD_SIZE                                      32
#define MART_ADDRESS_SIZE                                   32
#define MART_SELECTOR_SIZE                                  4

/**
 *  Method names of the collection contracts the marketplace calls into.  Selectors
 *  are derived from these names, changing them breaks compatibility with deployed
 *  collections.
 */
#define MART_COLLECTION_OWNER_OF_METHOD                     "ownerOf"
#define MART_COLLECTION_IS_APPROVED_FOR_ALL_METHOD          "isApprovedForAll"
#define MART_COLLECTION_TRANSFER_METHOD                     "safeTransferFrom"

#define MART_DEFAULT_CONFIG_FILENAME                        "config.json"
