#pragma once

#include <fc/exception/exception.hpp>

namespace mart { namespace marketplace {

FC_DECLARE_EXCEPTION(         marketplace_exception,                                                          40000, "Marketplace Exception" );

FC_DECLARE_DERIVED_EXCEPTION( invalid_argument,             mart::marketplace::marketplace_exception,         41000, "invalid argument" );
FC_DECLARE_DERIVED_EXCEPTION( null_address,                 mart::marketplace::invalid_argument,              41001, "null address" );
FC_DECLARE_DERIVED_EXCEPTION( zero_amount,                  mart::marketplace::invalid_argument,              41002, "zero amount" );
FC_DECLARE_DERIVED_EXCEPTION( bps_out_of_range,             mart::marketplace::invalid_argument,              41003, "basis points out of range" );
FC_DECLARE_DERIVED_EXCEPTION( self_purchase,                mart::marketplace::invalid_argument,              41004, "buyer cannot be seller" );
FC_DECLARE_DERIVED_EXCEPTION( malformed_calldata,           mart::marketplace::invalid_argument,              41005, "malformed calldata" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_method,               mart::marketplace::invalid_argument,              41006, "unknown method" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_config,               mart::marketplace::invalid_argument,              41007, "invalid config" );

FC_DECLARE_DERIVED_EXCEPTION( unauthorized,                 mart::marketplace::marketplace_exception,         42000, "unauthorized" );
FC_DECLARE_DERIVED_EXCEPTION( not_token_owner,              mart::marketplace::unauthorized,                  42001, "caller is not the token owner" );
FC_DECLARE_DERIVED_EXCEPTION( not_approved_for_all,         mart::marketplace::unauthorized,                  42002, "marketplace not approved for transfers" );

FC_DECLARE_DERIVED_EXCEPTION( record_not_found,             mart::marketplace::marketplace_exception,         43000, "record does not exist" );
FC_DECLARE_DERIVED_EXCEPTION( record_inactive,              mart::marketplace::marketplace_exception,         44000, "record is not active" );
FC_DECLARE_DERIVED_EXCEPTION( collection_not_registered,    mart::marketplace::marketplace_exception,         45000, "collection not registered" );
FC_DECLARE_DERIVED_EXCEPTION( remote_call_failed,           mart::marketplace::marketplace_exception,         46000, "remote call failed" );
FC_DECLARE_DERIVED_EXCEPTION( addition_overflow,            mart::marketplace::marketplace_exception,         47000, "addition overflow" );
FC_DECLARE_DERIVED_EXCEPTION( not_deployed,                 mart::marketplace::marketplace_exception,         48000, "marketplace not deployed" );

} } // mart::marketplace
