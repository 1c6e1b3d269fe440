#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>
#include <mart/marketplace/platform_record.hpp>

namespace mart { namespace marketplace {

   platform_accounting::platform_accounting( db::field_store& store )
   :_fee_bps( store, field_pointer::platform_fee_bps ),
    _fee_recipient( store, field_pointer::platform_fee_recipient ),
    _total_volume( store, field_pointer::total_volume ),
    _total_listings( store, field_pointer::total_listings )
   {
   }

   void platform_accounting::set_fee_bps( const uint256& fee_bps )
   {
      if( fee_bps > MART_MAX_PLATFORM_FEE_BPS )
         FC_THROW_EXCEPTION( bps_out_of_range, "platform fee of ${bps} bps exceeds maximum of ${max}",
                             ("bps",fee_bps)("max",MART_MAX_PLATFORM_FEE_BPS) );
      _fee_bps.set( fee_bps );
   }

   void platform_accounting::set_fee_recipient( const address& recipient )
   {
      if( recipient.is_null() )
         FC_THROW_EXCEPTION( null_address, "invalid fee recipient" );
      _fee_recipient.set( recipient );
   }

   void platform_accounting::record_volume( const uint256& amount )
   { try {
      _total_volume.set( safe_add( _total_volume.get(), amount ) );
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void platform_accounting::increment_listing_count()
   {
      _total_listings.set( safe_add( _total_listings.get(), 1 ) );
   }

   uint256 platform_accounting::fee_bps()const        { return _fee_bps.get();        }
   address platform_accounting::fee_recipient()const  { return _fee_recipient.get();  }
   uint256 platform_accounting::total_volume()const   { return _total_volume.get();   }
   uint256 platform_accounting::total_listings()const { return _total_listings.get(); }

   platform_record platform_accounting::get()const
   {
      platform_record rec;
      rec.fee_bps        = fee_bps();
      rec.fee_recipient  = fee_recipient();
      rec.total_volume   = total_volume();
      rec.total_listings = total_listings();
      return rec;
   }

} } // mart::marketplace
