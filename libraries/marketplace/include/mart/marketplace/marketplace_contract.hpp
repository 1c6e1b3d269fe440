#pragma once

#include <mart/marketplace/marketplace_engine.hpp>

#include <map>

namespace mart { namespace marketplace {

   namespace detail { class marketplace_contract_impl; }

   /**
    *  @brief the marketplace as the host sees it: selectors and packed calldata in,
    *  packed results out
    *
    *  Nothing here catches; a failed call reaches the host as an fc::exception.
    */
   class marketplace_contract
   {
      public:
         marketplace_contract( const marketplace_config& cfg, db::field_store& store,
                               contract_caller& host, event_sink& events );
         ~marketplace_contract();

         /** calldata = fee recipient (address), fee bps (uint256) */
         void                  on_deployment( const address& sender, const bytes& calldata );

         /** @throws unknown_method if selector names no marketplace method */
         bytes                 execute( const address& sender, method_selector_type selector,
                                        const bytes& calldata );

         /** input = 4 byte selector followed by the calldata */
         bytes                 execute( const address& sender, const bytes& input );

         /** selector -> method name for every method execute() understands */
         std::map<method_selector_type, string> methods()const;

         marketplace_engine&   engine();

      private:
         std::unique_ptr<detail::marketplace_contract_impl> my;
   };

} } // mart::marketplace
