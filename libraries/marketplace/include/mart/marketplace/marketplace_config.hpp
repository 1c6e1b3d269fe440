#pragma once

#include <mart/marketplace/address.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/logger_config.hpp>

namespace mart { namespace marketplace {

   struct marketplace_config
   {
      /** the marketplace's own address, the operator collections must approve */
      address              contract_address;
      /** the only caller allowed to deploy, register collections and change fees */
      address              administrator;

      fc::logging_config   logging = fc::logging_config::default_config();

      /** @throws invalid_config if either address is null */
      void                 validate()const;
   };

   /**
    *  Reads and validates a JSON config file.  Relative file appender paths in the logging
    *  section are resolved against the directory holding the config file.
    */
   marketplace_config      load_config( const fc::path& config_file );

   /** applies cfg.logging to the fc logging system */
   void                    configure_logging( const marketplace_config& cfg );

} } // mart::marketplace

FC_REFLECT( mart::marketplace::marketplace_config,
        (contract_address)
        (administrator)
        (logging)
        )
