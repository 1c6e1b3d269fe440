#include <mart/marketplace/exceptions.hpp>
#include <mart/marketplace/marketplace_config.hpp>

#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>

namespace mart { namespace marketplace {

   void marketplace_config::validate()const
   {
      if( contract_address.is_null() )
         FC_THROW_EXCEPTION( invalid_config, "contract_address must not be the null address" );
      if( administrator.is_null() )
         FC_THROW_EXCEPTION( invalid_config, "administrator must not be the null address" );
   }

   marketplace_config load_config( const fc::path& config_file )
   { try {
      if( !fc::exists( config_file ) )
         FC_THROW_EXCEPTION( invalid_config, "config file ${f} does not exist", ("f",config_file) );

      marketplace_config cfg = fc::json::from_file( config_file ).as<marketplace_config>();
      cfg.validate();

      const fc::path base_dir = fc::absolute( config_file ).parent_path();
      for( fc::appender_config& appender : cfg.logging.appenders )
      {
         if( appender.type != "file" )
            continue;

         fc::file_appender::config file_appender_config = appender.args.as<fc::file_appender::config>();
         if( file_appender_config.filename.is_relative() )
         {
            file_appender_config.filename = fc::absolute( base_dir / file_appender_config.filename );
            appender.args = fc::variant( file_appender_config );
         }
      }
      return cfg;
   } FC_CAPTURE_AND_RETHROW( (config_file) ) }

   void configure_logging( const marketplace_config& cfg )
   {
      fc::configure_logging( cfg.logging );
      ilog( "marketplace ${contract} administered by ${admin}",
            ("contract",cfg.contract_address)("admin",cfg.administrator) );
   }

} } // mart::marketplace
