#include <boost/program_options.hpp>

#include <tally/client/client.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

#include <iostream>

int main( int argc, char** argv )
{
   int exit_code = 0;
   try
   {
      const auto option_variables = tally::client::parse_option_variables( argc, argv );

      std::vector<std::string> arguments;
      if( option_variables.count( "args" ) )
         arguments = option_variables["args"].as< std::vector<std::string> >();

      tally::client::client_ptr client = std::make_shared<tally::client::client>();
      client->configure_from_command_line( option_variables );

      const fc::variant result = client->execute_command( option_variables["command"].as<std::string>(), arguments );
      std::cout << fc::json::to_pretty_string( result ) << "\n";

      client->close();
   }
   catch ( const fc::exception& e )
   {
      std::cerr << "------------ error --------------\n"
                << e.to_detail_string() << "\n";
      wlog( "${e}", ("e", e.to_detail_string() ) );
      exit_code = 1;
   }

   /*
    * Restore the initial logging config so the file_appenders are destroyed
    * here rather than during global destruction.
    */
   fc::configure_logging( fc::logging_config::default_config() );
   return exit_code;
}
