#include <tally/client/client.hpp>
#include <tally/blockchain/time.hpp>
#include <tally/utilities/key_conversion.hpp>

#include <fc/crypto/rand.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

#include <algorithm>
#include <iostream>
#include <limits>

namespace tally { namespace client {

namespace program_options = boost::program_options;

program_options::variables_map parse_option_variables( int argc, char** argv )
{
   // parse command-line options
   program_options::options_description option_config("Usage");
   option_config.add_options()
         ("help", "Display this help message and exit")

         ("data-dir", program_options::value<string>(), "Set client data directory")
         ("wif-key", program_options::value<string>(), "Private key (wallet import format) used to sign transactions")

         ("command", program_options::value<string>(),
          "One of create-key, create-poll, cast-vote, get-poll, list-polls, latest-poll, has-voted")
         ("args", program_options::value< vector<string> >(), "Command arguments")
         ;

   program_options::positional_options_description p_option_config;
   p_option_config.add( "command", 1 );
   p_option_config.add( "args", -1 );

   program_options::variables_map option_variables;
   try
   {
      program_options::store(program_options::command_line_parser(argc, argv).
                             options(option_config).positional(p_option_config).run(), option_variables);
      program_options::notify(option_variables);
   }
   catch (program_options::error& cmdline_error)
   {
      std::cerr << "Error: " << cmdline_error.what() << "\n";
      std::cerr << option_config << "\n";
      exit(1);
   }

   if (option_variables.count("help") || !option_variables.count("command"))
   {
      std::cout << option_config << "\n";
      std::cout << "Commands:\n"
                << "  create-key\n"
                << "  create-poll <title> <start_ts> <end_ts> <candidate>...\n"
                << "  cast-vote <poll_id> <candidate_idx> [<poll_authority>]\n"
                << "  get-poll <poll_id>\n"
                << "  list-polls\n"
                << "  latest-poll\n"
                << "  has-voted <poll_id> <address>\n";
      exit(option_variables.count("help") ? 0 : 1);
   }

   return option_variables;
}

fc::path get_data_dir( const program_options::variables_map& option_variables )
{ try {
      fc::path datadir;
      if (option_variables.count("data-dir"))
      {
         datadir = fc::path(option_variables["data-dir"].as<string>().c_str());
      }
      else
      {
         string dir_name = TALLY_BLOCKCHAIN_NAME;
         std::string::iterator end_pos = std::remove( dir_name.begin(), dir_name.end(), ' ' );
         dir_name.erase( end_pos, dir_name.end() );
         datadir = fc::app_path() / ( "." + dir_name );
      }
      return datadir;

   } FC_RETHROW_EXCEPTIONS( warn, "error loading config" ) }

fc::logging_config create_default_logging_config( const fc::path& data_dir )
{
   fc::logging_config cfg;
   fc::path log_dir("logs");

   fc::file_appender::config ac;
   ac.filename             = log_dir / "default" / "default.log";
   ac.flush                = true;
   ac.rotate               = true;
   ac.rotation_interval    = fc::hours( 1 );
   ac.rotation_limit       = fc::days( 1 );
   ac.rotation_compression = false;

   std::cerr << "Logging to file: " << (data_dir / ac.filename).preferred_string() << "\n";

   fc::file_appender::config ac_chain;
   ac_chain.filename             = log_dir / "chain" / "chain.log";
   ac_chain.flush                = true;
   ac_chain.rotate               = true;
   ac_chain.rotation_interval    = fc::hours( 1 );
   ac_chain.rotation_limit       = fc::days( 1 );
   ac_chain.rotation_compression = false;

   std::cerr << "Logging chain to file: " << (data_dir / ac_chain.filename).preferred_string() << "\n";

   fc::variants  c  {
      fc::mutable_variant_object( "level","debug")("color", "green"),
            fc::mutable_variant_object( "level","warn")("color", "brown"),
            fc::mutable_variant_object( "level","error")("color", "red") };

   cfg.appenders.push_back(
            fc::appender_config( "stderr", "console",
                                 fc::mutable_variant_object()
                                 ( "stream","std_error")
                                 ( "level_colors", c )
                                 ) );

   cfg.appenders.push_back(fc::appender_config( "default", "file", fc::variant(ac)));
   cfg.appenders.push_back(fc::appender_config( "chain", "file", fc::variant(ac_chain)));

   fc::logger_config dlc;
   dlc.level = fc::log_level::info;
   dlc.name = "default";
   dlc.appenders.push_back("default");

   fc::logger_config dlc_chain;
   dlc_chain.level = fc::log_level::info;
   dlc_chain.name = "chain";
   dlc_chain.appenders.push_back("chain");
   dlc_chain.appenders.push_back("default");
   dlc_chain.appenders.push_back("stderr");

   cfg.loggers.push_back(dlc);
   cfg.loggers.push_back(dlc_chain);

   return cfg;
}

config load_config( const fc::path& datadir )
{ try {
      fc::path config_file = datadir / "config.json";
      config cfg;
      if( fc::exists( config_file ) )
      {
         cfg = fc::json::from_file( config_file ).as<config>();
      }
      else
      {
         std::cerr << "Creating default config file at: " << config_file.preferred_string() << "\n";
         cfg.logging = create_default_logging_config( datadir );
         fc::json::save_to_file( cfg, config_file );
      }

      // the logging_config may contain relative paths.  If it does, expand those to full
      // paths, relative to the data_dir
      for (fc::appender_config& appender : cfg.logging.appenders)
      {
         if (appender.type == "file")
         {
            try
            {
               fc::file_appender::config file_appender_config = appender.args.as<fc::file_appender::config>();
               if (file_appender_config.filename.is_relative())
               {
                  file_appender_config.filename = fc::absolute(datadir / file_appender_config.filename);
                  appender.args = fc::variant(file_appender_config);
               }
            }
            catch (const fc::exception& e)
            {
               wlog("Unexpected exception processing logging config: ${e}", ("e", e));
            }
         }
      }

      FC_ASSERT( cfg.default_transaction_expiration_sec > 0
                 && cfg.default_transaction_expiration_sec <= TALLY_BLOCKCHAIN_MAX_TRANSACTION_EXPIRATION_SEC,
                 "default_transaction_expiration_sec out of range", ("sec",cfg.default_transaction_expiration_sec) );

      return cfg;
} FC_RETHROW_EXCEPTIONS( warn, "unable to load config file ${cfg}", ("cfg",datadir/"config.json")) }

fc::variant_object poll_summary( const poll_record& record, const time_point_sec now )
{
   return fc::mutable_variant_object( "id", record.id() )
                                    ( "poll", record )
                                    ( "phase", record.phase_at( now ) )
                                    ( "total_votes", record.total_votes() )
                                    ( "leaders", record.leaders() );
}

client::client()
:_chain_db( std::make_shared<chain_database>() )
{
}

client::~client()
{
   try
   {
      close();
   }
   catch( const fc::exception& e )
   {
      wlog( "unexpected exception closing client\n ${e}", ("e",e.to_detail_string()) );
   }
}

void client::configure_from_command_line( const program_options::variables_map& option_variables )
{ try {
   fc::path datadir = get_data_dir( option_variables );
   if( !fc::exists( datadir ) )
   {
     std::cerr << "Creating new data directory " << datadir.preferred_string() << "\n";
     fc::create_directories( datadir );
   }

   if( option_variables.count( "wif-key" ) )
   {
      const optional<fc::ecc::private_key> key = utilities::wif_to_key( option_variables["wif-key"].as<string>() );
      FC_ASSERT( key.valid(), "Invalid private key in --wif-key" );
      set_signing_key( *key );
   }

   open( datadir );
} FC_CAPTURE_AND_RETHROW() }

void client::open( const fc::path& data_dir )
{ try {
    _config = load_config( data_dir );

    fc::configure_logging( _config.logging );

    if( _config.simulated_time.valid() )
        blockchain::start_simulated_time( *_config.simulated_time );

    _chain_db->open( data_dir / "chain" );
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

void client::close()
{ try {
    _chain_db->close();
} FC_CAPTURE_AND_RETHROW() }

void client::set_signing_key( const fc::ecc::private_key& key )
{
    _signing_key = key;
}

address client::get_signing_address()const
{ try {
    FC_ASSERT( _signing_key.valid(), "A signing key is required, pass one with --wif-key" );
    return address( _signing_key->get_public_key() );
} FC_CAPTURE_AND_RETHROW() }

signed_transaction client::create_signed_transaction()const
{
    signed_transaction trx;
    trx.set_expiration( blockchain::now(), _config.default_transaction_expiration_sec );
    // two commands with the same content in the same second must still be distinct transactions
    fc::rand_pseudo_bytes( (char*)&trx.nonce, sizeof( trx.nonce ) );
    return trx;
}

fc::variant client::execute_command( const string& command, const vector<string>& arguments )
{ try {
    if( command == "create-key" )
    {
        FC_ASSERT( arguments.empty(), "usage: create-key" );
        return fc::variant( create_key() );
    }
    else if( command == "create-poll" )
    {
        FC_ASSERT( arguments.size() >= 3, "usage: create-poll <title> <start_ts> <end_ts> <candidate>..." );
        const vector<string> candidates( arguments.begin() + 3, arguments.end() );
        return fc::variant( create_poll( arguments[ 0 ],
                                         fc::variant( arguments[ 1 ] ).as_int64(),
                                         fc::variant( arguments[ 2 ] ).as_int64(),
                                         candidates ) );
    }
    else if( command == "cast-vote" )
    {
        FC_ASSERT( arguments.size() == 2 || arguments.size() == 3,
                   "usage: cast-vote <poll_id> <candidate_idx> [<poll_authority>]" );
        const uint64_t candidate_idx = fc::variant( arguments[ 1 ] ).as_uint64();
        FC_ASSERT( candidate_idx <= std::numeric_limits<uint8_t>::max(), "candidate index out of range" );
        optional<address> poll_authority;
        if( arguments.size() == 3 )
            poll_authority = address( arguments[ 2 ] );
        return fc::variant( cast_vote( poll_id_type( arguments[ 0 ] ), uint8_t( candidate_idx ), poll_authority ) );
    }
    else if( command == "get-poll" )
    {
        FC_ASSERT( arguments.size() == 1, "usage: get-poll <poll_id>" );
        return fc::variant( get_poll( poll_id_type( arguments[ 0 ] ) ) );
    }
    else if( command == "list-polls" )
    {
        FC_ASSERT( arguments.empty(), "usage: list-polls" );
        return fc::variant( list_polls() );
    }
    else if( command == "latest-poll" )
    {
        FC_ASSERT( arguments.empty(), "usage: latest-poll" );
        return get_latest_poll();
    }
    else if( command == "has-voted" )
    {
        FC_ASSERT( arguments.size() == 2, "usage: has-voted <poll_id> <address>" );
        return fc::variant( has_voted( poll_id_type( arguments[ 0 ] ), address( arguments[ 1 ] ) ) );
    }

    FC_THROW_EXCEPTION( fc::invalid_arg_exception, "Unknown command ${command}", ("command",command) );
} FC_CAPTURE_AND_RETHROW( (command)(arguments) ) }

fc::variant_object client::create_key()const
{
    const fc::ecc::private_key key = fc::ecc::private_key::generate();

    return fc::mutable_variant_object( "address", address( key.get_public_key() ) )
                                     ( "wif_private_key", utilities::key_to_wif( key ) );
}

fc::variant_object client::create_poll( const string& title,
                                        int64_t start_ts,
                                        int64_t end_ts,
                                        const vector<string>& candidates )
{ try {
    const address authority = get_signing_address();

    signed_transaction trx = create_signed_transaction();
    trx.create_poll( authority, title, candidates, start_ts, end_ts );
    trx.sign( *_signing_key, _chain_db->get_chain_id() );

    _chain_db->apply_transaction( trx );

    return fc::mutable_variant_object( "transaction_id", trx.id() )
                                     ( "poll_id", poll_record::make_id( authority, title ) );
} FC_CAPTURE_AND_RETHROW( (title)(start_ts)(end_ts)(candidates) ) }

fc::variant_object client::cast_vote( const poll_id_type& poll_id,
                                      uint8_t candidate_idx,
                                      const optional<address>& poll_authority )
{ try {
    const address voter = get_signing_address();

    signed_transaction trx = create_signed_transaction();
    trx.cast_vote( poll_id, voter, candidate_idx, poll_authority );
    trx.sign( *_signing_key, _chain_db->get_chain_id() );

    _chain_db->apply_transaction( trx );

    return fc::mutable_variant_object( "transaction_id", trx.id() )
                                     ( "ballot_id", ballot_record::make_id( poll_id, voter ) );
} FC_CAPTURE_AND_RETHROW( (poll_id)(candidate_idx)(poll_authority) ) }

fc::variant_object client::get_poll( const poll_id_type& poll_id )const
{ try {
    const opoll_record record = _chain_db->get_poll_record( poll_id );
    if( !record.valid() )
        FC_CAPTURE_AND_THROW( unknown_poll, (poll_id) );
    return poll_summary( *record, _chain_db->now() );
} FC_CAPTURE_AND_RETHROW( (poll_id) ) }

fc::variants client::list_polls()const
{ try {
    fc::variants results;
    const time_point_sec now = _chain_db->now();
    for( const poll_record& record : _chain_db->list_polls() )
        results.push_back( fc::variant( poll_summary( record, now ) ) );
    return results;
} FC_CAPTURE_AND_RETHROW() }

fc::variant client::get_latest_poll()const
{ try {
    const opoll_record record = _chain_db->get_latest_poll();
    if( !record.valid() ) return fc::variant();
    return fc::variant( poll_summary( *record, _chain_db->now() ) );
} FC_CAPTURE_AND_RETHROW() }

bool client::has_voted( const poll_id_type& poll_id, const address& wallet )const
{ try {
    return _chain_db->has_voted( poll_id, wallet );
} FC_CAPTURE_AND_RETHROW( (poll_id)(wallet) ) }

} } // tally::client
