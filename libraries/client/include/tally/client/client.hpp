#pragma once

#include <tally/blockchain/chain_database.hpp>

#include <fc/log/logger_config.hpp>

#include <boost/program_options.hpp>
#include <memory>

namespace tally { namespace client {

    using namespace tally::blockchain;

    boost::program_options::variables_map parse_option_variables( int argc, char** argv );
    fc::path get_data_dir( const boost::program_options::variables_map& option_variables );

    struct config
    {
        fc::logging_config          logging = fc::logging_config::default_config();
        uint32_t                    default_transaction_expiration_sec = TALLY_BLOCKCHAIN_DEFAULT_TRANSACTION_EXPIRATION_SEC;
        /** when set the client runs on simulated time starting here */
        optional<fc::time_point_sec> simulated_time;
    };

    fc::logging_config create_default_logging_config( const fc::path& data_dir );
    config load_config( const fc::path& data_dir );

    /**
     * @class client
     * @brief signs poll transactions with a single key and applies them to a local chain database
     */
    class client
    {
       public:
         client();
         ~client();

         void configure_from_command_line( const boost::program_options::variables_map& option_variables );
         void open( const fc::path& data_dir );
         void close();

         void set_signing_key( const fc::ecc::private_key& key );
         address get_signing_address()const;

         chain_database_ptr get_chain()const { return _chain_db; }

         /** runs one named command and returns its JSON result */
         fc::variant execute_command( const string& command, const vector<string>& arguments );

         fc::variant_object create_key()const;

         fc::variant_object create_poll( const string& title,
                                         int64_t start_ts,
                                         int64_t end_ts,
                                         const vector<string>& candidates );

         fc::variant_object cast_vote( const poll_id_type& poll_id,
                                       uint8_t candidate_idx,
                                       const optional<address>& poll_authority = optional<address>() );

         fc::variant_object get_poll( const poll_id_type& poll_id )const;
         fc::variants       list_polls()const;
         fc::variant        get_latest_poll()const;
         bool               has_voted( const poll_id_type& poll_id, const address& wallet )const;

       private:
         signed_transaction create_signed_transaction()const;

         config                          _config;
         chain_database_ptr              _chain_db;
         optional<fc::ecc::private_key>  _signing_key;
    };
    typedef std::shared_ptr<client> client_ptr;

    /** the poll record plus everything derived from it at the current time */
    fc::variant_object poll_summary( const poll_record& record, const time_point_sec now );

} } // tally::client

FC_REFLECT( tally::client::config,
        (logging)
        (default_transaction_expiration_sec)
        (simulated_time)
    )
