#pragma once

#include <fc/exception/exception.hpp>

namespace tally { namespace blockchain {

FC_DECLARE_EXCEPTION(         blockchain_exception,                                                    30000, "Blockchain Exception" );
FC_DECLARE_DERIVED_EXCEPTION( addition_overflow,                tally::blockchain::blockchain_exception, 30002, "addition overflow" );
FC_DECLARE_DERIVED_EXCEPTION( unsupported_chain_operation,      tally::blockchain::blockchain_exception, 30005, "unsupported chain operation" );
FC_DECLARE_DERIVED_EXCEPTION( duplicate_transaction,            tally::blockchain::blockchain_exception, 30007, "duplicate transaction" );

FC_DECLARE_EXCEPTION(         evaluation_error,                                                    31000, "Evaluation Error" );
FC_DECLARE_DERIVED_EXCEPTION( missing_signature,                tally::blockchain::evaluation_error, 31005, "missing signature" );
FC_DECLARE_DERIVED_EXCEPTION( expired_transaction,              tally::blockchain::evaluation_error, 31010, "expired transaction" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_transaction_expiration,   tally::blockchain::evaluation_error, 31011, "invalid transaction expiration" );
FC_DECLARE_DERIVED_EXCEPTION( oversized_transaction,            tally::blockchain::evaluation_error, 31012, "transaction exceeded the maximum transaction size" );
FC_DECLARE_DERIVED_EXCEPTION( empty_transaction,                tally::blockchain::evaluation_error, 31013, "transaction has no operations" );

// poll configuration
FC_DECLARE_DERIVED_EXCEPTION( not_enough_candidates,            tally::blockchain::evaluation_error, 39001, "not enough candidates" );
FC_DECLARE_DERIVED_EXCEPTION( too_many_candidates,              tally::blockchain::evaluation_error, 39002, "too many candidates" );
FC_DECLARE_DERIVED_EXCEPTION( title_too_long,                   tally::blockchain::evaluation_error, 39003, "title too long" );
FC_DECLARE_DERIVED_EXCEPTION( bad_schedule,                     tally::blockchain::evaluation_error, 39004, "start/end timestamps invalid" );
FC_DECLARE_DERIVED_EXCEPTION( empty_candidate_name,             tally::blockchain::evaluation_error, 39005, "candidate name cannot be empty" );
FC_DECLARE_DERIVED_EXCEPTION( candidate_name_too_long,          tally::blockchain::evaluation_error, 39006, "candidate name too long" );

// voting window
FC_DECLARE_DERIVED_EXCEPTION( too_early,                        tally::blockchain::evaluation_error, 39101, "voting has not started" );
FC_DECLARE_DERIVED_EXCEPTION( poll_closed,                      tally::blockchain::evaluation_error, 39102, "voting is closed" );

// bad reference
FC_DECLARE_DERIVED_EXCEPTION( bad_candidate,                    tally::blockchain::evaluation_error, 39201, "candidate index out of range" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_poll,                     tally::blockchain::evaluation_error, 39202, "unknown poll" );
FC_DECLARE_DERIVED_EXCEPTION( authority_mismatch,               tally::blockchain::evaluation_error, 39203, "poll authority mismatch" );

// record allocation
FC_DECLARE_DERIVED_EXCEPTION( record_already_exists,            tally::blockchain::evaluation_error, 39301, "record already exists at derived address" );
FC_DECLARE_DERIVED_EXCEPTION( record_too_large,                 tally::blockchain::evaluation_error, 39302, "record exceeds its declared maximum size" );

} } // tally::blockchain
