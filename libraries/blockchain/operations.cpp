#include <tally/blockchain/operation_factory.hpp>
#include <tally/blockchain/operations.hpp>
#include <tally/blockchain/poll_operations.hpp>

#include <fc/io/raw_variant.hpp>
#include <fc/reflect/variant.hpp>

namespace tally { namespace blockchain {

    const operation_type_enum create_poll_operation::type               = create_poll_op_type;
    const operation_type_enum cast_vote_operation::type                 = cast_vote_op_type;

    static bool first_chain = []() -> bool
    {
        tally::blockchain::operation_factory::instance().register_operation<create_poll_operation>();
        tally::blockchain::operation_factory::instance().register_operation<cast_vote_operation>();

        return true;
    }();

    operation_factory& operation_factory::instance()
    {
        static std::unique_ptr<operation_factory> inst( new operation_factory() );
        return *inst;
    }

    const operation_factory::operation_handler_base& operation_factory::get_handler( const operation& op )const
    {
        const auto iter = _handlers.find( uint8_t( op.type.value ) );
        if( iter == _handlers.end() )
            FC_THROW_EXCEPTION( unsupported_chain_operation, "unknown operation type ${type}", ("type",op.type) );
        return *iter->second;
    }

    void operation_factory::evaluate( transaction_evaluation_state& eval_state, const operation& op )const
    { try {
        get_handler( op ).evaluate( eval_state, op );
    } FC_CAPTURE_AND_RETHROW( (op) ) }

    /** { "type": "<name>_op_type", "data": { ...fields... } } */
    void operation_factory::to_variant( const operation& in, fc::variant& output )const
    { try {
        output = fc::mutable_variant_object( "type", in.type )
                                           ( "data", get_handler( in ).data_to_variant( in ) );
    } FC_CAPTURE_AND_RETHROW() }

    void operation_factory::from_variant( const fc::variant& in, operation& output )const
    { try {
        const fc::variant_object& obj = in.get_object();
        output.type = obj["type"].as<operation_type_enum>();
        output.data = get_handler( output ).data_from_variant( obj["data"] );
    } FC_CAPTURE_AND_RETHROW( (in) ) }

} } // tally::blockchain

namespace fc
{
    void to_variant( const tally::blockchain::operation& var, variant& vo )
    {
        tally::blockchain::operation_factory::instance().to_variant( var, vo );
    }

    void from_variant( const variant& var, tally::blockchain::operation& vo )
    {
        tally::blockchain::operation_factory::instance().from_variant( var, vo );
    }
}
