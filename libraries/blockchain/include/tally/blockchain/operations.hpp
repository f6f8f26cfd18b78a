#pragma once

#include <fc/io/enum_type.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/reflect.hpp>

/**
 *  The C keyword 'not' is NOT friendly on VC++ but we still want to use
 *  it for readability, so we will have the pre-processor convert it to the
 *  more traditional form.  The goal here is to make the understanding of
 *  the validation logic as english-like as possible.
 */
#define NOT !

namespace tally { namespace blockchain {

struct transaction_evaluation_state;

// NOTE: values are part of the packed transaction format, never renumber
enum operation_type_enum
{
    null_op_type                        = 0,

    create_poll_op_type                 = 1,
    cast_vote_op_type                   = 2
};

/**
*  A poly-morphic operator that modifies the chain database
*  is some manner.
*/
struct operation
{
    operation():type(null_op_type){}

    operation( const operation& o )
        :type(o.type),data(o.data){}

    operation( operation&& o )
        :type(o.type),data(std::move(o.data)){}

    template<typename OperationType>
    operation( const OperationType& t )
    {
        type = OperationType::type;
        data = fc::raw::pack( t );
    }

    template<typename OperationType>
    OperationType as()const
    {
        FC_ASSERT( (operation_type_enum)type == OperationType::type, "", ("type",type)("OperationType",OperationType::type) );
        return fc::raw::unpack<OperationType>(data);
    }

    operation& operator=( const operation& o )
    {
        if( this == &o ) return *this;
        type = o.type;
        data = o.data;
        return *this;
    }

    operation& operator=( operation&& o )
    {
        if( this == &o ) return *this;
        type = o.type;
        data = std::move(o.data);
        return *this;
    }

    fc::enum_type<uint8_t,operation_type_enum> type;
    std::vector<char> data;
};

} } // tally::blockchain

FC_REFLECT_ENUM( tally::blockchain::operation_type_enum,
        (null_op_type)
        (create_poll_op_type)
        (cast_vote_op_type)
    )

FC_REFLECT( tally::blockchain::operation, (type)(data) )

namespace fc
{
    void to_variant( const tally::blockchain::operation& var, variant& vo );
    void from_variant( const variant& var, tally::blockchain::operation& vo );
}
