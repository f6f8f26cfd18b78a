#pragma once
#include <tally/blockchain/operations.hpp>
#include <tally/blockchain/exceptions.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

#include <memory>
#include <unordered_map>

namespace tally { namespace blockchain {

   /**
    * @class operation_factory
    *
    *  Maps each operation_type_enum to the concrete operation struct packed in
    *  operation::data.  JSON conversion and evaluation both dispatch through here,
    *  so an operation type that was never registered can be neither parsed nor applied.
    */
   class operation_factory
   {
       public:
          static operation_factory& instance();

          class operation_handler_base
          {
             public:
                  virtual ~operation_handler_base(){};
                  virtual fc::variant data_to_variant( const operation& op )const = 0;
                  virtual std::vector<char> data_from_variant( const fc::variant& data )const = 0;
                  virtual void evaluate( transaction_evaluation_state& eval_state, const operation& op )const = 0;
          };

          template<typename OperationType>
          class operation_handler : public operation_handler_base
          {
             public:
                  virtual fc::variant data_to_variant( const operation& op )const override
                  {
                     return fc::variant( op.as<OperationType>() );
                  }

                  virtual std::vector<char> data_from_variant( const fc::variant& data )const override
                  {
                     return fc::raw::pack( data.as<OperationType>() );
                  }

                  virtual void evaluate( transaction_evaluation_state& eval_state, const operation& op )const override
                  {
                     op.as<OperationType>().evaluate( eval_state );
                  }
          };

          template<typename OperationType>
          void register_operation()
          {
             const auto inserted = _handlers.emplace( uint8_t( OperationType::type ),
                                                      std::make_shared< operation_handler<OperationType> >() );
             FC_ASSERT( inserted.second, "operation type ${type} registered twice", ("type",OperationType::type) );
          }

          /// defined in operations.cpp
          void evaluate( transaction_evaluation_state& eval_state, const operation& op )const;
          /// defined in operations.cpp
          void to_variant( const operation& in, fc::variant& output )const;
          /// defined in operations.cpp
          void from_variant( const fc::variant& in, operation& output )const;

       private:
          const operation_handler_base& get_handler( const operation& op )const;

          std::unordered_map<uint8_t, std::shared_ptr<operation_handler_base> > _handlers;
   };

} } // tally::blockchain
