#include <tally/blockchain/address.hpp>
#include <tally/blockchain/types.hpp>

#include <fc/crypto/base58.hpp>
#include <fc/variant.hpp>
#include <string.h>

namespace tally { namespace blockchain {

   namespace
   {
      uint32_t address_checksum( const fc::ripemd160& addr )
      {
         return fc::ripemd160::hash( addr.data(), addr.data_size() )._hash[0];
      }

      /** null when the text is not prefix + base58( addr | checksum ) with a matching checksum */
      optional<fc::ripemd160> decode_address( const string& text, const string& prefix )
      {
         if( text.size() <= prefix.size() || text.compare( 0, prefix.size(), prefix ) != 0 )
            return optional<fc::ripemd160>();

         vector<char> bin;
         try
         {
            bin = fc::from_base58( text.substr( prefix.size() ) );
         }
         catch( const fc::parse_error_exception& )
         {
            return optional<fc::ripemd160>();
         }

         fc::ripemd160 addr;
         uint32_t checksum = 0;
         if( bin.size() != sizeof( addr ) + sizeof( checksum ) )
            return optional<fc::ripemd160>();

         memcpy( addr.data(), bin.data(), sizeof( addr ) );
         memcpy( &checksum, bin.data() + sizeof( addr ), sizeof( checksum ) );
         if( checksum != address_checksum( addr ) )
            return optional<fc::ripemd160>();

         return addr;
      }
   }

   address::address(){}

   address::address( const string& base58str )
   {
      const optional<fc::ripemd160> decoded = decode_address( base58str, TALLY_ADDRESS_PREFIX );
      FC_ASSERT( decoded.valid(), "invalid address ${a}", ("a",base58str) );
      addr = *decoded;
   }

   address::address( const fc::ecc::public_key& pub )
   {
      const fc::ecc::public_key_data key_data = pub.serialize();
      addr = fc::ripemd160::hash( fc::sha512::hash( key_data.data, sizeof( key_data ) ) );
   }

   address::address( const fc::ecc::public_key_data& pub )
   {
      addr = fc::ripemd160::hash( fc::sha512::hash( pub.data, sizeof( pub ) ) );
   }

   bool address::is_valid( const string& base58str, const string& prefix )
   {
      return decode_address( base58str, prefix ).valid();
   }

   address::operator string()const
   {
      const uint32_t checksum = address_checksum( addr );

      vector<char> bin( sizeof( addr ) + sizeof( checksum ) );
      memcpy( bin.data(), addr.data(), sizeof( addr ) );
      memcpy( bin.data() + sizeof( addr ), &checksum, sizeof( checksum ) );
      return TALLY_ADDRESS_PREFIX + fc::to_base58( bin.data(), bin.size() );
   }

} } // namespace tally::blockchain

namespace fc
{
    void to_variant( const tally::blockchain::address& var,  variant& vo )
    {
        vo = std::string(var);
    }
    void from_variant( const variant& var,  tally::blockchain::address& vo )
    {
        vo = tally::blockchain::address( var.as_string() );
    }
}
