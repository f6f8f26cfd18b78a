#pragma once
#include <tally/blockchain/config.hpp>

#include <fc/array.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <string>

namespace fc { namespace ecc {
    class public_key;
    typedef fc::array<char,33>  public_key_data;
} } // fc::ecc

namespace tally { namespace blockchain {

   /**
    *  @brief identity of a wallet, ripemd160( sha512( compressed public key ) )
    *
    *  Poll authorities and voters are both addresses.  The text form is the
    *  prefix followed by base58( addr | checksum ) where the checksum is the first
    *  four bytes of ripemd160( addr ).
    */
   class address
   {
      public:
       address(); ///< the null address, never a valid authority or voter
       explicit address( const std::string& base58str ); ///< throws unless is_valid( base58str )
       address( const fc::ecc::public_key& pub );
       address( const fc::ecc::public_key_data& pub );

       static bool is_valid( const std::string& base58str, const std::string& prefix = TALLY_ADDRESS_PREFIX );
       explicit operator std::string()const;

       fc::ripemd160      addr;
   };
   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

} } // namespace tally::blockchain

namespace fc
{
   class variant;
   void to_variant( const tally::blockchain::address& var,  fc::variant& vo );
   void from_variant( const fc::variant& var,  tally::blockchain::address& vo );
}

namespace std
{
   template<>
   struct hash<tally::blockchain::address>
   {
       public:
         size_t operator()(const tally::blockchain::address &a) const
         {
            return (uint64_t(a.addr._hash[0])<<32) | uint64_t( a.addr._hash[1] );
         }
   };
}

#include <fc/reflect/reflect.hpp>
FC_REFLECT( tally::blockchain::address, (addr) )
