#pragma once
#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>

namespace starkname::codec {

   /// A Starknet field element. Values handed out by the codec are always below field_prime().
   using felt    = boost::multiprecision::uint256_t;
   using big_int = boost::multiprecision::cpp_int;

   /// P = 2^251 + 17 * 2^192 + 1
   const felt& field_prime();

   /**
    *  Parses a decimal or 0x-prefixed hexadecimal field element.
    *
    *  @throws felt_parse_exception        on empty input or a character that is not a digit of the base
    *  @throws felt_out_of_range_exception when the value is not below field_prime()
    */
   felt felt_from_string( const std::string& text );

   std::string to_hex( const felt& value );
   std::string to_decimal( const felt& value );

   inline uint32_t to_uint32( const felt& value ) { return value.convert_to<uint32_t>(); }

} // starkname::codec
