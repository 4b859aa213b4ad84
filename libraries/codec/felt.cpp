#include <starkname/codec/felt.hpp>
#include <starkname/codec/exceptions.hpp>

#include <boost/algorithm/string.hpp>

#include <sstream>

namespace starkname::codec {

   namespace {
      int digit_value( char c ) {
         if( c >= '0' && c <= '9' ) return c - '0';
         if( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
         if( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
         return -1;
      }
   }

   const felt& field_prime() {
      static const felt prime = (felt(1) << 251) + (felt(17) << 192) + 1;
      return prime;
   }

   felt felt_from_string( const std::string& text ) {
      const bool hex = boost::algorithm::istarts_with( text, "0x" );
      const std::string digits = hex ? text.substr( 2 ) : text;
      const int base = hex ? 16 : 10;

      STARKNAME_ASSERT( !digits.empty(), felt_parse_exception,
                        "'${text}' is not a field element", ("text", text) );

      // digit by digit instead of cpp_int( text ) so the error names the offending position
      big_int value = 0;
      for( size_t i = 0; i < digits.size(); ++i ) {
         const int d = digit_value( digits[i] );
         STARKNAME_ASSERT( d >= 0 && d < base, felt_parse_exception,
                           "'${text}' is not a field element: unexpected '${c}' at position ${pos}",
                           ("text", text)("c", std::string( 1, digits[i] ))("pos", i + (hex ? 2 : 0)) );
         value = value * base + d;
      }

      STARKNAME_ASSERT( value < big_int( field_prime() ), felt_out_of_range_exception,
                        "${text} is not below the field prime", ("text", text) );
      return static_cast<felt>( value );
   }

   std::string to_hex( const felt& value ) {
      std::ostringstream ss;
      ss << std::hex << value;
      return "0x" + boost::algorithm::to_lower_copy( ss.str() );
   }

   std::string to_decimal( const felt& value ) {
      return value.str();
   }

} // starkname::codec
