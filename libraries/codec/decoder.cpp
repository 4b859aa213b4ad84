#include <starkname/codec/decoder.hpp>
#include <starkname/codec/alphabet.hpp>
#include <starkname/codec/trailing_bias.hpp>

namespace starkname::codec {

   std::string decode( const felt& value ) {
      felt           remaining = value;
      std::u32string label;

      while( remaining != 0 ) {
         const uint32_t digit = to_uint32( remaining % alphabet::basic_radix );
         remaining /= alphabet::basic_radix;

         if( !is_radix_switch( digit ) ) {
            label += character_of( alphabet_set::basic, digit );
            continue;
         }

         if( remaining < alphabet::extended_tail_radix ) {
            // last position: 0 is a final 'a', anything else an extended character
            const uint32_t tail = to_uint32( remaining );
            remaining = 0;
            label += tail == 0 ? character_of( alphabet_set::basic, 0 )
                               : character_of( alphabet_set::extended, tail - 1 );
         } else {
            label += character_of( alphabet_set::extended, to_uint32( remaining % alphabet::extended_radix ) );
            remaining /= alphabet::extended_radix;
         }
      }

      return to_utf8( remove_trailing_bias( std::move( label ) ) );
   }

} // starkname::codec
