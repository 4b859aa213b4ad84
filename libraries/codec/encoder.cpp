#include <starkname/codec/encoder.hpp>
#include <starkname/codec/alphabet.hpp>
#include <starkname/codec/exceptions.hpp>
#include <starkname/codec/trailing_bias.hpp>

namespace starkname::codec {

   felt encode( std::string_view label ) {
      const std::u32string code_points = from_utf8( label );

      for( size_t i = 0; i < code_points.size(); ++i ) {
         STARKNAME_ASSERT( is_supported( code_points[i] ), unknown_character_exception,
                           "unknown character '${character}' at position ${position} of '${label}'",
                           ("character", to_utf8( code_points[i] ))("position", i)("label", std::string( label )) );
      }

      const std::u32string biased = apply_trailing_bias( code_points );

      big_int value      = 0;
      big_int multiplier = 1;
      for( size_t i = 0; i < biased.size(); ++i ) {
         const symbol s    = *classify( biased[i] );
         const bool   last = i + 1 == biased.size();

         if( s.set == alphabet_set::basic ) {
            const uint32_t digit = (last && s.ordinal == 0) ? alphabet::escape_digit : s.ordinal;
            value      += multiplier * digit;
            multiplier *= alphabet::basic_radix;
            continue;
         }

         value      += multiplier * alphabet::escape_digit;
         multiplier *= alphabet::basic_radix;
         if( last ) {
            value      += multiplier * (s.ordinal + 1);
            multiplier *= alphabet::extended_tail_radix;
         } else {
            value      += multiplier * s.ordinal;
            multiplier *= alphabet::extended_radix;
         }
      }

      STARKNAME_ASSERT( value < big_int( field_prime() ), label_too_long_exception,
                        "label '${label}' of ${n} characters does not fit in a field element",
                        ("label", std::string( label ))("n", code_points.size()) );
      return static_cast<felt>( value );
   }

} // starkname::codec
