#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace starkname::codec {

   enum class alphabet_set : uint8_t {
      basic,
      extended
   };

   struct symbol {
      alphabet_set set     = alphabet_set::basic;
      uint32_t     ordinal = 0;

      friend constexpr bool operator == ( const symbol& a, const symbol& b ) {
         return a.set == b.set && a.ordinal == b.ordinal;
      }
      friend constexpr bool operator != ( const symbol& a, const symbol& b ) { return !(a == b); }
   };

   namespace alphabet {
      /// Ordinal of a basic character is its index here; 'a' is ordinal 0.
      inline constexpr std::u32string_view basic    = U"abcdefghijklmnopqrstuvwxyz0123456789-";
      inline constexpr std::u32string_view extended = U"这来";

      inline constexpr uint32_t basic_size    = 37;
      inline constexpr uint32_t extended_size = 2;

      /// One digit past the basic ordinals is reserved for the switch into the extended base.
      inline constexpr uint32_t escape_digit        = basic_size;
      inline constexpr uint32_t basic_radix         = basic_size + 1;
      inline constexpr uint32_t extended_radix      = extended_size;
      /// The last position also has to tell a final 'a' apart from the extended characters.
      inline constexpr uint32_t extended_tail_radix = extended_size + 1;

      static_assert( basic.size() == basic_size );
      static_assert( extended.size() == extended_size );
   }

   inline constexpr std::optional<symbol> classify( char32_t c ) {
      if( c >= U'a' && c <= U'z' )
         return symbol{ alphabet_set::basic, static_cast<uint32_t>(c - U'a') };
      if( c >= U'0' && c <= U'9' )
         return symbol{ alphabet_set::basic, static_cast<uint32_t>(c - U'0') + 26 };
      if( c == U'-' )
         return symbol{ alphabet_set::basic, 36 };
      for( uint32_t i = 0; i < alphabet::extended_size; ++i ) {
         if( alphabet::extended[i] == c )
            return symbol{ alphabet_set::extended, i };
      }
      return std::nullopt;
   }

   inline constexpr bool is_supported( char32_t c ) { return classify( c ).has_value(); }

   /// Inverse of classify(); ordinals past the end of a set wrap around.
   inline constexpr char32_t character_of( alphabet_set set, uint32_t ordinal ) {
      if( set == alphabet_set::extended )
         return alphabet::extended[ ordinal % alphabet::extended_size ];
      return alphabet::basic[ ordinal % alphabet::basic_size ];
   }

   inline constexpr char32_t character_of( const symbol& s ) { return character_of( s.set, s.ordinal ); }

   /// A digit of the basic radix that switches the next digit into the extended base.
   inline constexpr bool is_radix_switch( uint32_t digit ) { return digit == alphabet::escape_digit; }

   std::string    to_utf8( char32_t c );
   std::string    to_utf8( std::u32string_view text );

   /// @throws unknown_character_exception if @p text is not valid UTF-8
   std::u32string from_utf8( std::string_view text );

} // starkname::codec
