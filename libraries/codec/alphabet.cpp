#include <starkname/codec/alphabet.hpp>
#include <starkname/codec/exceptions.hpp>

#include <fc/utf8.hpp>

#include <boost/format.hpp>

namespace starkname::codec {

   std::string to_utf8( char32_t c ) {
      return to_utf8( std::u32string_view( &c, 1 ) );
   }

   std::string to_utf8( std::u32string_view text ) {
      std::wstring wide( text.begin(), text.end() );
      std::string  out;
      fc::encodeUtf8( wide, &out );
      return out;
   }

   namespace {
      /// Length of the longest prefix of @p input that is valid UTF-8.
      size_t valid_utf8_prefix( const std::string& input ) {
         size_t length = input.size();
         while( length > 0 && !fc::is_utf8( input.substr( 0, length ) ) )
            --length;
         return length;
      }
   }

   std::u32string from_utf8( std::string_view text ) {
      std::string  input( text );
      std::wstring wide;

      if( !fc::is_utf8( input ) ) {
         const size_t offset = valid_utf8_prefix( input );
         fc::decodeUtf8( input.substr( 0, offset ), &wide );
         const auto byte = static_cast<unsigned>( static_cast<unsigned char>( input[offset] ) );
         STARKNAME_THROW( unknown_character_exception,
                          "invalid UTF-8 byte ${character} at position ${position} of '${label}'",
                          ("character", (boost::format( "\\x%02x" ) % byte).str())
                          ("position", wide.size())("offset", offset)
                          ("label", fc::prune_invalid_utf8( input )) );
      }

      fc::decodeUtf8( input, &wide );
      return std::u32string( wide.begin(), wide.end() );
   }

} // starkname::codec
