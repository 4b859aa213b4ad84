#include <boost/test/unit_test.hpp>
#include <starkname/codec/alphabet.hpp>
#include <starkname/codec/exceptions.hpp>
#include <starkname/codec/trailing_bias.hpp>

using namespace starkname::codec;

BOOST_AUTO_TEST_SUITE(alphabet_tests)

BOOST_AUTO_TEST_CASE(classify_basic_test) {
try {
   uint32_t expected_ordinal{}; // Will increment through [0,37)

   for( char32_t c = U'a'; c <= U'z'; ++c ) {
      BOOST_TEST( (classify( c ) == symbol{ alphabet_set::basic, expected_ordinal }) );
      ++expected_ordinal;
   }
   for( char32_t c = U'0'; c <= U'9'; ++c ) {
      BOOST_TEST( (classify( c ) == symbol{ alphabet_set::basic, expected_ordinal }) );
      ++expected_ordinal;
   }
   BOOST_TEST( (classify( U'-' ) == symbol{ alphabet_set::basic, expected_ordinal }) );
   ++expected_ordinal;

   BOOST_TEST( expected_ordinal == alphabet::basic_size );

   // 'a' is a real symbol with ordinal 0, not an absence
   BOOST_REQUIRE( classify( U'a' ).has_value() );
   BOOST_TEST( classify( U'a' )->ordinal == 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(classify_extended_test) {
try {
   BOOST_TEST( (classify( U'这' ) == symbol{ alphabet_set::extended, 0 }) );
   BOOST_TEST( (classify( U'来' ) == symbol{ alphabet_set::extended, 1 }) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(classify_unsupported_test) {
try {
   for( char32_t c : { U'$', U'.', U'A', U'Z', U'_', U' ', U'/', U'`', U'{', U'\0', U'é', U'中' } ) {
      BOOST_TEST( !classify( c ).has_value() );
      BOOST_TEST( !is_supported( c ) );
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(character_of_test) {
try {
   for( uint32_t i = 0; i < alphabet::basic_size; ++i ) {
      const char32_t c = character_of( alphabet_set::basic, i );
      BOOST_TEST( (classify( c ) == symbol{ alphabet_set::basic, i }) );
   }
   for( uint32_t i = 0; i < alphabet::extended_size; ++i ) {
      const char32_t c = character_of( alphabet_set::extended, i );
      BOOST_TEST( (classify( c ) == symbol{ alphabet_set::extended, i }) );
   }

   // total: out of range ordinals wrap instead of failing
   BOOST_TEST( (character_of( alphabet_set::basic, alphabet::basic_size ) == U'a') );
   BOOST_TEST( (character_of( alphabet_set::extended, 3 ) == U'来') );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(radix_switch_test) {
try {
   BOOST_TEST( is_radix_switch( 37 ) );
   for( uint32_t digit = 0; digit < alphabet::escape_digit; ++digit )
      BOOST_TEST( !is_radix_switch( digit ) );

   BOOST_TEST( alphabet::basic_radix == 38u );
   BOOST_TEST( alphabet::extended_radix == 2u );
   BOOST_TEST( alphabet::extended_tail_radix == 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(utf8_test) {
try {
   BOOST_TEST( to_utf8( U'a' ) == "a" );
   BOOST_TEST( to_utf8( U'这' ) == "\xE8\xBF\x99" );
   BOOST_TEST( to_utf8( U'来' ) == "\xE6\x9D\xA5" );
   BOOST_TEST( (from_utf8( "ab\xE8\xBF\x99" ) == U"ab这") );
   BOOST_TEST( to_utf8( from_utf8( "fri来coben" ) ) == "fri来coben" );

   BOOST_CHECK_THROW( from_utf8( "ab\xE8\xBF" ), unknown_character_exception );
   BOOST_CHECK_THROW( from_utf8( "\xFF" ), unknown_character_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(invalid_utf8_location_test) {
try {
   auto invalid_at = []( const std::string& character, uint64_t position, uint64_t offset ) {
      return [=]( const unknown_character_exception& e ) {
         const auto& data = e.get_log().at( 0 ).get_data();
         return data["character"].as_string() == character &&
                data["position"].as_uint64() == position &&
                data["offset"].as_uint64() == offset;
      };
   };

   BOOST_CHECK_EXCEPTION( from_utf8( "\xFF" ), unknown_character_exception, invalid_at( "\\xff", 0, 0 ) );
   BOOST_CHECK_EXCEPTION( from_utf8( "fri\xFF" "ben" ), unknown_character_exception, invalid_at( "\\xff", 3, 3 ) );
   // truncated sequence after a three byte character
   BOOST_CHECK_EXCEPTION( from_utf8( "来\xE6\x9D" "x" ), unknown_character_exception, invalid_at( "\\xe6", 1, 3 ) );
   BOOST_CHECK_EXCEPTION( from_utf8( "ab\xE8\xBF" ), unknown_character_exception, invalid_at( "\\xe8", 2, 2 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(apply_trailing_bias_test) {
try {
   BOOST_TEST( (apply_trailing_bias( U"" ) == U"") );
   BOOST_TEST( (apply_trailing_bias( U"abc" ) == U"abc") );
   BOOST_TEST( (apply_trailing_bias( U"a这" ) == U"a这") );
   BOOST_TEST( (apply_trailing_bias( U"来a" ) == U"来a") );

   // odd runs stand for plain trailing 来
   BOOST_TEST( (apply_trailing_bias( U"a来" ) == U"a来") );
   BOOST_TEST( (apply_trailing_bias( U"a来来" ) == U"a来来来") );
   BOOST_TEST( (apply_trailing_bias( U"来来来" ) == U"来来来来来") );

   // even runs stand for a trailing 这b
   BOOST_TEST( (apply_trailing_bias( U"这b" ) == U"来来") );
   BOOST_TEST( (apply_trailing_bias( U"a这b" ) == U"a来来") );
   BOOST_TEST( (apply_trailing_bias( U"a来这b" ) == U"a来来来来") );
   BOOST_TEST( (apply_trailing_bias( U"a来来这b" ) == U"a来来来来来来") );

   // only the tail is rewritten
   BOOST_TEST( (apply_trailing_bias( U"这ba" ) == U"这ba") );
   BOOST_TEST( (apply_trailing_bias( U"来来a" ) == U"来来a") );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(remove_trailing_bias_test) {
try {
   for( const std::u32string label : { U"", U"abc", U"a来", U"a来来", U"来来来", U"这b", U"a这b",
                                       U"a来这b", U"a来来这b", U"来这b", U"这ba", U"这", U"来" } ) {
      BOOST_TEST( (remove_trailing_bias( apply_trailing_bias( label ) ) == label) );
   }

   BOOST_TEST( (remove_trailing_bias( U"来来" ) == U"这b") );
   BOOST_TEST( (remove_trailing_bias( U"x来来来来" ) == U"x来这b") );
   BOOST_TEST( (remove_trailing_bias( U"x来来来" ) == U"x来来") );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
