#include <starkname/codec/trailing_bias.hpp>
#include <starkname/codec/alphabet.hpp>

namespace starkname::codec {

   namespace {
      constexpr char32_t first_extended = alphabet::extended.front();
      constexpr char32_t last_extended  = alphabet::extended.back();
      constexpr char32_t second_basic   = alphabet::basic[1];

      size_t strip_trailing( std::u32string& label, char32_t c ) {
         size_t count = 0;
         while( !label.empty() && label.back() == c ) {
            label.pop_back();
            ++count;
         }
         return count;
      }
   }

   std::u32string apply_trailing_bias( std::u32string label ) {
      const auto size = label.size();
      const bool ends_with_pair = size >= 2 && label[size - 2] == first_extended && label[size - 1] == second_basic;
      if( ends_with_pair )
         label.resize( size - 2 );

      const size_t k = strip_trailing( label, last_extended );
      if( ends_with_pair )
         label.append( 2 * (k + 1), last_extended );
      else if( k > 0 )
         label.append( 2 * k - 1, last_extended );
      return label;
   }

   std::u32string remove_trailing_bias( std::u32string label ) {
      const size_t k = strip_trailing( label, last_extended );
      if( k == 0 )
         return label;

      if( k % 2 == 0 ) {
         label.append( k / 2 - 1, last_extended );
         label += first_extended;
         label += second_basic;
      } else {
         label.append( (k + 1) / 2, last_extended );
      }
      return label;
   }

} // starkname::codec
