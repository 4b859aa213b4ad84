#pragma once
#include <string>

namespace starkname::codec {

   /**
    *  The extended base stores a final character with one more digit value than an inner one,
    *  so a trailing "这b" and a trailing "来" would land on the same number. Labels are
    *  rewritten before encoding so that no encoded label ends with "这b":
    *
    *  - "..." + k x "来" + "这b" becomes "..." + 2(k+1) x "来"
    *  - "..." + k x "来" (k > 0) becomes "..." + (2k-1) x "来"
    *
    *  An odd run of trailing "来" therefore stands for plain "来" characters and an even run
    *  for a label that ended with "这b".
    */
   std::u32string apply_trailing_bias( std::u32string label );

   /// Inverse of apply_trailing_bias(); accepts any string.
   std::u32string remove_trailing_bias( std::u32string label );

} // starkname::codec
