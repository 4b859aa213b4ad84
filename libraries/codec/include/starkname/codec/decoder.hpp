#pragma once
#include <starkname/codec/felt.hpp>

#include <string>

namespace starkname::codec {

   /**
    *  Decodes a field element back into the UTF-8 label it was encoded from.
    *
    *  Total: any value decodes to some string, garbage values to a garbage label.
    *  decode(0) is the empty string.
    */
   std::string decode( const felt& value );

} // starkname::codec
