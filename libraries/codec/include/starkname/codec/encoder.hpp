#pragma once
#include <starkname/codec/felt.hpp>

#include <string_view>

namespace starkname::codec {

   /// Every label of up to this many basic characters fits below the field prime.
   inline constexpr size_t max_basic_label_length = 47;

   /**
    *  Encodes a single domain label (no dots, no ".stark" suffix) into a field element.
    *
    *  The label is read as a little-endian number: the first character is the least
    *  significant digit. Basic characters take one base-38 digit. Extended characters
    *  take the escape digit 37 followed by a base-2 digit, or a base-3 digit on the last
    *  position. A final 'a' is written as the escape digit followed by an implied zero,
    *  otherwise "a" and "aa" would both be zero.
    *
    *  The empty label encodes to zero.
    *
    *  @throws unknown_character_exception on the first character outside the alphabet;
    *          the log carries it as "character" together with its "position"
    *  @throws label_too_long_exception    if the value would not be below field_prime()
    */
   felt encode( std::string_view label );

} // starkname::codec
