#pragma once
#include <starkname/codec/felt.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace starkname::resolver {

   using codec::felt;

   inline constexpr std::string_view stark_suffix = ".stark";

   /**
    *  Splits "sub.name.stark" (the suffix is optional) into its labels and encodes each,
    *  keeping the written order.
    *
    *  @throws invalid_domain_exception    if the domain or one of its labels is empty
    *  @throws unknown_character_exception from the codec
    */
   std::vector<felt> encode_domain( std::string_view domain );

   /// Decodes and joins labels with '.', appending ".stark". No labels give an empty string.
   std::string decode_domain( const std::vector<felt>& labels );

   std::string with_stark_suffix( std::string_view name );

} // starkname::resolver
