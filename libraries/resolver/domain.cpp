#include <starkname/resolver/domain.hpp>
#include <starkname/resolver/exceptions.hpp>
#include <starkname/codec/decoder.hpp>
#include <starkname/codec/encoder.hpp>

#include <boost/algorithm/string.hpp>

namespace starkname::resolver {

   std::vector<felt> encode_domain( std::string_view domain ) {
      std::string name( domain );
      if( boost::algorithm::ends_with( name, stark_suffix ) )
         name.resize( name.size() - stark_suffix.size() );

      STARKNAME_ASSERT( !name.empty(), invalid_domain_exception,
                        "domain '${domain}' has no label", ("domain", std::string( domain )) );

      std::vector<std::string> labels;
      boost::algorithm::split( labels, name, []( char c ) { return c == '.'; } );

      std::vector<felt> encoded;
      encoded.reserve( labels.size() );
      for( const auto& label : labels ) {
         STARKNAME_ASSERT( !label.empty(), invalid_domain_exception,
                           "domain '${domain}' contains an empty label", ("domain", std::string( domain )) );
         encoded.push_back( codec::encode( label ) );
      }
      return encoded;
   }

   std::string decode_domain( const std::vector<felt>& labels ) {
      if( labels.empty() )
         return {};

      std::string domain;
      for( size_t i = 0; i < labels.size(); ++i ) {
         if( i > 0 )
            domain += '.';
         domain += codec::decode( labels[i] );
      }
      return domain.append( stark_suffix );
   }

   std::string with_stark_suffix( std::string_view name ) {
      std::string domain( name );
      if( !boost::algorithm::ends_with( domain, stark_suffix ) )
         domain.append( stark_suffix );
      return domain;
   }

} // starkname::resolver
