#include <starkname/resolver/resolver.hpp>
#include <starkname/resolver/domain.hpp>
#include <starkname/resolver/exceptions.hpp>
#include <starkname/resolver/naming_contract.hpp>

#include <fc/log/logger.hpp>

namespace starkname::resolver {

   namespace {
      felt fetch_chain_id( call_provider& provider ) {
         try {
            return provider.chain_id();
         } STARKNAME_RETHROW_EXCEPTIONS( connection_exception, "unable to fetch the chain id" )
      }

      felt select_contract( call_provider& provider, const std::optional<felt>& contract_address ) {
         if( contract_address )
            return *contract_address;
         return naming_contract_address( fetch_chain_id( provider ) );
      }
   }

   name_resolver::name_resolver( call_provider& provider, std::optional<felt> contract_address )
   :_provider( provider )
   ,_contract_address( select_contract( provider, contract_address ) )
   {
      dlog( "resolving stark names with contract ${c}", ("c", codec::to_hex( _contract_address )) );
   }

   std::vector<felt> name_resolver::call( const std::string& entrypoint, std::vector<felt> calldata ) {
      contract_call c{ _contract_address, entrypoint, std::move( calldata ) };
      dlog( "calling ${e} on ${c} with ${n} calldata felts",
            ("e", entrypoint)("c", codec::to_hex( c.contract_address ))("n", c.calldata.size()) );
      try {
         return _provider.call_contract( c );
      } STARKNAME_RETHROW_EXCEPTIONS( connection_exception, "call to ${e} failed", ("e", entrypoint) )
   }

   felt name_resolver::get_address_from_stark_name( std::string_view name ) {
      const std::string domain = with_stark_suffix( name );
      const std::vector<felt> labels = encode_domain( domain );

      std::vector<felt> calldata;
      calldata.reserve( labels.size() + 1 );
      calldata.emplace_back( labels.size() );
      calldata.insert( calldata.end(), labels.begin(), labels.end() );

      const auto result = call( "domain_to_address", std::move( calldata ) );
      STARKNAME_ASSERT( !result.empty(), invalid_contract_result_exception,
                        "domain_to_address returned no address for ${domain}", ("domain", domain) );

      dlog( "${domain} resolves to ${address}", ("domain", domain)("address", codec::to_hex( result.front() )) );
      return result.front();
   }

   std::string name_resolver::get_stark_name( const felt& address ) {
      const auto result = call( "address_to_domain", { address } );
      STARKNAME_ASSERT( !result.empty(), invalid_contract_result_exception,
                        "address_to_domain returned nothing for ${address}", ("address", codec::to_hex( address )) );
      STARKNAME_ASSERT( result.front() == result.size() - 1, invalid_contract_result_exception,
                        "address_to_domain announced ${len} labels but returned ${n}",
                        ("len", codec::to_decimal( result.front() ))("n", result.size() - 1) );

      const std::string domain = decode_domain( std::vector<felt>( result.begin() + 1, result.end() ) );
      STARKNAME_ASSERT( !domain.empty(), name_not_found_exception,
                        "no stark name for ${address}", ("address", codec::to_hex( address )) );

      dlog( "${address} is ${domain}", ("address", codec::to_hex( address ))("domain", domain) );
      return domain;
   }

} // starkname::resolver
