#include <starkname/resolver/naming_contract.hpp>
#include <starkname/resolver/exceptions.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

namespace starkname::resolver {

   const std::vector<network_info>& known_networks() {
      // chain ids are the ASCII of "SN_MAIN" and "SN_GOERLI"
      static const std::vector<network_info> networks = {
         { "mainnet",
           codec::felt_from_string( "0x534e5f4d41494e" ),
           codec::felt_from_string( "0x6ac597f8116f886fa1c97a23fa4e08299975ecaf6b598873ca6792b9bbfb678" ) },
         { "testnet",
           codec::felt_from_string( "0x534e5f474f45524c49" ),
           codec::felt_from_string( "0x3bab268e932d2cecd1946f100ae67ce3dff9fd234119ea2f6da57d16d29fce" ) }
      };
      return networks;
   }

   felt chain_id_of( const std::string& network ) {
      const auto& networks = known_networks();
      auto itr = std::find_if( networks.begin(), networks.end(),
                               [&]( const network_info& n ) { return n.name == network; } );
      STARKNAME_ASSERT( itr != networks.end(), unsupported_network_exception,
                        "unknown network '${network}'", ("network", network) );
      return itr->chain_id;
   }

   felt parse_chain_id( const std::string& network_or_chain_id ) {
      if( boost::algorithm::istarts_with( network_or_chain_id, "0x" ) )
         return codec::felt_from_string( network_or_chain_id );
      return chain_id_of( network_or_chain_id );
   }

   felt naming_contract_address( const felt& chain_id ) {
      const auto& networks = known_networks();
      auto itr = std::find_if( networks.begin(), networks.end(),
                               [&]( const network_info& n ) { return n.chain_id == chain_id; } );
      STARKNAME_ASSERT( itr != networks.end(), unsupported_network_exception,
                        "no naming contract on chain ${chain_id}", ("chain_id", codec::to_hex( chain_id )) );
      return itr->naming_contract;
   }

} // starkname::resolver
