#pragma once
#include <starkname/codec/felt.hpp>

#include <string>
#include <vector>

namespace starkname::resolver {

   using codec::felt;

   struct network_info {
      std::string name;
      felt        chain_id;
      felt        naming_contract;
   };

   /// Networks with a deployed naming contract.
   const std::vector<network_info>& known_networks();

   /// Chain id of a known network by name ("mainnet", "testnet").
   felt chain_id_of( const std::string& network );

   /// Accepts a network name or a chain id in 0x hex, either case of prefix.
   felt parse_chain_id( const std::string& network_or_chain_id );

   /// @throws unsupported_network_exception when no naming contract is deployed on @p chain_id
   felt naming_contract_address( const felt& chain_id );

} // starkname::resolver
