#pragma once
#include <starkname/resolver/call_provider.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace starkname::resolver {

   /**
    *  Resolves stark names against the naming contract through an injected call_provider.
    *  Holds no state besides the provider reference and the contract address.
    */
   class name_resolver {
      public:
         /// Without @p contract_address the naming contract of the provider's chain is used.
         explicit name_resolver( call_provider& provider, std::optional<felt> contract_address = {} );

         /**
          *  "fricoben" and "fricoben.stark" resolve the same; subdomains are passed label by label.
          *
          *  @throws invalid_domain_exception, unknown_character_exception for a bad name
          *  @throws connection_exception when the provider fails
          *  @throws invalid_contract_result_exception when the contract returns nothing
          */
         felt get_address_from_stark_name( std::string_view name );

         /**
          *  @throws name_not_found_exception when the address has no name
          *  @throws invalid_contract_result_exception when the result is not a length-prefixed label list
          *  @throws connection_exception when the provider fails
          */
         std::string get_stark_name( const felt& address );

         const felt& contract_address()const { return _contract_address; }

      private:
         std::vector<felt> call( const std::string& entrypoint, std::vector<felt> calldata );

         call_provider&  _provider;
         felt            _contract_address;
   };

} // starkname::resolver
