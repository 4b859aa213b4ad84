#pragma once
#include <cstdint>

namespace starkname::test {

   /// Seed for the randomized suites, printed at startup and settable with `-- --seed=N`.
   uint32_t random_seed();

} // starkname::test
