#pragma once

#include <stdint.h>

#include <eosio/name.hpp>

namespace scorepool {
   static constexpr eosio::name active_permission = "active"_n;

   // how round pools are funded
   static constexpr uint8_t funding_direct    = 0; // deposits received while a round is current
   static constexpr uint8_t funding_carryover = 1; // held balance minus unclaimed allocations, at scoring time

   static constexpr uint8_t phase_registration = 0;
   static constexpr uint8_t phase_active       = 1;
   static constexpr uint8_t phase_distribution = 2;

   static constexpr uint64_t first_round   = 1;
   static constexpr uint32_t max_page_size = 500; // getregs rows per call

   static constexpr const char* claim_memo     = "score pool reward";
   static constexpr const char* emergency_memo = "score pool emergency withdrawal";
} // namespace scorepool
