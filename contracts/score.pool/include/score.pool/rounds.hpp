#pragma once

#include <eosio/asset.hpp>
#include <eosio/multi_index.hpp>
#include <eosio/singleton.hpp>

#include <score.pool/constants.hpp>

namespace scorepool {

   using eosio::asset;
   using eosio::name;

   struct [[eosio::table("poolstate"), eosio::contract("score.pool")]] pool_state {
      name          admin;          // the only account allowed to drive phases, scores and withdrawals
      name          token_contract; // eosio.token compatible contract holding the pool's funds
      eosio::symbol token_symbol;
      uint8_t       funding_mode  = funding_direct;
      uint64_t      current_round = first_round;
      uint8_t       phase         = phase_registration;
      asset         outstanding; // allocated to scored rounds and not yet paid out
      name          settling;    // participant whose payout transfer is in flight
      asset         next_pool;   // direct deposits received during distribution, seeds the next round

      EOSLIB_SERIALIZE(pool_state, (admin)(token_contract)(token_symbol)(funding_mode)(current_round)(phase)(
                                         outstanding)(settling)(next_pool))
   };

   typedef eosio::singleton<"poolstate"_n, pool_state> pool_state_singleton;

   struct [[eosio::table, eosio::contract("score.pool")]] round_info {
      uint64_t id;
      uint32_t num_registrants = 0;
      uint64_t total_score     = 0; // sum of non-zero scores
      asset    reward_pool;         // fixed once scored
      asset    claimed;             // paid out of reward_pool so far
      bool     scored = false;

      uint64_t primary_key() const { return id; }

      EOSLIB_SERIALIZE(round_info, (id)(num_registrants)(total_score)(reward_pool)(claimed)(scored))
   };

   typedef eosio::multi_index<"rounds"_n, round_info> round_table;

   // scope: round id
   struct [[eosio::table, eosio::contract("score.pool")]] round_entry {
      name     participant;
      uint32_t seq     = 0; // registration order within the round
      uint64_t score   = 0;
      bool     claimed = false;

      uint64_t primary_key() const { return participant.value; }
      uint64_t by_seq() const { return seq; }

      EOSLIB_SERIALIZE(round_entry, (participant)(seq)(score)(claimed))
   };

   typedef eosio::multi_index<
         "entries"_n, round_entry,
         eosio::indexed_by<"byseq"_n, eosio::const_mem_fun<round_entry, uint64_t, &round_entry::by_seq>>>
         round_entry_table;

   // scope: participant. Rounds the participant entered and has not settled yet.
   struct [[eosio::table, eosio::contract("score.pool")]] pending_round {
      uint64_t round_id;

      uint64_t primary_key() const { return round_id; }

      EOSLIB_SERIALIZE(pending_round, (round_id))
   };

   typedef eosio::multi_index<"pending"_n, pending_round> pending_round_table;

   inline int64_t compute_share(const round_info& round, const round_entry& entry) {
      if (!round.scored || !entry.score || !round.total_score)
         return 0;
      return static_cast<int64_t>((uint128_t(round.reward_pool.amount) * entry.score) / round.total_score);
   }

} // namespace scorepool
