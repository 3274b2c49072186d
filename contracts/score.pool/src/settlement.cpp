#include <eosio.token/eosio.token.hpp>
#include <score.pool/score.pool.hpp>

namespace scorepool {

   asset score_pool::claimable_in(const pool_state& state, uint64_t round_id, const name& participant) {
      asset result{ 0, state.token_symbol };
      auto& rounds = get_round_table();
      auto  round  = rounds.find(round_id);
      if (round == rounds.end())
         return result;

      round_entry_table entries(get_self(), round_id);
      auto              entry = entries.find(participant.value);
      if (entry != entries.end() && !entry->claimed)
         result.amount = compute_share(*round, *entry);
      return result;
   }

   void score_pool::claim(const name& participant) {
      require_auth(participant);

      auto&               rounds = get_round_table();
      pending_round_table pending(get_self(), participant.value);
      name                token_contract;
      asset               total;

      {
         pool_state_autosave state{ *this };
         token_contract = state->token_contract;
         total          = asset{ 0, state->token_symbol };

         for (auto it = pending.begin(); it != pending.end();) {
            auto& round = rounds.get(it->round_id, "bug: pending round missing");
            if (!round.scored) {
               ++it;
               continue;
            }

            round_entry_table entries(get_self(), round.id);
            auto&             entry = entries.get(participant.value, "bug: pending round without entry");
            int64_t           share = entry.claimed ? 0 : compute_share(round, entry);
            if (share > 0) {
               entries.modify(entry, same_payer, [](auto& e) { e.claimed = true; });
               rounds.modify(round, same_payer, [&](auto& r) { r.claimed.amount += share; });
               total.amount += share;
               logclaim_action{ get_self(), { get_self(), active_permission } }.send(
                     participant, round.id, asset{ share, state->token_symbol });
            }
            // scored rounds never change again; drop them from the cursor whether they paid or not
            it = pending.erase(it);
         }

         eosio::check(total.amount > 0, "nothing to claim");
         eosio::check(!state->settling, "claim settlement already in progress");
         eosio::check(total <= state->outstanding, "bug: claim exceeds outstanding allocations");
         state->outstanding -= total;
         state->settling = participant;
      }

      eosio::token::transfer_action transfer_act{ token_contract, { get_self(), active_permission } };
      transfer_act.send(get_self(), participant, total, std::string(claim_memo));
      endclaim_action{ get_self(), { get_self(), active_permission } }.send(participant);
   } // score_pool::claim

   void score_pool::endclaim(const name& participant) {
      require_auth(get_self());

      pool_state_autosave state{ *this };
      eosio::check(state->settling == participant, "bug: settlement guard mismatch");
      state->settling = name{};
   }

   asset score_pool::getclaimable(const name& participant) {
      auto& state = get_state();
      return claimable_in(state, state.current_round, participant);
   }

   asset score_pool::getclaimall(const name& participant) {
      auto&               state = get_state();
      asset               total{ 0, state.token_symbol };
      pending_round_table pending(get_self(), participant.value);
      for (auto& p : pending)
         total += claimable_in(state, p.round_id, participant);
      return total;
   }

   std::vector<uint64_t> score_pool::getunclaimed(const name& participant) {
      auto&                 state = get_state();
      std::vector<uint64_t> result;
      pending_round_table   pending(get_self(), participant.value);
      for (auto& p : pending)
         if (claimable_in(state, p.round_id, participant).amount > 0)
            result.push_back(p.round_id);
      return result;
   }

} // namespace scorepool
