#include <score.pool/score.pool.hpp>

#include <algorithm>

namespace scorepool {

   void score_pool::enroll(const name& participant) {
      require_auth(participant);

      auto& state = get_state();
      eosio::check(state.phase == phase_registration, "not in registration phase");

      auto&             rounds = get_round_table();
      auto&             round  = rounds.get(state.current_round, "bug: current round missing");
      round_entry_table entries(get_self(), round.id);
      eosio::check(entries.find(participant.value) == entries.end(), "already registered for this round");

      entries.emplace(participant, [&](auto& entry) {
         entry.participant = participant;
         entry.seq         = round.num_registrants;
      });
      rounds.modify(round, same_payer, [](auto& r) { ++r.num_registrants; });

      pending_round_table pending(get_self(), participant.value);
      pending.emplace(participant, [&](auto& p) { p.round_id = round.id; });

      logenroll_action{ get_self(), { get_self(), active_permission } }.send(round.id, participant);
   }

   void score_pool::startactive() {
      require_admin();

      pool_state_autosave state{ *this };
      eosio::check(state->phase == phase_registration, "not in registration phase");
      set_phase(*state, phase_active);
   }

   void score_pool::setscores(const std::vector<name>& participants, const std::vector<uint64_t>& scores) {
      require_admin();

      pool_state_autosave state{ *this };
      eosio::check(state->phase == phase_active, "not in active phase");
      eosio::check(!participants.empty(), "empty score batch");
      eosio::check(participants.size() == scores.size(), "mismatched vector sizes");

      auto& rounds = get_round_table();
      auto& round  = rounds.get(state->current_round, "bug: current round missing");
      asset pool   = state->funding_mode == funding_carryover ? infer_carryover_pool(*state) : round.reward_pool;

      round_entry_table entries(get_self(), round.id);
      uint64_t          total_score = round.total_score;
      uint32_t          scored      = 0;
      for (size_t i = 0; i < participants.size(); ++i) {
         auto& entry = entries.get(participants[i].value, "participant is not registered for this round");
         auto  score = scores[i];
         eosio::check(score > 0, "score must be positive");

         // a participant listed again in the batch replaces its earlier score
         if (!entry.score)
            ++scored;
         total_score -= entry.score;
         eosio::check(total_score + score > total_score, "total score overflow");
         total_score += score;
         entries.modify(entry, same_payer, [&](auto& e) { e.score = score; });
      }

      rounds.modify(round, same_payer, [&](auto& r) {
         r.total_score = total_score;
         r.reward_pool = pool;
         r.scored      = true;
      });
      state->outstanding += pool;

      logscores_action{ get_self(), { get_self(), active_permission } }.send(round.id, scored, total_score, pool);
      set_phase(*state, phase_distribution);
   } // score_pool::setscores

   void score_pool::startround() {
      require_admin();

      pool_state_autosave state{ *this };
      eosio::check(state->phase == phase_distribution, "not in distribution phase");

      ++state->current_round;
      create_round(state->current_round, state->next_pool);
      state->next_pool.amount = 0;
      lognewround_action{ get_self(), { get_self(), active_permission } }.send(state->current_round);
      set_phase(*state, phase_registration);
   }

   std::vector<name> score_pool::getregs(uint64_t round_id, uint32_t offset, uint32_t limit) {
      auto& round = get_round_table().get(round_id, "round does not exist");

      std::vector<name> result;
      round_entry_table entries(get_self(), round.id);
      auto              idx = entries.get_index<"byseq"_n>();
      limit                 = std::min(limit, max_page_size);
      for (auto it = idx.lower_bound(offset); it != idx.end() && result.size() < limit; ++it)
         result.push_back(it->participant);
      return result;
   }

   round_info score_pool::getround(uint64_t round_id) {
      return get_round_table().get(round_id, "round does not exist");
   }

} // namespace scorepool
