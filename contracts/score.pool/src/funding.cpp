#include <eosio.token/eosio.token.hpp>
#include <score.pool/score.pool.hpp>

namespace scorepool {

   asset score_pool::held_balance(const pool_state& state) {
      // init opened the balance row, so it exists even before the first deposit
      return eosio::token::get_balance(state.token_contract, get_self(), state.token_symbol.code());
   }

   // a round with no new funds can't be scored; held must strictly exceed what earlier rounds still owe
   asset score_pool::infer_carryover_pool(const pool_state& state) {
      auto held = held_balance(state);
      eosio::check(held > state.outstanding, "held balance does not exceed unclaimed allocations");
      return held - state.outstanding;
   }

   void score_pool::deposit(pool_state& state, const name& from, const asset& quantity) {
      uint64_t round_id = state.current_round;
      if (state.funding_mode == funding_direct) {
         if (state.phase == phase_distribution) {
            // the current pool is fixed; startround moves this into the next one
            state.next_pool += quantity;
            ++round_id;
         } else {
            auto& rounds = get_round_table();
            rounds.modify(rounds.get(round_id, "bug: current round missing"), same_payer,
                          [&](auto& round) { round.reward_pool += quantity; });
         }
      }
      logdeposit_action{ get_self(), { get_self(), active_permission } }.send(round_id, from, quantity);
   }

   void score_pool::on_transfer(const name& from, const name& to, const asset& quantity, const std::string& memo) {
      if (to != get_self() || from == get_self() || !get_state_singleton().exists())
         return;

      pool_state_autosave state{ *this };
      eosio::check(get_first_receiver() == state->token_contract && quantity.symbol == state->token_symbol,
                   "unsupported token");
      eosio::check(quantity.amount > 0, "deposit must be positive");
      deposit(*state, from, quantity);
   }

   void score_pool::emergencywd(const name& recipient, const asset& quantity) {
      require_admin();

      auto& state = get_state();
      eosio::check(eosio::is_account(recipient) && recipient != get_self(), "invalid recipient");
      eosio::check(quantity.symbol == state.token_symbol, "symbol mismatch");
      eosio::check(quantity.amount > 0, "quantity must be positive");
      eosio::check(quantity <= held_balance(state), "insufficient balance");

      eosio::token::transfer_action transfer_act{ state.token_contract, { get_self(), active_permission } };
      transfer_act.send(get_self(), recipient, quantity, std::string(emergency_memo));
   }

} // namespace scorepool
