#include <eosio.token/eosio.token.hpp>
#include <score.pool/score.pool.hpp>

namespace scorepool {

   pool_state_singleton& score_pool::get_state_singleton() {
      static std::optional<pool_state_singleton> sing;
      if (!sing)
         sing.emplace(get_self(), get_self().value);
      return *sing;
   }

   pool_state& score_pool::get_state_mutable(bool init_if_not_exist) {
      static std::optional<pool_state> state;
      if (!state) {
         if (init_if_not_exist && !get_state_singleton().exists()) {
            state.emplace();
         } else {
            eosio::check(get_state_singleton().exists(), "score pool not initialized");
            state = get_state_singleton().get();
         }
      }
      return *state;
   }

   const pool_state& score_pool::get_state() { return get_state_mutable(); }

   void score_pool::save_state() { get_state_singleton().set(get_state_mutable(), get_self()); }

   round_table& score_pool::get_round_table() {
      static std::optional<round_table> table;
      if (!table)
         table.emplace(get_self(), get_self().value);
      return *table;
   }

   void score_pool::require_admin() { require_auth(get_state().admin); }

   void score_pool::set_phase(pool_state& state, uint8_t phase) {
      state.phase = phase;
      logphase_action{ get_self(), { get_self(), active_permission } }.send(state.current_round, phase);
   }

   const round_info& score_pool::create_round(uint64_t round_id, const asset& reward_pool) {
      auto& rounds = get_round_table();
      return *rounds.emplace(get_self(), [&](auto& round) {
         round.id          = round_id;
         round.reward_pool = reward_pool;
         round.claimed     = asset{ 0, reward_pool.symbol };
      });
   }

   void score_pool::init(const name& admin, const name& token_contract, const eosio::symbol& token_symbol,
                         uint8_t funding_mode) {
      require_auth(get_self());

      eosio::check(!get_state_singleton().exists(), "score pool already initialized");
      eosio::check(eosio::is_account(admin), "invalid admin");
      eosio::check(eosio::is_account(token_contract), "invalid token contract");
      eosio::check(token_symbol.is_valid(), "invalid symbol");
      eosio::check(funding_mode == funding_direct || funding_mode == funding_carryover, "invalid funding mode");

      pool_state_autosave state{ *this, true };
      state->admin          = admin;
      state->token_contract = token_contract;
      state->token_symbol   = token_symbol;
      state->funding_mode   = funding_mode;
      state->current_round  = first_round;
      state->phase          = phase_registration;
      state->outstanding    = asset{ 0, token_symbol };
      state->next_pool      = asset{ 0, token_symbol };
      create_round(first_round, state->next_pool);

      // fails for a symbol token_contract doesn't know or a precision mismatch
      eosio::token::open_action open_act{ token_contract, { get_self(), active_permission } };
      open_act.send(get_self(), token_symbol, get_self());
      lognewround_action{ get_self(), { get_self(), active_permission } }.send(first_round);
   }

   void score_pool::setadmin(const name& new_admin) {
      require_admin();
      eosio::check(eosio::is_account(new_admin), "invalid admin");

      pool_state_autosave state{ *this };
      state->admin = new_admin;
   }

} // namespace scorepool
