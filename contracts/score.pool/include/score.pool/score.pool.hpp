#pragma once

#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/system.hpp>

#include <optional>
#include <string>
#include <vector>

#include <score.pool/constants.hpp>
#include <score.pool/rounds.hpp>

namespace scorepool {

   using eosio::asset;
   using eosio::name;
   using eosio::same_payer;

   /**
    * Multi-round, score-weighted reward settlement.
    *
    * Each round moves through registration, active and distribution phases. Participants enroll while the
    * round is in registration, the admin loads one batch of scores while it is active (which closes the round
    * and fixes its reward pool), and from then on every participant may withdraw
    * `floor(reward_pool * score / total_score)` of that round at any later time. A single claim settles every
    * round the participant has not settled yet.
    *
    * Round pools are funded in one of two ways, chosen at `init`:
    * - direct: token transfers received while the round is in registration or active add to its pool; those
 *   received during distribution are held for the next round.
    * - carry-over: at scoring time the pool is the contract's token balance minus what earlier rounds
    *   allocated and have not paid out yet.
    */
   class [[eosio::contract("score.pool")]] score_pool : public eosio::contract {
    public:
      using eosio::contract::contract;

      /**
       * One-time configuration. Creates round 1 in registration phase and opens the contract's balance row
       * with `token_contract`, which fails for unknown tokens.
       *
       * @param admin - account allowed to run phases, load scores and withdraw in an emergency
       * @param token_contract - eosio.token compatible contract of the reward token
       * @param token_symbol - symbol and precision of the reward token
       * @param funding_mode - `funding_direct` or `funding_carryover`
       */
      [[eosio::action]] void init(const name& admin, const name& token_contract, const eosio::symbol& token_symbol,
                                  uint8_t funding_mode);

      // Hand the admin capability to another account
      [[eosio::action]] void setadmin(const name& new_admin);

      [[eosio::action]] void enroll(const name& participant);

      [[eosio::action]] void startactive();

      /**
       * Load the scores of the current round and move it to distribution. A participant listed twice keeps
       * the last score. In carry-over mode this also fixes the round's pool from the held balance.
       */
      [[eosio::action]] void setscores(const std::vector<name>& participants, const std::vector<uint64_t>& scores);

      [[eosio::action]] void startround();

      /**
       * Pay out every unclaimed share of `participant` in one transfer. All claim flags are written before the
       * transfer is sent; `endclaim` runs after it and releases the settlement guard.
       */
      [[eosio::action]] void claim(const name& participant);

      [[eosio::action]] void endclaim(const name& participant);

      // Move held funds out without touching round accounting
      [[eosio::action]] void emergencywd(const name& recipient, const asset& quantity);

      [[eosio::on_notify("*::transfer")]] void on_transfer(const name& from, const name& to, const asset& quantity,
                                                           const std::string& memo);

      // Read-only; results are returned as action return values
      [[eosio::action]] asset                 getclaimable(const name& participant);
      [[eosio::action]] asset                 getclaimall(const name& participant);
      [[eosio::action]] std::vector<uint64_t> getunclaimed(const name& participant);
      [[eosio::action]] std::vector<name>     getregs(uint64_t round_id, uint32_t offset, uint32_t limit);
      [[eosio::action]] round_info            getround(uint64_t round_id);

      // Events for indexers; never read back by the contract
      [[eosio::action]] void logenroll(uint64_t round_id, const name& participant) { require_auth(get_self()); }

      [[eosio::action]] void logscores(uint64_t round_id, uint32_t participant_count, uint64_t total_score,
                                       const asset& reward_pool) {
         require_auth(get_self());
      }

      [[eosio::action]] void logclaim(const name& participant, uint64_t round_id, const asset& quantity) {
         require_auth(get_self());
      }

      [[eosio::action]] void logphase(uint64_t round_id, uint8_t phase) { require_auth(get_self()); }

      [[eosio::action]] void lognewround(uint64_t round_id) { require_auth(get_self()); }

      [[eosio::action]] void logdeposit(uint64_t round_id, const name& from, const asset& quantity) {
         require_auth(get_self());
      }

      using endclaim_action    = eosio::action_wrapper<"endclaim"_n, &score_pool::endclaim>;
      using logenroll_action   = eosio::action_wrapper<"logenroll"_n, &score_pool::logenroll>;
      using logscores_action   = eosio::action_wrapper<"logscores"_n, &score_pool::logscores>;
      using logclaim_action    = eosio::action_wrapper<"logclaim"_n, &score_pool::logclaim>;
      using logphase_action    = eosio::action_wrapper<"logphase"_n, &score_pool::logphase>;
      using lognewround_action = eosio::action_wrapper<"lognewround"_n, &score_pool::lognewround>;
      using logdeposit_action  = eosio::action_wrapper<"logdeposit"_n, &score_pool::logdeposit>;

    private:
      friend struct pool_state_autosave;

      pool_state_singleton& get_state_singleton();
      pool_state&           get_state_mutable(bool init_if_not_exist = false);
      const pool_state&     get_state();
      void                  save_state();

      round_table& get_round_table();

      void require_admin();
      void set_phase(pool_state& state, uint8_t phase);

      asset held_balance(const pool_state& state);
      asset infer_carryover_pool(const pool_state& state);
      void  deposit(pool_state& state, const name& from, const asset& quantity);

      const round_info& create_round(uint64_t round_id, const asset& reward_pool);
      asset             claimable_in(const pool_state& state, uint64_t round_id, const name& participant);
   };

   // Loads the pool state on construction and writes it back when the scope ends
   struct pool_state_autosave {
      score_pool& contract;
      pool_state& state;

      explicit pool_state_autosave(score_pool& contract, bool init_if_not_exist = false)
          : contract{ contract }, state{ contract.get_state_mutable(init_if_not_exist) } {}
      ~pool_state_autosave() { contract.save_state(); }

      pool_state* operator->() { return &state; }
      pool_state& operator*() { return state; }
   };

} // namespace scorepool
