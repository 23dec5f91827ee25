#pragma once
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>

const eosio::symbol& EOS_SYMBOL = eosio::symbol{"EOS", 4};

// the only token contributions are accepted in
const eosio::name TOKEN_CONTRACT = eosio::name{"eosio.token"};

const uint64_t SECOND = 1000;
const uint64_t MINUTE = 60 * SECOND;
const uint64_t HOUR = 60 * MINUTE;
const uint64_t DAY = 24 * HOUR;

// funding window, counted from campaign creation
const uint64_t CAMPAIGN_DURATION = 30 * DAY;

// 1.0000 EOS, one badge per whole unit contributed
const int64_t ONE_UNIT = 10'000;

// 0.0100 EOS
const int64_t MIN_CONTRIBUTION = ONE_UNIT / 100;

// campaign title is also the badge collection title
const uint64_t MAX_TITLE_LENGTH = 64;
