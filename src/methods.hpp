#pragma once
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>

using namespace eosio;
using namespace std;

#define PRINT(x, y) eosio::print(x); eosio::print(": "); eosio::print(y); eosio::print("\n");
#define PRINT_(x) eosio::print(x); eosio::print("\n");

// failure kinds, reported as "[[code]] message"
enum class err: uint8_t {
	UNAUTHORIZED      = 1,
	INVALID_STATE     = 2,
	INVALID_AMOUNT    = 3,
	NOTHING_TO_CLAIM  = 4,
	TRANSFER_FAILED   = 5,
	INVALID_PARAM     = 6,
	NOT_FOUND         = 7,
	PAUSED            = 8
};

#define CHECKC(exp, code, msg) \
	{ if (!(exp)) eosio_assert(false, (string("[[") + to_string((int)code) + string("]] ") + msg).c_str()); }

// METHODS

bool is_number(const string& s) {
	return !s.empty() && s.find_first_not_of("0123456789") == string::npos;
}

uint64_t time_ms() {
	return current_time() / 1'000;
}
