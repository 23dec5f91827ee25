#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>

#include "constants.hpp"
#include "methods.hpp"

using namespace eosio;
using namespace std;

CONTRACT crowdfund : public contract {

public:
	using contract::contract;

	crowdfund(name receiver, name code, datastream<const char*> ds)
		: contract(receiver, code, ds) {}

	void transfer(name from, name to, asset quantity, string memo);

	ACTION init(name badgeContract);
	ACTION pause(bool value);
	ACTION newcampaign(name owner, asset goal, string title, symbol_code badgeSymbol);
	ACTION cancel(name owner, uint64_t campaignId);
	ACTION withdraw(name owner, uint64_t campaignId, name to, asset quantity);
	ACTION refund(name contributor, uint64_t campaignId, name to);
	ACTION claim(name contributor, uint64_t campaignId, name to);
	ACTION getstatus(uint64_t campaignId);

	// notifications for observers, sent inline by the contract to itself
	ACTION loglaunch(uint64_t campaignId, name owner, asset goal, uint64_t deadline);
	ACTION logcontrib(name contributor, uint64_t campaignId, asset quantity);
	ACTION logclaim(name claimer, uint64_t campaignId, uint64_t tokenCount);
	ACTION logwithdraw(name to, uint64_t campaignId, asset quantity);
	ACTION logcancel(uint64_t campaignId);
	ACTION logrefund(name contributor, uint64_t campaignId, asset quantity);

private:

	// derived from the campaign row and block time, never stored
	enum Status: uint8_t { active = 0, cancelled = 1, expired = 2, completed = 3 };

	// structs

	TABLE information {
		uint64_t campaignsCount;
		bool isPaused;
		name badgeContract;

		uint64_t primary_key() const { return 0; }
	};

	TABLE campaigns {
		uint64_t campaignId;
		name owner;
		asset goal;
		string title;
		symbol_code badgeSymbol;
		uint64_t createdTimestamp;
		uint64_t deadline;
		bool cancelled;

		// ever raised, never decreases
		asset totalContributed;

		// held by the contract right now
		asset currentFunds;

		uint64_t nextTokenId;
		uint64_t backersCount;

		uint64_t primary_key() const { return campaignId; }
		uint64_t by_owner() const { return owner.value; }
	};

	TABLE contribution {
		name eosAccount;
		asset amountContributed;
		uint64_t tokensClaimed;

		uint64_t primary_key() const { return eosAccount.value; }
	};

	// tables

	typedef multi_index<"information"_n, information> information_i;

	typedef multi_index<"campaigns"_n, campaigns,
		indexed_by<"byowner"_n, const_mem_fun<campaigns, uint64_t, &campaigns::by_owner>>
			> campaigns_i;

	typedef multi_index<"contribution"_n, contribution> contributions_i;

	// helper methods
	void _transfer(name account, asset quantity, string memo);
	void _createBadges(name badgeContract, symbol_code badgeSymbol, string title);
	void _mint(name badgeContract, name to, symbol_code badgeSymbol, uint64_t tokenId);
	template<typename... T> void _log(name event, T... args);

	Status _status(const campaigns& campaignItem);
	string _statusName(Status status);
	name _badgeContract();

	// guards
	void _assertPaused();
	void _assertOwner(const campaigns& campaignItem, name account);
	void _assertStatus(const campaigns& campaignItem, Status status, string message);
	void _assertRecipient(name to);

}; // CONTRACT crowdfund
