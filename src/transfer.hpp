// Copyright © Scruge 2019.
// This file is part of Crowdfund.

void crowdfund::transfer(name from, name to, asset quantity, string memo) {
	if (to != _self) { return; }

	_assertPaused();
	require_auth(from);

	// check transfer
	auto code = name(get_code());
	CHECKC(code == TOKEN_CONTRACT, err::INVALID_AMOUNT, "you have to use the system EOS token");
	CHECKC(quantity.symbol == EOS_SYMBOL, err::INVALID_AMOUNT, "only EOS can be contributed");
	CHECKC(quantity.is_valid(), err::INVALID_AMOUNT, "invalid quantity");

	CHECKC(memo.size() < 20 && is_number(memo), err::INVALID_PARAM, "memo should be a campaign id");

	auto campaignId = stoull(memo);

	// fetch campaign
	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), err::NOT_FOUND, "campaign does not exist");

	// goal is a soft ceiling: the contribution that crosses it is taken in full,
	// the next one finds the campaign completed
	_assertStatus(*campaignItem, Status::active, "campaign is not accepting contributions");
	CHECKC(quantity.amount >= MIN_CONTRIBUTION, err::INVALID_AMOUNT, "contribution is too small");

	// upsert contribution
	contributions_i contributions(_self, campaignId);
	auto contributionItem = contributions.find(from.value);
	bool isNewBacker = contributionItem == contributions.end();

	if (isNewBacker) {
		contributions.emplace(_self, [&](auto& r) {
			r.eosAccount = from;
			r.amountContributed = quantity;
			r.tokensClaimed = 0;
		});
	}
	else {
		contributions.modify(contributionItem, same_payer, [&](auto& r) {
			r.amountContributed += quantity;
		});
	}

	// update raised in campaigns
	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.totalContributed += quantity;
		r.currentFunds += quantity;
		if (isNewBacker) {
			r.backersCount += 1;
		}
	});

	_log("logcontrib"_n, from, campaignId, quantity);

} // void crowdfund::transfer
