// Copyright © Scruge 2019.
// This file is part of Crowdfund.

// One badge per whole ONE_UNIT of cumulative contribution, in any campaign status.
// Entitlement is recorded before any badge is minted, so a claim can never
// issue the same unit twice.
void crowdfund::claim(name contributor, uint64_t campaignId, name to) {
	_assertPaused();
	require_auth(contributor);

	// fetch campaign
	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), err::NOT_FOUND, "campaign does not exist");

	contributions_i contributions(_self, campaignId);
	auto contributionItem = contributions.find(contributor.value);
	CHECKC(contributionItem != contributions.end(), err::NOTHING_TO_CLAIM, "nothing to claim");

	uint64_t entitled = contributionItem->amountContributed.amount / ONE_UNIT;
	CHECKC(entitled > contributionItem->tokensClaimed, err::NOTHING_TO_CLAIM, "nothing to claim");
	CHECKC(is_account(to), err::TRANSFER_FAILED, "recipient account does not exist");

	auto badgeContract = _badgeContract();
	uint64_t owed = entitled - contributionItem->tokensClaimed;
	uint64_t firstTokenId = campaignItem->nextTokenId;

	contributions.modify(contributionItem, same_payer, [&](auto& r) {
		r.tokensClaimed = entitled;
	});

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.nextTokenId += owed;
	});

	_log("logclaim"_n, to, campaignId, owed);

	for (uint64_t tokenId = firstTokenId; tokenId < firstTokenId + owed; tokenId++) {
		_mint(badgeContract, to, campaignItem->badgeSymbol, tokenId);
	}

	PRINT("badges minted", owed)

} // void crowdfund::claim
