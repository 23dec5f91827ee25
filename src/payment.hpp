// Balances are settled in the tables before the inline transfer is sent.
// A transfer that fails reverts the whole transaction with them.

void crowdfund::withdraw(name owner, uint64_t campaignId, name to, asset quantity) {
	_assertPaused();
	require_auth(owner);

	// fetch campaign
	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), err::NOT_FOUND, "campaign does not exist");

	_assertOwner(*campaignItem, owner);
	_assertStatus(*campaignItem, Status::completed, "campaign funds can not be withdrawn");

	CHECKC(quantity.symbol == EOS_SYMBOL, err::INVALID_AMOUNT, "only EOS can be withdrawn");
	CHECKC(quantity.amount > 0, err::INVALID_AMOUNT, "only positive quantity allowed");
	CHECKC(quantity <= campaignItem->currentFunds, err::INVALID_AMOUNT, "not enough funds to withdraw");
	_assertRecipient(to);

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.currentFunds -= quantity;
	});

	_transfer(to, quantity, "Crowdfund: Withdrawal");
	_log("logwithdraw"_n, to, campaignId, quantity);

} // void crowdfund::withdraw

void crowdfund::refund(name contributor, uint64_t campaignId, name to) {
	_assertPaused();
	require_auth(contributor);

	// fetch campaign
	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), err::NOT_FOUND, "campaign does not exist");

	auto status = _status(*campaignItem);
	CHECKC(status == Status::expired || status == Status::cancelled,
		err::INVALID_STATE, "campaign can not be refunded");

	contributions_i contributions(_self, campaignId);
	auto contributionItem = contributions.find(contributor.value);
	CHECKC(contributionItem != contributions.end() && contributionItem->amountContributed.amount > 0,
		err::INVALID_STATE, "nothing to refund");

	_assertRecipient(to);

	// refund is all or nothing
	auto quantity = contributionItem->amountContributed;

	contributions.modify(contributionItem, same_payer, [&](auto& r) {
		r.amountContributed.amount = 0;
	});

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.currentFunds -= quantity;
	});

	_transfer(to, quantity, "Crowdfund: Refund");
	_log("logrefund"_n, contributor, campaignId, quantity);

} // void crowdfund::refund
