// Copyright © Scruge 2019.
// This file is part of Crowdfund.

void crowdfund::init(name badgeContract) {
	require_auth(_self);

	CHECKC(is_account(badgeContract), err::INVALID_PARAM, "badge contract account does not exist");

	information_i information(_self, _self.value);
	auto infoItem = information.begin();

	if (information.begin() == information.end()) {
		information.emplace(_self, [&](auto& r) {
			r.campaignsCount = 0;
			r.isPaused = false;
			r.badgeContract = badgeContract;
		});
	}
	else {
		// badge ids are only unique within one badge contract
		CHECKC(infoItem->campaignsCount == 0, err::INVALID_STATE,
			"badge contract can not be changed after campaigns were created");

		information.modify(infoItem, same_payer, [&](auto& r) {
			r.badgeContract = badgeContract;
		});
	}
} // void init

void crowdfund::pause(bool value) {
	require_auth(_self);

	information_i information(_self, _self.value);
	auto infoItem = information.begin();

	if (information.begin() == information.end()) {
		information.emplace(_self, [&](auto& r) {
			r.campaignsCount = 0;
			r.isPaused = value;
			r.badgeContract = name();
		});
	}
	else {
		CHECKC(infoItem->isPaused != value, err::INVALID_STATE, "contract is already in this state");
		information.modify(information.begin(), same_payer, [&](auto& r) {
			r.isPaused = value;
		});
	}
} // void pause

void crowdfund::cancel(name owner, uint64_t campaignId) {
	_assertPaused();
	require_auth(owner);

	// fetch campaign
	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), err::NOT_FOUND, "campaign does not exist");

	_assertOwner(*campaignItem, owner);
	_assertStatus(*campaignItem, Status::active, "campaign can not be cancelled");

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.cancelled = true;
	});

	_log("logcancel"_n, campaignId);

} // void cancel

void crowdfund::getstatus(uint64_t campaignId) {
	campaigns_i campaigns(_self, _self.value);
	const auto& campaignItem = campaigns.get(campaignId, "campaign does not exist");

	PRINT("status", _statusName(_status(campaignItem)).c_str())

} // void getstatus
