void crowdfund::newcampaign(name owner, asset goal, string title, symbol_code badgeSymbol) {

	_assertPaused();
	require_auth(owner);

	auto badgeContract = _badgeContract();
	auto now = time_ms();

	CHECKC(goal.symbol.is_valid(), err::INVALID_PARAM, "invalid goal");
	CHECKC(goal.symbol == EOS_SYMBOL, err::INVALID_PARAM, "only EOS can be used to receive contributions");
	CHECKC(goal.is_valid(), err::INVALID_PARAM, "invalid goal");
	CHECKC(goal.amount > 0, err::INVALID_PARAM, "goal should be positive");

	CHECKC(!title.empty(), err::INVALID_PARAM, "title can not be empty");
	CHECKC(title.size() <= MAX_TITLE_LENGTH, err::INVALID_PARAM, "title is too long");
	CHECKC(badgeSymbol.is_valid(), err::INVALID_PARAM, "invalid badge symbol");

	campaigns_i campaigns(_self, _self.value);
	auto campaignId = campaigns.available_primary_key();
	auto deadline = now + CAMPAIGN_DURATION;

	campaigns.emplace(owner, [&](auto& r) {
		r.campaignId = campaignId;
		r.owner = owner;
		r.goal = goal;
		r.title = title;
		r.badgeSymbol = badgeSymbol;
		r.createdTimestamp = now;
		r.deadline = deadline;
		r.cancelled = false;
		r.totalContributed = asset(0, EOS_SYMBOL);
		r.currentFunds = asset(0, EOS_SYMBOL);
		r.nextTokenId = 1;
		r.backersCount = 0;
	});

	// update campaigns count
	information_i information(_self, _self.value);
	information.modify(information.begin(), same_payer, [&](auto& r) {
		r.campaignsCount += 1;
	});

	// badge collection carries the campaign name and symbol
	_createBadges(badgeContract, badgeSymbol, title);

	_log("loglaunch"_n, campaignId, owner, goal, deadline);

} // void crowdfund::newcampaign
