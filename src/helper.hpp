void crowdfund::_transfer(name account, asset quantity, string memo) {
	action(
		permission_level{ _self, "active"_n },
		TOKEN_CONTRACT, "transfer"_n,
		make_tuple(_self, account, quantity, memo)
	).send();
} // void _transfer

void crowdfund::_createBadges(name badgeContract, symbol_code badgeSymbol, string title) {
	action(
		permission_level{ _self, "active"_n },
		badgeContract, "create"_n,
		make_tuple(_self, badgeSymbol, title)
	).send();
} // void _createBadges

void crowdfund::_mint(name badgeContract, name to, symbol_code badgeSymbol, uint64_t tokenId) {
	action(
		permission_level{ _self, "active"_n },
		badgeContract, "mint"_n,
		make_tuple(to, badgeSymbol, tokenId)
	).send();
} // void _mint

template<typename... T>
void crowdfund::_log(name event, T... args) {
	action(
		permission_level{ _self, "active"_n },
		_self, event,
		make_tuple(args...)
	).send();
} // void _log

// precedence: cancelled, then goal reached, then deadline passed
crowdfund::Status crowdfund::_status(const campaigns& campaignItem) {
	if (campaignItem.cancelled) {
		return Status::cancelled;
	}
	if (campaignItem.totalContributed >= campaignItem.goal) {
		return Status::completed;
	}
	if (time_ms() >= campaignItem.deadline) {
		return Status::expired;
	}
	return Status::active;
} // Status _status

string crowdfund::_statusName(Status status) {
	switch (status) {
		case Status::active: return "active";
		case Status::cancelled: return "cancelled";
		case Status::expired: return "expired";
		case Status::completed: return "completed";
	}
	return "unknown";
} // string _statusName

name crowdfund::_badgeContract() {
	information_i information(_self, _self.value);
	auto infoItem = information.begin();

	CHECKC(infoItem != information.end() && infoItem->badgeContract != name(),
		err::INVALID_STATE, "contract is not initialized");

	return infoItem->badgeContract;
} // name _badgeContract

void crowdfund::_assertPaused() {
	information_i information(_self, _self.value);
	auto infoItem = information.begin();
	if (information.begin() != information.end()) {
		CHECKC(!infoItem->isPaused, err::PAUSED, "contract is paused");
	}
} // void _assertPaused

void crowdfund::_assertOwner(const campaigns& campaignItem, name account) {
	CHECKC(campaignItem.owner == account, err::UNAUTHORIZED, "only campaign owner can do this");
} // void _assertOwner

void crowdfund::_assertStatus(const campaigns& campaignItem, Status status, string message) {
	CHECKC(_status(campaignItem) == status, err::INVALID_STATE, message);
} // void _assertStatus

void crowdfund::_assertRecipient(name to) {
	CHECKC(to != _self, err::TRANSFER_FAILED, "can not transfer to the campaign contract");
	CHECKC(is_account(to), err::TRANSFER_FAILED, "recipient account does not exist");
} // void _assertRecipient
