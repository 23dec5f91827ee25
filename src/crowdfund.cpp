// Copyright © Scruge 2019.
// This file is part of Crowdfund.

#include "crowdfund.hpp"
#include "helper.hpp"
#include "transfer.hpp"
#include "newcampaign.hpp"
#include "manage.hpp"
#include "payment.hpp"
#include "claim.hpp"
#include "events.hpp"

// dispatch

extern "C" {

	void apply(uint64_t receiver, uint64_t code, uint64_t action) {

		if (code == receiver) {
			switch (action) {
				EOSIO_DISPATCH_HELPER(crowdfund,
						(init)(pause)(newcampaign)
						(cancel)(withdraw)(refund)
						(claim)(getstatus)
						(loglaunch)(logcontrib)(logclaim)
						(logwithdraw)(logcancel)(logrefund))
			}
		}
		else if (action == "transfer"_n.value && code != receiver) {
			execute_action(name(receiver), name(code), &crowdfund::transfer);
		}
	}
};
