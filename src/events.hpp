// notifications carry their data in the action trace, nothing is stored

void crowdfund::loglaunch(uint64_t campaignId, name owner, asset goal, uint64_t deadline) {
	require_auth(_self);
} // void loglaunch

void crowdfund::logcontrib(name contributor, uint64_t campaignId, asset quantity) {
	require_auth(_self);
} // void logcontrib

void crowdfund::logclaim(name claimer, uint64_t campaignId, uint64_t tokenCount) {
	require_auth(_self);
} // void logclaim

void crowdfund::logwithdraw(name to, uint64_t campaignId, asset quantity) {
	require_auth(_self);
} // void logwithdraw

void crowdfund::logcancel(uint64_t campaignId) {
	require_auth(_self);
} // void logcancel

void crowdfund::logrefund(name contributor, uint64_t campaignId, asset quantity) {
	require_auth(_self);
} // void logrefund
