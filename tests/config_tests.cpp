#include "crowdfund_tester.hpp"

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_FIXTURE_TEST_CASE( init_badge_contract, crowdfund_tester ) try {

   auto info = get_info();
   BOOST_REQUIRE_EQUAL( info["badgeContract"].as_string(), "badges" );
   BOOST_REQUIRE_EQUAL( info["campaignsCount"].as_uint64(), 0u );
   BOOST_REQUIRE_EQUAL( info["isPaused"].as_bool(), false );

   BOOST_REQUIRE_EQUAL( error( "missing authority of crowdfund" ), init( N(alice), N(carol) ) );
   BOOST_REQUIRE_EQUAL( failure( err::invalid_param, "badge contract account does not exist" ),
                        init( N(crowdfund), N(nobody) ) );

   // can be replaced while no campaign points to it
   BOOST_REQUIRE_EQUAL( success(), init( N(crowdfund), N(carol) ) );
   BOOST_REQUIRE_EQUAL( get_info()["badgeContract"].as_string(), "carol" );
   BOOST_REQUIRE_EQUAL( success(), init( N(crowdfund), N(badges) ) );

   launch();
   BOOST_REQUIRE_EQUAL( failure( err::invalid_state, "badge contract can not be changed after campaigns were created" ),
                        init( N(crowdfund), N(carol) ) );
   BOOST_REQUIRE_EQUAL( get_info()["badgeContract"].as_string(), "badges" );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( uninitialized_contract, crowdfund_tester ) try {
   create_accounts( { N(crowdfund1) } );
   set_code( N(crowdfund1), contracts::crowdfund_wasm() );
   set_abi( N(crowdfund1), contracts::crowdfund_abi().data() );
   produce_blocks();

   BOOST_REQUIRE_EQUAL( failure( err::invalid_state, "contract is not initialized" ),
                        push_action( N(crowdfund1), N(founder), N(newcampaign), mvo()
                           ("owner", "founder")
                           ("goal", "3.0000 EOS")
                           ("title", "Alpha")
                           ("badgeSymbol", "ALPHA"), abi_ser ) );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( pause_ledger, crowdfund_tester ) try {
   launch();
   BOOST_REQUIRE_EQUAL( success(), contribute( N(alice), 0, eos("1.0000") ) );

   BOOST_REQUIRE_EQUAL( error( "missing authority of crowdfund" ), pause( N(alice), true ) );
   BOOST_REQUIRE_EQUAL( success(), pause( N(crowdfund), true ) );
   BOOST_REQUIRE_EQUAL( get_info()["isPaused"].as_bool(), true );
   BOOST_REQUIRE_EQUAL( failure( err::invalid_state, "contract is already in this state" ),
                        pause( N(crowdfund), true ) );

   BOOST_REQUIRE_EQUAL( failure( err::paused, "contract is paused" ),
                        newcampaign( N(founder), eos("3.0000"), "Beta", "BETA" ) );
   BOOST_REQUIRE_EQUAL( failure( err::paused, "contract is paused" ),
                        contribute( N(bob), 0, eos("1.0000") ) );
   BOOST_REQUIRE_EQUAL( failure( err::paused, "contract is paused" ),
                        claim( N(alice), 0, N(alice) ) );
   BOOST_REQUIRE_EQUAL( failure( err::paused, "contract is paused" ),
                        cancel( N(founder), 0 ) );
   BOOST_REQUIRE_EQUAL( failure( err::paused, "contract is paused" ),
                        refund( N(alice), 0, N(alice) ) );
   BOOST_REQUIRE_EQUAL( failure( err::paused, "contract is paused" ),
                        withdraw( N(founder), 0, N(founder), eos("1.0000") ) );

   // queries keep working
   BOOST_REQUIRE_EQUAL( get_status( 0 ), "active" );

   BOOST_REQUIRE_EQUAL( success(), pause( N(crowdfund), false ) );
   BOOST_REQUIRE_EQUAL( success(), contribute( N(bob), 0, eos("1.0000") ) );
   BOOST_REQUIRE_EQUAL( success(), claim( N(alice), 0, N(alice) ) );
   BOOST_REQUIRE_EQUAL( get_campaign( 0 )["totalContributed"].as<asset>(), eos("2.0000") );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( newcampaign_checks, crowdfund_tester ) try {

   BOOST_REQUIRE_EQUAL( error( "missing authority of founder" ),
                        push_action( N(bob), N(newcampaign), mvo()
                           ("owner", "founder")
                           ("goal", "3.0000 EOS")
                           ("title", "Alpha")
                           ("badgeSymbol", "ALPHA") ) );

   BOOST_REQUIRE_EQUAL( failure( err::invalid_param, "goal should be positive" ),
                        newcampaign( N(founder), eos("0.0000"), "Alpha", "ALPHA" ) );
   BOOST_REQUIRE_EQUAL( failure( err::invalid_param, "only EOS can be used to receive contributions" ),
                        newcampaign( N(founder), asset::from_string("3.0000 TST"), "Alpha", "ALPHA" ) );
   BOOST_REQUIRE_EQUAL( failure( err::invalid_param, "only EOS can be used to receive contributions" ),
                        newcampaign( N(founder), asset::from_string("3.000 EOS"), "Alpha", "ALPHA" ) );

   BOOST_REQUIRE_EQUAL( failure( err::invalid_param, "title can not be empty" ),
                        newcampaign( N(founder), eos("3.0000"), "", "ALPHA" ) );
   BOOST_REQUIRE_EQUAL( failure( err::invalid_param, "title is too long" ),
                        newcampaign( N(founder), eos("3.0000"), string( 65, 'a' ), "ALPHA" ) );

   BOOST_REQUIRE( get_campaign( 0 ).is_null() );
   BOOST_REQUIRE_EQUAL( get_info()["campaignsCount"].as_uint64(), 0u );

   BOOST_REQUIRE_EQUAL( success(), newcampaign( N(founder), eos("3.0000"), string( 64, 'a' ), "ALPHA" ) );
   BOOST_REQUIRE_EQUAL( get_campaign( 0 )["title"].as_string(), string( 64, 'a' ) );

} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
