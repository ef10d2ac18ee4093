#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "lobsync/md/Errors.hpp"
#include "lobsync/session/SessionRegistry.hpp"
#include "lobsync/session/StreamSession.hpp"

#include "mocks/FakeStreamTransport.h"
#include "mocks/Frames.h"
#include "mocks/MockSnapshotSource.h"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using ::testing::_;
using ::testing::Invoke;

using namespace lobsync;
using lobsync::test::FakeStreamTransport;
using lobsync::test::MockSnapshotSource;

namespace {
    Decimal D(const char *s) { return parse_decimal_or_throw(s); }

    DepthSnapshot make_snapshot() {
        DepthSnapshot s;
        s.lastUpdateId = 100;
        s.bids = {Level{D("100.0"), D("2")}};
        s.asks = {Level{D("101.0"), D("3")}};
        return s;
    }

    template<typename E>
    bool holds(std::exception_ptr p) {
        if (!p) return false;
        try {
            std::rethrow_exception(p);
        } catch (const E &) {
            return true;
        } catch (const std::exception &) {
            return false;
        }
    }
} // namespace

class StreamSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeStreamTransport>(ioc);
        snapshots = std::make_shared<::testing::StrictMock<MockSnapshotSource> >();
    }

    // Idle sessions and their parked receive handlers reference each other; unwind them.
    void TearDown() override {
        on_deliver = nullptr;
        registry.shutdown();
        drain();
    }

    std::shared_ptr<StreamSession> make_session(const std::string &symbol) {
        SessionConfig cfg;
        cfg.symbol = symbol;
        cfg.kind = infer_market_kind(symbol);
        cfg.depth_limit = 1000;
        cfg.pace = pace;

        auto s = StreamSession::create(ioc, registry, transport, snapshots, cfg,
                                       [this](const nlohmann::json &frame, const PriceLevelBook &book) {
                                           delivered.push_back(frame);
                                           spreads.push_back(book.spread());
                                           if (on_deliver) on_deliver();
                                       });
        s->set_on_terminated([this](const std::string &id, std::exception_ptr err) {
            terminated_ids.push_back(id);
            terminated_error = err;
        });
        return s;
    }

    /// Start through the registry, the way the dispatcher does.
    std::shared_ptr<StreamSession> open_session(const std::string &symbol) {
        auto s = make_session(symbol);
        EXPECT_TRUE(registry.start(s->id(), [s] { s->start(); }));
        drain();
        return s;
    }

    /// Serve the next snapshot request asynchronously, like the REST client does.
    void expect_snapshot(DepthSnapshot snap, SnapshotRequest *seen = nullptr) {
        EXPECT_CALL(*snapshots, async_fetch(_, _))
                .WillOnce(Invoke([this, snap, seen](const SnapshotRequest &req, ISnapshotSource::FetchHandler h) {
                    if (seen) *seen = req;
                    boost::asio::post(ioc, [h = std::move(h), snap] { h(nullptr, snap); });
                }));
    }

    void drain() {
        ioc.restart();
        ioc.poll();
    }

    /// Run the loop, timers included, until `done` holds or the budget runs out.
    template<typename Pred>
    bool run_until(Pred done, std::chrono::milliseconds budget = std::chrono::milliseconds(2000)) {
        const auto deadline = std::chrono::steady_clock::now() + budget;
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            ioc.restart();
            ioc.run_for(std::chrono::milliseconds(5));
        }
        return done();
    }

    boost::asio::io_context ioc;
    SessionRegistry registry{ioc};
    std::shared_ptr<FakeStreamTransport> transport;
    std::shared_ptr<::testing::StrictMock<MockSnapshotSource> > snapshots;

    std::chrono::milliseconds pace{0};
    std::function<void()> on_deliver;

    std::vector<nlohmann::json> delivered;
    std::vector<std::optional<Decimal> > spreads;
    std::vector<std::string> terminated_ids;
    std::exception_ptr terminated_error;
};

TEST_F(StreamSessionTest, ConnectsToSpotEndpointAndOpens) {
    auto s = open_session("BTCUSDT");

    ASSERT_EQ(transport->connects.size(), 1u);
    EXPECT_EQ(transport->connects[0].host, "stream.binance.com");
    EXPECT_EQ(transport->connects[0].target, "/ws/btcusdt@depth");
    EXPECT_EQ(s->state(), StreamSession::State::OPEN);
    EXPECT_TRUE(registry.is_open("depth_btcusdt"));
    EXPECT_TRUE(registry.has_pending("depth_btcusdt")) << "one receive outstanding while idle";
    EXPECT_EQ(transport->receives_armed, 1);
}

TEST_F(StreamSessionTest, FirstDeltaBootstrapsFromSnapshotThenApplies) {
    auto s = open_session("BTCUSDT");
    SnapshotRequest seen;
    expect_snapshot(make_snapshot(), &seen);

    transport->push(test::depth_update("BTCUSDT", 101, 102,
                                       R"([["100.0","0"],["99.5","4"]])",
                                       R"([["101.0","0"],["102.0","1"]])").dump());
    drain();

    EXPECT_EQ(seen.symbol, "BTCUSDT");
    EXPECT_EQ(seen.kind, MarketKind::SPOT);
    EXPECT_EQ(seen.depth_limit, 1000u);

    EXPECT_EQ(s->snapshots_applied(), 1u);
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(s->book().bid_count(), 1u);
    EXPECT_EQ(s->book().ask_count(), 1u);
    EXPECT_EQ(s->book().quantity_at(Side::BID, D("99.5")), D("4"));
    EXPECT_EQ(s->book().quantity_at(Side::ASK, D("102")), D("1"));
    ASSERT_TRUE(spreads[0].has_value());
    EXPECT_EQ(*spreads[0], D("2.5")) << "callback sees the merged book";
}

TEST_F(StreamSessionTest, NoReceiveArmedWhileSnapshotInFlight) {
    auto s = open_session("BTCUSDT");

    ISnapshotSource::FetchHandler parked;
    EXPECT_CALL(*snapshots, async_fetch(_, _))
            .WillOnce(Invoke([&parked](const SnapshotRequest &, ISnapshotSource::FetchHandler h) {
                parked = std::move(h);
            }));

    transport->push(test::depth_update("BTCUSDT", 1, 1, R"([["100.5","1"]])", R"([])").dump());
    transport->push(test::depth_update("BTCUSDT", 2, 2, R"([["100.5","7"]])", R"([])").dump());
    drain();

    EXPECT_EQ(transport->receives_armed, 1);
    EXPECT_FALSE(registry.has_pending("depth_btcusdt"));
    EXPECT_TRUE(delivered.empty());

    parked(nullptr, make_snapshot());
    drain();

    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(delivered[0]["u"], 1);
    EXPECT_EQ(delivered[1]["u"], 2);
    EXPECT_EQ(s->book().quantity_at(Side::BID, D("100.5")), D("7"));
    EXPECT_EQ(transport->overlapping_receives, 0);
}

TEST_F(StreamSessionTest, DeltasApplyInArrivalOrderAndSnapshotIsFetchedOnce) {
    auto s = open_session("BTCUSDT");
    expect_snapshot(make_snapshot());

    transport->push(test::depth_update("BTCUSDT", 1, 1, R"([])", R"([])").dump());
    transport->push(test::depth_update("BTCUSDT", 2, 2, R"([])", R"([["102.0","1"]])").dump());
    transport->push(test::depth_update("BTCUSDT", 3, 3, R"([])", R"([["102.0","0"]])").dump());
    drain();

    EXPECT_EQ(s->snapshots_applied(), 1u);
    EXPECT_EQ(s->frames_delivered(), 3u);
    EXPECT_FALSE(s->book().quantity_at(Side::ASK, D("102")));
    EXPECT_EQ(s->book().best_ask(), D("101"));
    EXPECT_EQ(s->state(), StreamSession::State::OPEN);
}

TEST_F(StreamSessionTest, BookEmptiedOnBothSidesBootstrapsAgain) {
    auto s = open_session("BTCUSDT");

    DepthSnapshot one;
    one.bids = {Level{D("10"), D("1")}};
    EXPECT_CALL(*snapshots, async_fetch(_, _))
            .Times(2)
            .WillRepeatedly(Invoke([this, one](const SnapshotRequest &, ISnapshotSource::FetchHandler h) {
                boost::asio::post(ioc, [h = std::move(h), one] { h(nullptr, one); });
            }));

    transport->push(test::depth_update("BTCUSDT", 1, 1, R"([["10","0"]])", R"([])").dump());
    drain();
    EXPECT_TRUE(s->book().is_empty());

    transport->push(test::depth_update("BTCUSDT", 2, 2, R"([])", R"([])").dump());
    drain();
    EXPECT_EQ(s->snapshots_applied(), 2u);
    EXPECT_EQ(s->book().bid_count(), 1u);
}

TEST_F(StreamSessionTest, NonDepthFramesAreDeliveredWithoutBootstrap) {
    auto s = open_session("BTCUSDT");

    transport->push(R"({"result":null,"id":1})");
    drain();

    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0]["id"], 1);
    EXPECT_EQ(s->snapshots_applied(), 0u);
    EXPECT_TRUE(s->book().is_empty());
}

TEST_F(StreamSessionTest, DerivativeFramesAreUnwrapped) {
    auto s = open_session("BTCUSD_PERP");
    EXPECT_EQ(s->id(), "depth_perp_btcusd_perp");
    ASSERT_EQ(transport->connects.size(), 1u);
    EXPECT_EQ(transport->connects[0].host, "dstream.binance.com");
    EXPECT_EQ(transport->connects[0].target, "/stream?streams=btcusd_perp@depth");

    SnapshotRequest seen;
    expect_snapshot(make_snapshot(), &seen);

    const auto inner = test::depth_update("BTCUSD_PERP", 5, 6, R"([["100.0","5"]])", R"([])");
    transport->push(test::combined("btcusd_perp@depth", inner).dump());
    drain();

    EXPECT_EQ(seen.kind, MarketKind::DERIVATIVE);
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0], inner) << "callback receives the inner payload";
    EXPECT_EQ(s->book().quantity_at(Side::BID, D("100")), D("5"));
}

TEST_F(StreamSessionTest, MalformedFrameTerminatesSession) {
    auto s = open_session("BTCUSDT");

    transport->push("this is not json");
    drain();

    EXPECT_EQ(s->state(), StreamSession::State::CLOSED);
    EXPECT_TRUE(holds<MalformedFrameError>(s->last_error()));
    EXPECT_TRUE(holds<MalformedFrameError>(terminated_error));
    EXPECT_EQ(terminated_ids, std::vector<std::string>{"depth_btcusdt"});
    EXPECT_FALSE(registry.is_open("depth_btcusdt"));
    EXPECT_EQ(transport->closes, 1);
    EXPECT_TRUE(delivered.empty());
}

TEST_F(StreamSessionTest, DepthUpdateForAnotherSymbolIsMalformed) {
    auto s = open_session("BTCUSDT");

    transport->push(test::depth_update("ETHUSDT", 1, 1, R"([])", R"([])").dump());
    drain();

    EXPECT_TRUE(holds<MalformedFrameError>(s->last_error()));
}

TEST_F(StreamSessionTest, ReceiveErrorIsConnectionError) {
    auto s = open_session("BTCUSDT");

    transport->fail(boost::asio::error::connection_reset);
    drain();

    EXPECT_EQ(s->state(), StreamSession::State::CLOSED);
    EXPECT_TRUE(holds<ConnectionError>(s->last_error()));
    EXPECT_FALSE(registry.is_open("depth_btcusdt"));
}

TEST_F(StreamSessionTest, ConnectFailureIsConnectionError) {
    transport->set_connect_error(boost::asio::error::host_not_found);
    auto s = open_session("BTCUSDT");

    EXPECT_EQ(s->state(), StreamSession::State::CLOSED);
    EXPECT_TRUE(holds<ConnectionError>(s->last_error()));
    EXPECT_EQ(transport->receives_armed, 0);
    EXPECT_TRUE(registry.start("depth_btcusdt", [] {})) << "id released after failure";
}

TEST_F(StreamSessionTest, SnapshotFailureSurfacesWithBody) {
    auto s = open_session("BTCUSDT");

    EXPECT_CALL(*snapshots, async_fetch(_, _))
            .WillOnce(Invoke([this](const SnapshotRequest &, ISnapshotSource::FetchHandler h) {
                auto err = std::make_exception_ptr(
                    SnapshotFetchError("HTTP 400", 400, R"({"code":-1121,"msg":"Invalid symbol."})"));
                boost::asio::post(ioc, [h = std::move(h), err] { h(err, DepthSnapshot{}); });
            }));

    transport->push(test::depth_update("BTCUSDT", 1, 1, R"([])", R"([])").dump());
    drain();

    EXPECT_EQ(s->state(), StreamSession::State::CLOSED);
    ASSERT_TRUE(holds<SnapshotFetchError>(s->last_error()));
    try {
        std::rethrow_exception(s->last_error());
    } catch (const SnapshotFetchError &ex) {
        EXPECT_EQ(ex.http_status(), 400);
        EXPECT_NE(ex.body().find("Invalid symbol"), std::string::npos);
    }
    EXPECT_TRUE(delivered.empty());
    EXPECT_TRUE(s->book().is_empty());
}

TEST_F(StreamSessionTest, ShutdownCancelsPendingReceiveWithoutError) {
    auto s = open_session("BTCUSDT");
    ASSERT_TRUE(transport->receive_pending());

    registry.shutdown();
    EXPECT_EQ(transport->cancels, 1);
    drain();

    EXPECT_EQ(s->state(), StreamSession::State::CLOSED);
    EXPECT_FALSE(s->last_error());
    EXPECT_FALSE(terminated_error);
    EXPECT_EQ(terminated_ids.size(), 1u);
    EXPECT_EQ(registry.open_count(), 0u);
    EXPECT_EQ(transport->closes, 1);
}

TEST_F(StreamSessionTest, ShutdownAbortsStalledConnect) {
    transport->hold_connect();
    auto s = open_session("BTCUSDT");
    ASSERT_EQ(s->state(), StreamSession::State::CONNECTING);
    ASSERT_TRUE(transport->connect_pending());

    registry.shutdown();
    EXPECT_FALSE(transport->connect_pending()) << "shutdown closes the transport";
    drain();

    EXPECT_EQ(s->state(), StreamSession::State::CLOSED);
    EXPECT_FALSE(s->last_error());
    EXPECT_EQ(terminated_ids, std::vector<std::string>{"depth_btcusdt"});
    EXPECT_EQ(transport->receives_armed, 0);
}

TEST_F(StreamSessionTest, ShutdownBeforeRunnerAbortsItsConnect) {
    transport->hold_connect();
    auto s = make_session("BTCUSDT");
    ASSERT_TRUE(registry.start(s->id(), [s] { s->start(); }));

    registry.shutdown();
    drain();

    EXPECT_EQ(transport->connects.size(), 1u);
    EXPECT_FALSE(transport->connect_pending());
    EXPECT_EQ(s->state(), StreamSession::State::CLOSED);
    EXPECT_FALSE(s->last_error());
}

TEST_F(StreamSessionTest, ShutdownDuringBootstrapStopsAtNextCheck) {
    auto s = open_session("BTCUSDT");

    ISnapshotSource::FetchHandler parked;
    EXPECT_CALL(*snapshots, async_fetch(_, _))
            .WillOnce(Invoke([&parked](const SnapshotRequest &, ISnapshotSource::FetchHandler h) {
                parked = std::move(h);
            }));
    transport->push(test::depth_update("BTCUSDT", 1, 1, R"([])", R"([])").dump());
    drain();

    registry.shutdown();
    EXPECT_EQ(transport->cancels, 0) << "nothing pending while the snapshot is in flight";

    parked(nullptr, make_snapshot());
    drain();

    EXPECT_EQ(delivered.size(), 1u);
    EXPECT_EQ(s->state(), StreamSession::State::CLOSED);
    EXPECT_FALSE(s->last_error());
    EXPECT_EQ(transport->receives_armed, 1);
}

TEST_F(StreamSessionTest, SecondConnectionForOpenIdIsDiscarded) {
    auto first = open_session("BTCUSDT");
    ASSERT_EQ(first->state(), StreamSession::State::OPEN);

    expect_snapshot(make_snapshot());
    transport->push(test::depth_update("BTCUSDT", 1, 1, R"([["99.0","5"]])", R"([["101.0","4"]])").dump());
    drain();
    ASSERT_EQ(first->snapshots_applied(), 1u);
    const auto bids_before = first->book().bids();
    const auto asks_before = first->book().asks();

    // Bypass the registry's start() guard to model two connects racing for the same id.
    auto second_transport = std::make_shared<FakeStreamTransport>(ioc);
    SessionConfig cfg;
    cfg.symbol = "BTCUSDT";
    cfg.pace = std::chrono::milliseconds(0);
    auto second = StreamSession::create(ioc, registry, second_transport, snapshots, cfg, nullptr);
    second->start();
    drain();

    EXPECT_TRUE(holds<DuplicateSessionError>(second->last_error()));
    EXPECT_EQ(second->state(), StreamSession::State::CLOSED);
    EXPECT_EQ(second_transport->receives_armed, 0);
    EXPECT_TRUE(registry.is_open("depth_btcusdt")) << "the first session keeps its id";
    EXPECT_TRUE(registry.has_pending("depth_btcusdt")) << "and its outstanding receive";
    EXPECT_EQ(first->state(), StreamSession::State::OPEN);
    EXPECT_EQ(first->book().bids(), bids_before);
    EXPECT_EQ(first->book().asks(), asks_before);
    EXPECT_EQ(first->book().quantity_at(Side::BID, D("99")), D("5"));
    EXPECT_EQ(first->book().quantity_at(Side::ASK, D("101")), D("4"));

    // The survivor keeps streaming.
    transport->push(test::depth_update("BTCUSDT", 2, 2, R"([["99.0","0"]])", R"([])").dump());
    drain();
    EXPECT_FALSE(first->book().quantity_at(Side::BID, D("99")));
    EXPECT_EQ(first->frames_delivered(), 2u);
}

TEST_F(StreamSessionTest, PacedDeltasMatchReferenceBook) {
    pace = std::chrono::milliseconds(5);
    auto s = open_session("BTCUSDT");
    expect_snapshot(make_snapshot());

    const std::vector<nlohmann::json> deltas = {
        test::depth_update("BTCUSDT", 1, 1, R"([["100.0","1.5"],["99.0","2"]])", R"([["101.5","1"]])"),
        test::depth_update("BTCUSDT", 2, 3, R"([["99.0","0"]])", R"([["101.0","0"],["102.0","7"]])"),
        test::depth_update("BTCUSDT", 4, 4, R"([["98.25","3"]])", R"([["101.5","0.25"]])"),
        test::depth_update("BTCUSDT", 5, 6, R"([["100.0","0"],["99.5","8"]])", R"([])"),
        test::depth_update("BTCUSDT", 7, 7, R"([["99.0","1"]])", R"([["102.0","0"],["103.0","2"]])"),
        test::depth_update("BTCUSDT", 8, 9, R"([["98.25","0.00000001"]])", R"([["101.5","5"]])"),
    };

    PriceLevelBook reference;
    const DepthSnapshot snap = make_snapshot();
    reference.apply_snapshot(snap.bids, snap.asks);
    for (const auto &d: deltas) {
        const DepthDelta delta = parse_depth_delta(d);
        for (const Level &l: delta.bids) reference.apply_delta(Side::BID, l.price, l.quantity);
        for (const Level &l: delta.asks) reference.apply_delta(Side::ASK, l.price, l.quantity);
    }

    int pending_while_processing = 0;
    on_deliver = [this, &pending_while_processing] {
        if (registry.has_pending("depth_btcusdt")) ++pending_while_processing;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    };

    for (const auto &d: deltas) transport->push(d.dump());
    ASSERT_TRUE(run_until([&] { return s->frames_delivered() == deltas.size(); }));

    ASSERT_EQ(delivered.size(), deltas.size());
    for (std::size_t i = 0; i < deltas.size(); ++i) {
        EXPECT_EQ(delivered[i]["u"], deltas[i]["u"]) << "frame " << i;
    }
    EXPECT_EQ(s->snapshots_applied(), 1u);
    EXPECT_EQ(s->book().bids(), reference.bids());
    EXPECT_EQ(s->book().asks(), reference.asks());
    EXPECT_EQ(pending_while_processing, 0);
    EXPECT_EQ(transport->overlapping_receives, 0);
    EXPECT_EQ(s->state(), StreamSession::State::OPEN);
}

TEST_F(StreamSessionTest, NoReceiveArmedDuringPaceWait) {
    pace = std::chrono::milliseconds(50);
    auto s = open_session("BTCUSDT");

    transport->push(R"({"result":null,"id":1})");
    drain();

    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(transport->receives_armed, 1);
    EXPECT_FALSE(registry.has_pending("depth_btcusdt"));

    ASSERT_TRUE(run_until([this] { return transport->receives_armed == 2; }));
    EXPECT_TRUE(registry.has_pending("depth_btcusdt"));
}

TEST_F(StreamSessionTest, ShutdownDuringPaceWaitClosesCleanly) {
    pace = std::chrono::milliseconds(50);
    auto s = open_session("BTCUSDT");

    transport->push(R"({"result":null,"id":1})");
    drain();
    ASSERT_FALSE(registry.has_pending("depth_btcusdt"));

    registry.shutdown();
    EXPECT_EQ(transport->cancels, 0) << "nothing to cancel while pacing";

    ASSERT_TRUE(run_until([&s] { return s->state() == StreamSession::State::CLOSED; }));
    EXPECT_FALSE(s->last_error());
    EXPECT_FALSE(terminated_error);
    EXPECT_EQ(terminated_ids, std::vector<std::string>{"depth_btcusdt"});
    EXPECT_EQ(transport->receives_armed, 1) << "the loop exits instead of re-arming";
    EXPECT_EQ(transport->closes, 1);
}

TEST_F(StreamSessionTest, CallbackExceptionDoesNotStopTheStream) {
    SessionConfig cfg;
    cfg.symbol = "BTCUSDT";
    cfg.pace = std::chrono::milliseconds(0);
    auto s = StreamSession::create(ioc, registry, transport, snapshots, cfg,
                                   [](const nlohmann::json &, const PriceLevelBook &) {
                                       throw std::runtime_error("consumer failed");
                                   });
    ASSERT_TRUE(registry.start(s->id(), [s] { s->start(); }));
    drain();

    transport->push(R"({"result":null,"id":1})");
    transport->push(R"({"result":null,"id":2})");
    drain();

    EXPECT_EQ(s->frames_delivered(), 2u);
    EXPECT_EQ(s->state(), StreamSession::State::OPEN);
}
