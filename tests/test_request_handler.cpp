#include <gtest/gtest.h>

#include "seathold/service/request_handler.hpp"
#include "../src/db_core/ReservationDatabase.h"
#include "test_support.hpp"

#include <QtCore/QJsonArray>

using namespace std::chrono_literals;
using seathold::RequestHandler;
using seathold_test::ManualClock;

namespace {

class RequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<ReservationDatabase>(":memory:");
        ASSERT_TRUE(db_->initialize());
        handler_ = std::make_unique<RequestHandler>(*db_, config_, clock_.fn());

        auto reply = handler_->handle({{"type", "create_show"}, {"seat_count", 3}, {"name", "Opening"}});
        ASSERT_EQ(reply.body.value("type").toString(), "show_created");
        show_ = reply.body.value("show_id").toString();
    }

    QJsonObject hold(const QString& seat, const QString& name) {
        return handler_->handle({{"type", "hold"}, {"show_id", show_}, {"seat", seat}, {"name", name}}).body;
    }

    ManualClock clock_;
    seathold::ReservationConfig config_;
    std::unique_ptr<ReservationDatabase> db_;
    std::unique_ptr<RequestHandler> handler_;
    QString show_;
};

} // namespace

TEST_F(RequestHandlerTest, ListsShowsAndSeats) {
    auto shows = handler_->handle({{"type", "list_shows"}});
    ASSERT_EQ(shows.body.value("type").toString(), "shows");
    const auto items = shows.body.value("items").toArray();
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items[0].toObject().value("name").toString(), "Opening");

    auto seats = handler_->handle({{"type", "list_seats"}, {"show_id", show_}});
    ASSERT_EQ(seats.body.value("type").toString(), "seats");
    const auto arr = seats.body.value("seats").toArray();
    ASSERT_EQ(arr.size(), 3);
    EXPECT_EQ(arr[0].toObject().value("seat").toString(), "A1");
    EXPECT_EQ(arr[0].toObject().value("status").toString(), "AVAILABLE");
    EXPECT_TRUE(arr[0].toObject().value("hold_expires_at").isNull());
    EXPECT_TRUE(seats.changed_show.isEmpty());
}

TEST_F(RequestHandlerTest, HoldConfirmFlow) {
    auto held = handler_->handle({{"type", "hold"}, {"show_id", show_}, {"seat", "A1"}, {"name", "Ann"}});
    ASSERT_EQ(held.body.value("type").toString(), "hold_ok");
    EXPECT_EQ(held.body.value("hold_seconds").toInt(), 20);
    EXPECT_EQ(held.body.value("seat").toString(), "A1");
    EXPECT_EQ(held.body.value("hold_expires_at").toString(), "2023-11-14T22:13:40.000Z");
    EXPECT_EQ(held.changed_show, show_);
    const auto token = held.body.value("token").toString();
    ASSERT_FALSE(token.isEmpty());

    // the public seat view never exposes the token
    auto update = handler_->seatUpdate(show_);
    EXPECT_EQ(update.value("type").toString(), "seat_update");
    const auto a1 = update.value("seats").toArray()[0].toObject();
    EXPECT_EQ(a1.value("status").toString(), "HELD");
    EXPECT_EQ(a1.value("held_by").toString(), "Ann");
    EXPECT_FALSE(a1.contains("hold_token"));

    clock_.advance(3s);
    auto confirmed = handler_->handle({{"type", "confirm"}, {"token", token}});
    ASSERT_EQ(confirmed.body.value("type").toString(), "confirm_ok");
    EXPECT_EQ(confirmed.body.value("seat").toString(), "A1");
    EXPECT_EQ(confirmed.body.value("booked_by").toString(), "Ann");
    EXPECT_EQ(confirmed.changed_show, show_);

    auto taken = hold("A1", "Ben");
    EXPECT_EQ(taken.value("type").toString(), "rejected");
    EXPECT_EQ(taken.value("op").toString(), "hold");
    EXPECT_EQ(taken.value("reason").toString(), "SeatUnavailable");
    EXPECT_FALSE(taken.value("retryable").toBool());
}

TEST_F(RequestHandlerTest, ExpiredConfirmIsRejected) {
    const auto token = hold("A2", "Cat").value("token").toString();
    clock_.advance(20s);

    auto state = handler_->handle({{"type", "lookup"}, {"token", token}});
    ASSERT_EQ(state.body.value("type").toString(), "hold_state");
    EXPECT_TRUE(state.body.value("found").toBool());
    EXPECT_TRUE(state.body.value("expired").toBool());

    auto reply = handler_->handle({{"type", "confirm"}, {"token", token}});
    EXPECT_EQ(reply.body.value("type").toString(), "rejected");
    EXPECT_EQ(reply.body.value("reason").toString(), "HoldExpired");
    EXPECT_TRUE(reply.changed_show.isEmpty());
}

TEST_F(RequestHandlerTest, ReleaseTwice) {
    const auto token = hold("A3", "Dov").value("token").toString();

    auto first = handler_->handle({{"type", "release"}, {"token", token}});
    EXPECT_EQ(first.body.value("type").toString(), "release_ok");
    EXPECT_EQ(first.body.value("seat").toString(), "A3");
    EXPECT_EQ(first.changed_show, show_);

    auto second = handler_->handle({{"type", "release"}, {"token", token}});
    EXPECT_EQ(second.body.value("type").toString(), "rejected");
    EXPECT_EQ(second.body.value("reason").toString(), "HoldNotFound");
}

TEST_F(RequestHandlerTest, LookupUnknownToken) {
    auto reply = handler_->handle({{"type", "lookup"}, {"token", "nope"}});
    EXPECT_EQ(reply.body.value("type").toString(), "hold_state");
    EXPECT_FALSE(reply.body.value("found").toBool());
    EXPECT_FALSE(reply.body.contains("booking"));
}

TEST_F(RequestHandlerTest, MalformedRequestsGetErrors) {
    EXPECT_EQ(handler_->handle({{"type", "dance"}}).body.value("type").toString(), "error");
    EXPECT_EQ(handler_->handle({{"type", "hold"}, {"show_id", show_}, {"seat", "A1"}}).body.value("type").toString(),
              "error");
    EXPECT_EQ(handler_->handle({{"type", "confirm"}}).body.value("type").toString(), "error");
    EXPECT_EQ(handler_->handle({{"type", "list_seats"}}).body.value("type").toString(), "error");
    EXPECT_EQ(handler_->handle({{"type", "create_show"}, {"seat_count", 0}}).body.value("type").toString(), "error");
    EXPECT_EQ(handler_->handle({{"type", "create_show"}, {"seat_count", 9999}}).body.value("type").toString(),
              "error");
}

TEST(RequestHandlerFailureTest, StoreOutageIsRetryable) {
    seathold_test::FailingStore store;
    seathold::ReservationConfig config;
    RequestHandler handler(store, config);

    auto reply = handler.handle({{"type", "hold"}, {"show_id", "s"}, {"seat", "A1"}, {"name", "Eli"}});
    EXPECT_EQ(reply.body.value("type").toString(), "rejected");
    EXPECT_EQ(reply.body.value("reason").toString(), "StorageFailure");
    EXPECT_TRUE(reply.body.value("retryable").toBool());
}
