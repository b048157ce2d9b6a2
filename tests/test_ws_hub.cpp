#include <gtest/gtest.h>

#include <ws/ws_hub.hpp>
#include "../src/db_core/ReservationDatabase.h"
#include "test_support.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QElapsedTimer>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QThread>
#include <QtCore/QUrl>
#include <QtWebSockets/QWebSocket>

#include <functional>

using seathold_test::ManualClock;

namespace {

bool waitFor(const std::function<bool()>& done, int timeout_ms = 3000) {
    QElapsedTimer waited;
    waited.start();
    while (!done() && waited.elapsed() < timeout_ms) {
        QCoreApplication::processEvents();
        QThread::msleep(2);
    }
    return done();
}

class WsHubTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<ReservationDatabase>(":memory:");
        ASSERT_TRUE(db_->initialize());
        auto created = db_->createShow(2, "Hub", clock_.now());
        ASSERT_TRUE(created.ok());
        show_ = QString::fromStdString(*created.value);

        handler_ = std::make_unique<seathold::RequestHandler>(*db_, config_, clock_.fn());
        // no periodic push, so every message below is a direct consequence of a request
        hub_ = std::make_unique<WsHub>(*handler_, 0);
        ASSERT_TRUE(hub_->start(0));

        QObject::connect(&client_, &QWebSocket::textMessageReceived, [this](const QString& text) {
            received_.push_back(QJsonDocument::fromJson(text.toUtf8()).object());
        });
        client_.open(QUrl(QString("ws://127.0.0.1:%1").arg(hub_->port())));
        ASSERT_TRUE(waitFor([this] { return client_.state() == QAbstractSocket::ConnectedState; }));
    }

    void TearDown() override {
        client_.close();
        hub_->close();
        QCoreApplication::processEvents();
    }

    void send(const QJsonObject& o) {
        client_.sendTextMessage(QString::fromUtf8(QJsonDocument(o).toJson(QJsonDocument::Compact)));
    }

    // First received message of the given type, waiting if needed
    QJsonObject next(const QString& type) {
        QJsonObject found;
        waitFor([&] {
            for (size_t i = 0; i < received_.size(); ++i) {
                if (received_[i].value("type").toString() == type) {
                    found = received_[i];
                    received_.erase(received_.begin() + static_cast<long>(i));
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    ManualClock clock_;
    seathold::ReservationConfig config_;
    std::unique_ptr<ReservationDatabase> db_;
    std::unique_ptr<seathold::RequestHandler> handler_;
    std::unique_ptr<WsHub> hub_;
    QWebSocket client_;
    std::vector<QJsonObject> received_;
    QString show_;
};

} // namespace

TEST_F(WsHubTest, HelloIsAcknowledged) {
    send({{"type", "hello"}, {"role", "customer"}});
    const auto ack = next("hello_ack");
    EXPECT_EQ(ack.value("role").toString(), "customer");
    EXPECT_EQ(hub_->clientCount(), 1);

    send({{"type", "hello"}, {"role", "admin"}});
    EXPECT_EQ(next("hello_ack").value("role").toString(), "admin");
}

TEST_F(WsHubTest, SubscriberSeesHoldPushed) {
    send({{"type", "subscribe"}, {"show_id", show_}});
    EXPECT_EQ(next("subscribed").value("show_id").toString(), show_);
    const auto initial = next("seat_update");
    ASSERT_EQ(initial.value("seats").toArray().size(), 2);
    EXPECT_EQ(initial.value("seats").toArray()[0].toObject().value("status").toString(), "AVAILABLE");

    send({{"type", "hold"}, {"show_id", show_}, {"seat", "A1"}, {"name", "Flo"}});
    const auto held = next("hold_ok");
    EXPECT_FALSE(held.value("token").toString().isEmpty());

    const auto pushed = next("seat_update");
    ASSERT_FALSE(pushed.isEmpty());
    EXPECT_EQ(pushed.value("seats").toArray()[0].toObject().value("status").toString(), "HELD");
}

TEST_F(WsHubTest, PushedReclaimReachesSubscribers) {
    send({{"type", "subscribe"}, {"show_id", show_}});
    next("seat_update");

    ASSERT_TRUE(db_->tryHold(show_.toStdString(), "A2", "Gil", clock_.now()).ok());
    hub_->pushSeatUpdates({show_});
    EXPECT_EQ(next("seat_update").value("seats").toArray()[1].toObject().value("status").toString(), "HELD");
}

TEST_F(WsHubTest, GarbageGetsAnError) {
    client_.sendTextMessage("{{{");
    EXPECT_EQ(next("error").value("message").toString(), "invalid JSON object");
}
