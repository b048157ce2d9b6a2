#include <ws/ws_hub.hpp>

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QDebug>

WsHub::WsHub(seathold::RequestHandler& handler, int push_interval_ms, QObject* parent)
    : QObject(parent),
    handler_(handler),
    server_(QStringLiteral("SeatHold-WS"), QWebSocketServer::NonSecureMode, this)
{
    tick_.setInterval(push_interval_ms);
    connect(&tick_, &QTimer::timeout, this, &WsHub::onTickPush);
}

bool WsHub::start(quint16 port, const QHostAddress& host) {
    if (!server_.listen(host, port)) {
        qWarning() << "[WS] Hub start failed on" << host.toString() << ":" << port
                   << server_.errorString();
        return false;
    }
    connect(&server_, &QWebSocketServer::newConnection, this, &WsHub::onNewConnection);
    if (tick_.interval() > 0) tick_.start();
    qInfo() << "[WS] Listening on" << host.toString() << ":" << server_.serverPort();
    return true;
}

void WsHub::close() {
    tick_.stop();
    for (auto* client : clients_) {
        client->close();
    }
    server_.close();
}

void WsHub::onNewConnection() {
    auto* socket = server_.nextPendingConnection();
    if (!socket) return;

    clients_ << socket;

    connect(socket, &QWebSocket::textMessageReceived, this, [this, socket](const QString& message) {
        onSocketText(socket, message);
    });

    connect(socket, &QWebSocket::disconnected, this, [this, socket] {
        clients_.remove(socket);
        subscriptions_.remove(socket);
        socket->deleteLater();
    });
}

void WsHub::onSocketText(QWebSocket* socket, const QString& message) {
    QJsonParseError error;
    auto document = QJsonDocument::fromJson(message.toUtf8(), &error);

    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qWarning() << "[WS] Invalid JSON received:" << error.errorString();
        reply(socket, seathold::RequestHandler::error("invalid JSON object"));
        return;
    }

    const auto obj = document.object();
    const auto type = obj.value("type").toString();

    if (type == "hello") {
        const auto role = obj.value("role").toString();
        qDebug() << "[WS] Client connected with role:" << role;

        QJsonObject ack;
        ack["type"] = "hello_ack";
        ack["role"] = role;
        ack["status"] = "ok";
        reply(socket, ack);
        return;
    }

    if (type == "subscribe") {
        const auto show_id = obj.value("show_id").toString();
        if (show_id.isEmpty()) {
            reply(socket, seathold::RequestHandler::error("show_id is required"));
            return;
        }
        subscriptions_[socket].insert(show_id);

        QJsonObject ack;
        ack["type"] = "subscribed";
        ack["show_id"] = show_id;
        reply(socket, ack);
        // first snapshot right away so the client need not wait for a tick
        reply(socket, handler_.seatUpdate(show_id));
        return;
    }

    const auto result = handler_.handle(obj);
    reply(socket, result.body);
    if (!result.changed_show.isEmpty()) {
        pushSeatUpdates({result.changed_show});
    }
}

void WsHub::onTickPush() {
    QSet<QString> shows;
    for (auto it = subscriptions_.cbegin(); it != subscriptions_.cend(); ++it) {
        for (const auto& show_id : it.value()) shows.insert(show_id);
    }
    if (shows.isEmpty()) return;

    pushSeatUpdates(shows.values());
}

void WsHub::pushSeatUpdates(const QStringList& show_ids) {
    for (const auto& show_id : show_ids) {
        const auto update = handler_.seatUpdate(show_id);
        broadcast(QString::fromUtf8(QJsonDocument(update).toJson(QJsonDocument::Compact)), show_id);
    }
}

void WsHub::broadcast(const QString& message, const QString& onlyShow) {
    for (auto* client : clients_) {
        if (!onlyShow.isEmpty()) {
            if (!subscriptions_.value(client).contains(onlyShow)) continue;
        }
        client->sendTextMessage(message);
    }
}

void WsHub::reply(QWebSocket* socket, const QJsonObject& body) {
    socket->sendTextMessage(QString::fromUtf8(QJsonDocument(body).toJson(QJsonDocument::Compact)));
}
