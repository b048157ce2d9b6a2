#pragma once
#include <QObject>
#include <QTimer>
#include <QSet>
#include <QHash>
#include <QHostAddress>
#include <QStringList>

#include <QtWebSockets/QWebSocketServer>
#include <QtWebSockets/QWebSocket>

#include "seathold/service/request_handler.hpp"

// WebSocket front of the reservation store: one JSON request per text
// frame, one JSON reply; subscribers of a show get seat_update pushes.
class WsHub : public QObject {
    Q_OBJECT
public:
    explicit WsHub(seathold::RequestHandler& handler, int push_interval_ms = 2000, QObject* parent=nullptr);
    bool start(quint16 port, const QHostAddress& host = QHostAddress::LocalHost);
    void close();

    int clientCount() const { return clients_.size(); }
    quint16 port() const { return server_.serverPort(); }

public slots:
    // Push a fresh snapshot of each show to its subscribers
    void pushSeatUpdates(const QStringList& show_ids);

private slots:
    void onNewConnection();
    void onSocketText(QWebSocket* sock, const QString& text);
    void onTickPush();

private:
    void broadcast(const QString& msg, const QString& onlyShow = QString());
    void reply(QWebSocket* sock, const QJsonObject& body);

    seathold::RequestHandler& handler_;
    QWebSocketServer server_;
    QSet<QWebSocket*> clients_;
    QHash<QWebSocket*, QSet<QString>> subscriptions_;  // socket -> show ids
    QTimer tick_;
};
