#pragma once
#include <QObject>
#include <QTimer>
#include <QHostAddress>
#include <QSet>
#include <QHash>
#include <QtWebSockets/QWebSocketServer>
#include <QtWebSockets/QWebSocket>

#include <nlohmann/json.hpp>

namespace gatesense { class GateService; }

// JSON-over-WebSocket front of GateService.
// Clients announce themselves with {"type":"hello","role":"scanner"|"admin"};
// scanners may ingest and validate, admins may call everything.
class WsHub : public QObject {
    Q_OBJECT
public:
    WsHub(gatesense::GateService& service, int tick_interval_ms, QObject* parent = nullptr);
    bool start(quint16 port, const QHostAddress& host = QHostAddress::LocalHost);

    // One request/reply exchange, independent of any socket
    nlohmann::json handleRequest(const nlohmann::json& request, const QString& role);

signals:
    void started();

private slots:
    void onNewConnection();
    void onSocketText(QWebSocket* sock, const QString& text);
    void onTick();

private:
    void broadcast(const QString& msg, const QString& onlyRole = QString());
    nlohmann::json makeGateUpdate(const std::string& session_id);

    gatesense::GateService& service_;
    QWebSocketServer server_;
    QSet<QWebSocket*> clients_;
    QHash<QWebSocket*, QString> roles_; // socket -> "admin" / "scanner" / ""
    QTimer tick_;
};
