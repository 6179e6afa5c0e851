#include <gatesense/ws/ws_hub.hpp>
#include "gatesense/errors.hpp"
#include "gatesense/pipeline/GateService.h"
#include "gatesense/serialization.hpp"

#include <QDateTime>
#include <QDebug>

#include <stdexcept>

using json = nlohmann::json;
using namespace gatesense;

static std::string nowIso() {
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODate).toStdString();
}

static json errorReply(const std::string& request_type, const std::string& kind, const std::string& message) {
    return json{{"type", "error"}, {"request_type", request_type}, {"error", kind}, {"message", message}};
}

static std::string requireSession(const json& req) {
    auto it = req.find("session_id");
    if (it == req.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument("missing or invalid field: session_id");
    }
    return it->get<std::string>();
}

static int64_t requireId(const json& req, const char* key) {
    auto it = req.find(key);
    if (it == req.end() || !it->is_number_integer()) {
        throw std::invalid_argument(std::string("missing or invalid field: ") + key);
    }
    return it->get<int64_t>();
}

static std::string requireText(const json& req, const char* key) {
    auto it = req.find(key);
    if (it == req.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument(std::string("missing or invalid field: ") + key);
    }
    return it->get<std::string>();
}

WsHub::WsHub(GateService& service, int tick_interval_ms, QObject* parent)
    : QObject(parent),
    service_(service),
    server_(QStringLiteral("GateSense-WS"), QWebSocketServer::NonSecureMode, this)
{
    tick_.setInterval(tick_interval_ms);
    connect(&tick_, &QTimer::timeout, this, &WsHub::onTick);
}

bool WsHub::start(quint16 port, const QHostAddress& host) {
    if (!server_.listen(host, port)) {
        qWarning() << "[WS] Hub start failed on" << host.toString() << ":" << port;
        return false;
    }
    connect(&server_, &QWebSocketServer::newConnection, this, &WsHub::onNewConnection);
    tick_.start();
    qDebug() << "[WS] Listening on" << host.toString() << ":" << port;
    emit started();
    return true;
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
        roles_.remove(socket);
        socket->deleteLater();
    });
}

void WsHub::onSocketText(QWebSocket* socket, const QString& message) {
    json request = json::parse(message.toStdString(), nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        qWarning() << "[WS] Invalid JSON received";
        socket->sendTextMessage(QString::fromStdString(errorReply("", "invalid_json", "message is not a JSON object").dump()));
        return;
    }

    const std::string type = request.value("type", std::string());
    if (type == "hello") {
        const QString role = QString::fromStdString(request.value("role", std::string()));
        roles_[socket] = role;
        qDebug() << "[WS] Client connected with role:" << role;
    }

    json reply = handleRequest(request, roles_.value(socket));
    if (request.contains("request_id")) reply["request_id"] = request["request_id"];
    socket->sendTextMessage(QString::fromStdString(reply.dump()));
}

json WsHub::handleRequest(const json& req, const QString& role) {
    const std::string type = req.value("type", std::string());
    const bool admin = role == "admin";

    try {
        json reply{{"type", type + "_ack"}, {"timestamp", nowIso()}};

        if (type == "hello") {
            reply["role"] = role.toStdString();
            reply["status"] = "ok";
        }
        else if (type == "ingest") {
            reply["result"] = service_.ingest(checkinFromJson(req));
        }
        else if (type == "validate") {
            std::optional<GeoPoint> location;
            if (req.contains("lat") || req.contains("lon")) location = pointFromJson(req);
            reply["result"] = service_.validate(requireSession(req), requireId(req, "gate_id"),
                                                requireText(req, "category"), location);
        }
        else if (!admin) {
            qWarning() << "[WS] Rejected" << QString::fromStdString(type) << "from role" << role;
            return errorReply(type, "forbidden", "operation requires the admin role");
        }
        else if (type == "list_gates") {
            reply["gates"] = service_.listGates(requireSession(req));
        }
        else if (type == "create_gate") {
            reply["gate"] = service_.createManualGate(requireSession(req), requireText(req, "name"), pointFromJson(req));
        }
        else if (type == "rename_gate") {
            reply["gate"] = service_.renameGate(requireId(req, "gate_id"), requireText(req, "name"));
        }
        else if (type == "set_gate_status") {
            GateStatus status;
            if (!parseGateStatus(requireText(req, "status"), status)) throw std::invalid_argument("unknown gate status");
            reply["gate"] = service_.setGateStatus(requireId(req, "gate_id"), status);
        }
        else if (type == "merge_gates") {
            reply["result"] = service_.mergeGates(requireId(req, "source_gate_id"), requireId(req, "target_gate_id"),
                                                  auditFromJson(req));
        }
        else if (type == "unbind_category") {
            service_.unbindCategory(requireId(req, "gate_id"), requireText(req, "category"), req.value("reason", std::string()));
            reply["status"] = "ok";
        }
        else if (type == "reset_binding") {
            service_.resetBinding(requireId(req, "gate_id"), requireText(req, "category"), req.value("reason", std::string()));
            reply["status"] = "ok";
        }
        else if (type == "binding_history") {
            reply["transitions"] = service_.bindingHistory(requireId(req, "gate_id"), requireText(req, "category"));
        }
        else if (type == "list_merges") {
            std::optional<MergeStatus> status = MergeStatus::Pending;
            if (req.contains("status")) {
                const std::string text = requireText(req, "status");
                MergeStatus parsed;
                if (text == "all") status = std::nullopt;
                else if (parseMergeStatus(text, parsed)) status = parsed;
                else throw std::invalid_argument("unknown merge status");
            }
            reply["suggestions"] = service_.listMerges(requireSession(req), status);
        }
        else if (type == "approve_merge") {
            reply["result"] = service_.approveMerge(requireId(req, "suggestion_id"), auditFromJson(req));
        }
        else if (type == "reject_merge") {
            service_.rejectMerge(requireId(req, "suggestion_id"), auditFromJson(req));
            reply["status"] = "ok";
        }
        else if (type == "get_config") {
            reply["config"] = service_.getThresholds(requireSession(req)).toJson();
        }
        else if (type == "set_config") {
            const std::string session = requireSession(req);
            auto it = req.find("config");
            if (it == req.end() || !it->is_object()) throw std::invalid_argument("missing or invalid field: config");
            const auto cfg = AdaptiveThresholdConfig::fromJson(*it, service_.getThresholds(session));
            service_.setThresholds(session, cfg);
            reply["config"] = cfg.toJson();
        }
        else if (type == "run_discovery") {
            reply["result"] = service_.runDiscoveryCycle(requireSession(req), req.value("dry_run", false));
        }
        else if (type == "run_enforcement") {
            reply["result"] = service_.runEnforcementCycle(requireSession(req));
        }
        else if (type == "run_duplicates") {
            reply["result"] = service_.runDuplicateDetection(requireSession(req));
        }
        else if (type == "quality_report") {
            reply["report"] = service_.qualityReport(requireSession(req));
        }
        else if (type == "gate_health") {
            reply["gates"] = service_.gateHealth(requireSession(req));
        }
        else if (type == "system_log") {
            reply["entries"] = service_.systemLog(requireSession(req), req.value("limit", 100));
        }
        else if (type == "deactivate_session") {
            service_.deactivateSession(requireSession(req));
            reply["status"] = "ok";
        }
        else if (type == "activate_session") {
            service_.activateSession(requireSession(req));
            reply["status"] = "ok";
        }
        else {
            qDebug() << "[WS] Received unknown message type:" << QString::fromStdString(type);
            return errorReply(type, "unknown_type", "unknown message type");
        }
        return reply;
    }
    catch (const NotFoundError& e)          { return errorReply(type, "not_found", e.what()); }
    catch (const StaleStateError& e)        { return errorReply(type, "stale_state", e.what()); }
    catch (const ConfigValidationError& e)  { return errorReply(type, "config_invalid", e.what()); }
    catch (const std::invalid_argument& e)  { return errorReply(type, "invalid_request", e.what()); }
    catch (const json::exception& e)        { return errorReply(type, "invalid_request", e.what()); }
    catch (const std::exception& e) {
        qWarning() << "[WS]" << QString::fromStdString(type) << "failed:" << e.what();
        return errorReply(type, "internal", e.what());
    }
}

json WsHub::makeGateUpdate(const std::string& session_id) {
    json update{{"type", "gate_update"}, {"session_id", session_id}, {"timestamp", nowIso()}};
    update["gates"] = service_.gateHealth(session_id);
    update["pending_merges"] = service_.listMerges(session_id).size();
    return update;
}

void WsHub::onTick() {
    service_.scheduleAll();

    bool has_admin = false;
    for (auto* client : clients_) {
        if (roles_.value(client) == "admin") { has_admin = true; break; }
    }
    if (!has_admin) return;

    for (const auto& session_id : service_.activeSessions()) {
        try {
            broadcast(QString::fromStdString(makeGateUpdate(session_id).dump()), QStringLiteral("admin"));
        } catch (const std::exception& e) {
            qWarning() << "[WS] gate_update for" << QString::fromStdString(session_id) << "failed:" << e.what();
        }
    }
}

void WsHub::broadcast(const QString& message, const QString& onlyRole) {
    for (auto* client : clients_) {
        if (!onlyRole.isEmpty()) {
            if (roles_.value(client) != onlyRole) continue;
        }
        client->sendTextMessage(message);
    }
}
