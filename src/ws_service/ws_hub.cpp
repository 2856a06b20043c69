#include <ws/ws_hub.hpp>
#include <ws/posture_service.hpp>

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>
#include <QUrlQuery>

const QString WsHub::kStreamPath = QStringLiteral("/ws/posture-stream");
const QString WsHub::kApiPath    = QStringLiteral("/ws/posture-api");

WsHub::WsHub(posture::SessionRegistry& registry,
             posture::SessionStore& store,
             const vision::PostureAnalyzer& analyzer,
             PostureService& service,
             const vision::PostureConfig& cfg,
             QObject* parent)
    : QObject(parent),
      registry_(registry),
      store_(store),
      analyzer_(analyzer),
      service_(service),
      cfg_(cfg),
      server_(QString::fromStdString(cfg.server_name), QWebSocketServer::NonSecureMode, this)
{
}

WsHub::~WsHub() {
    // close() may emit disconnected synchronously, which erases from the maps
    QHash<QWebSocket*, std::shared_ptr<PostureStream>> streams;
    streams.swap(streams_);
    QSet<QWebSocket*> api_clients;
    api_clients.swap(api_clients_);

    // finalize every open stream before the sockets go away
    for (auto it = streams.begin(); it != streams.end(); ++it) {
        it.value()->onDisconnected();
        it.key()->close(QWebSocketProtocol::CloseCodeGoingAway, QStringLiteral("Server shutting down"));
    }
    for (QWebSocket* socket : api_clients) {
        socket->close(QWebSocketProtocol::CloseCodeGoingAway, QStringLiteral("Server shutting down"));
    }
}

bool WsHub::start(quint16 port, const QHostAddress& host) {
    if (!server_.listen(host, port)) {
        qWarning() << "[WS] Hub start failed on" << host.toString() << ":" << port << server_.errorString();
        return false;
    }
    connect(&server_, &QWebSocketServer::newConnection, this, &WsHub::onNewConnection);
    qInfo() << "[WS] Hub listening on" << host.toString() << ":" << server_.serverPort();
    emit started();
    return true;
}

WsHub::Route WsHub::resolveRoute(const QUrl& url, QString* session_id) {
    QString path = url.path();
    while (path.endsWith('/') && path.size() > 1) path.chop(1);

    if (path == kStreamPath || path.startsWith(kStreamPath + '/')) {
        // session id: last path segment, or ?session_id=
        QString id = path.mid(kStreamPath.size());
        if (id.startsWith('/')) id.remove(0, 1);
        if (id.isEmpty()) id = QUrlQuery(url).queryItemValue(QStringLiteral("session_id"));
        if (session_id) *session_id = id;
        return Route::Stream;
    }
    if (path == kApiPath) return Route::Api;
    return Route::Unknown;
}

void WsHub::onNewConnection() {
    auto* socket = server_.nextPendingConnection();
    if (!socket) return;

    QString session_id;
    const Route route = resolveRoute(socket->requestUrl(), &session_id);

    if (route == Route::Stream) {
        auto stream = std::make_shared<PostureStream>(registry_, store_, analyzer_, cfg_);
        stream->open(session_id);
        streams_.insert(socket, stream);
        qInfo() << "[WS] stream opened, active streams =" << streamCount();

        connect(socket, &QWebSocket::textMessageReceived, this, [this, socket](const QString& message) {
            onStreamText(socket, message);
        });
    } else if (route == Route::Api) {
        api_clients_ << socket;
        connect(socket, &QWebSocket::textMessageReceived, this, [this, socket](const QString& message) {
            onApiText(socket, message);
        });
        qDebug() << "[WS] api client connected from" << socket->peerAddress().toString()
                 << ", api clients =" << apiClientCount();
    } else {
        qWarning() << "[WS] rejecting connection to unknown path" << socket->requestUrl().path();
        socket->close(QWebSocketProtocol::CloseCodePolicyViolated, QStringLiteral("Unknown path"));
        socket->deleteLater();
        return;
    }

    // 处理断开连接
    connect(socket, &QWebSocket::disconnected, this, [this, socket] {
        onSocketDisconnected(socket);
    });
}

void WsHub::onStreamText(QWebSocket* socket, const QString& text) {
    auto it = streams_.find(socket);
    if (it == streams_.end()) return;
    std::shared_ptr<PostureStream> stream = it.value();

    const PostureStream::Outcome outcome = stream->handleText(text.toUtf8());
    for (const auto& reply : outcome.replies) {
        socket->sendTextMessage(QString::fromUtf8(reply));
    }
    if (outcome.close_transport) {
        socket->close(QWebSocketProtocol::CloseCodeNormal, QStringLiteral("Session ended"));
    }
}

void WsHub::onApiText(QWebSocket* socket, const QString& text) {
    QJsonParseError error;
    const auto document = QJsonDocument::fromJson(text.toUtf8(), &error);

    QJsonObject reply;
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qWarning() << "[WS] Invalid JSON received:" << error.errorString();
        reply = PostureService::withCode(posture::errorReply(QStringLiteral("Invalid JSON request")), 400);
    } else {
        reply = service_.handleRequest(document.object());
    }
    socket->sendTextMessage(QString::fromUtf8(posture::toCompactJson(reply)));
}

void WsHub::onSocketDisconnected(QWebSocket* socket) {
    auto it = streams_.find(socket);
    if (it != streams_.end()) {
        std::shared_ptr<PostureStream> stream = it.value();
        stream->onDisconnected();       // no-op if end_session already closed it
        emit streamClosed(stream->sessionId());
        streams_.erase(it);
        qInfo() << "[WS] stream closed, active streams =" << streamCount();
    }
    api_clients_.remove(socket);
    socket->deleteLater();
}
