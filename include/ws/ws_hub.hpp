#pragma once
#include <QObject>
#include <QHash>
#include <QSet>
#include <QHostAddress>
#include <QString>
#include <QUrl>

#include <QtWebSockets/QWebSocketServer>
#include <QtWebSockets/QWebSocket>

#include <memory>

#include "ws/posture_stream.hpp"

class PostureService;

/* WebSocket 入口
*  /ws/posture-stream/<session_id>  -> one PostureStream per connection
*  /ws/posture-api                  -> request/response channel into PostureService
*/
class WsHub : public QObject {
    Q_OBJECT
public:
    WsHub(posture::SessionRegistry& registry,
          posture::SessionStore& store,
          const vision::PostureAnalyzer& analyzer,
          PostureService& service,
          const vision::PostureConfig& cfg,
          QObject* parent = nullptr);
    ~WsHub() override;

    bool start(quint16 port, const QHostAddress& host = QHostAddress::LocalHost);
    quint16 port() const { return server_.serverPort(); }

    int streamCount() const { return static_cast<int>(streams_.size()); }
    int apiClientCount() const { return static_cast<int>(api_clients_.size()); }

    enum class Route { Stream, Api, Unknown };

    // request URL -> endpoint; for Stream, *session_id gets the trailing path
    // segment or the ?session_id= query value (empty if neither is given)
    static Route resolveRoute(const QUrl& url, QString* session_id);

    static const QString kStreamPath;
    static const QString kApiPath;

signals:
    void started();
    void streamClosed(const QString& session_id);

private slots:
    void onNewConnection();

private:
    void onStreamText(QWebSocket* socket, const QString& text);
    void onApiText(QWebSocket* socket, const QString& text);
    void onSocketDisconnected(QWebSocket* socket);

    posture::SessionRegistry&       registry_;
    posture::SessionStore&          store_;
    const vision::PostureAnalyzer&  analyzer_;
    PostureService&                 service_;
    const vision::PostureConfig&    cfg_;

    QWebSocketServer server_;
    QHash<QWebSocket*, std::shared_ptr<PostureStream>> streams_;   // socket -> stream state machine
    QSet<QWebSocket*> api_clients_;
};
