#pragma once
#include <QByteArray>
#include <QList>
#include <QString>

#include "posture/net_types.hpp"
#include "posture/session/session_registry.hpp"
#include "posture/session/session_store.hpp"
#include "posture/vision/Config.h"
#include "posture/vision/PostureAnalyzer.h"

/* 单连接流式会话状态机
*  CONNECTING -> STREAMING -> CLOSED
*  transport-agnostic: the hub feeds inbound text and ships the replies; every
*  inbound message is one transition, no session state is touched outside one
*/
class PostureStream {
public:
    enum class State { CONNECTING, STREAMING, CLOSED };

    struct Outcome {
        QList<QByteArray> replies;
        bool close_transport = false;   // server side close after sending replies
    };

    PostureStream(posture::SessionRegistry& registry,
                  posture::SessionStore& store,
                  const vision::PostureAnalyzer& analyzer,
                  const vision::PostureConfig& cfg);
    ~PostureStream();

    PostureStream(const PostureStream&) = delete;
    PostureStream& operator=(const PostureStream&) = delete;

    // CONNECTING -> STREAMING; unknown ids start a session implicitly.
    // Returns true when a new session was created.
    bool open(const QString& session_id);

    Outcome handleText(const QByteArray& text);

    // transport dropped: same finalization as end_session, then CLOSED
    void onDisconnected();

    State state() const { return state_; }
    const QString& sessionId() const { return session_id_; }

private:
    Outcome onFrame(const QByteArray& base64);
    Outcome onEndSession();

    // ends the session if still active and drops it from the registry (once);
    // *ended_here is false when another path ended it first (nothing written here)
    posture::EndReport finalize(bool* ended_here);

    posture::SessionRegistry&       registry_;
    posture::SessionStore&          store_;
    const vision::PostureAnalyzer&  analyzer_;
    const vision::PostureConfig&    cfg_;

    State   state_ = State::CONNECTING;
    QString session_id_;
    posture::SessionRegistry::EntryPtr entry_;
};
