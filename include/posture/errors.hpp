#pragma once
// 错误分类: 请求路径/流式路径统一使用的异常类型

#include <stdexcept>
#include <string>

namespace posture {

class PostureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// malformed or undecodable frame; never mutates a session
class InputDecodeError : public PostureError {
public:
    using PostureError::PostureError;
};

// no live session for the given id (request path only, the stream path auto-creates)
class UnknownSession : public PostureError {
public:
    explicit UnknownSession(const std::string& session_id)
        : PostureError("Session " + session_id + " not found"), session_id_(session_id) {}
    const std::string& sessionId() const { return session_id_; }
private:
    std::string session_id_;
};

// mutation attempted on an ENDED session
class SessionAlreadyEnded : public PostureError {
public:
    explicit SessionAlreadyEnded(const std::string& session_id)
        : PostureError("Session " + session_id + " already ended"), session_id_(session_id) {}
    const std::string& sessionId() const { return session_id_; }
private:
    std::string session_id_;
};

} // namespace posture
